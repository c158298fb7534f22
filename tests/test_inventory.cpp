// 인벤토리 상태 머신 / 리드 패턴 (디버그 어댑터)
#include "debug_adapter.hpp"
#include "inventory.hpp"
#include "session.hpp"
#include "log_sink.hpp"
#include "test_util.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>

using namespace uhf;

namespace {

// 디버그 디바이스에 연결된 세션 + 컨트롤러. 재시도는 1회, 대기 없음.
struct Rig {
    Adapter* a = create_debug_adapter();
    Session s{ a };
    InventoryController inv{ s };

    Rig() {
        Status st = s.connect(Endpoint::serial("dbg0", 115200), 100);
        if (!st.ok()) std::printf("rig connect failed: %s\n", describe(st).c_str());
        inv.set_start_retry(RetryPolicy{ 1, Millis(0), 1.0 }, [](Millis) {});
        debug::reset_calls(a);
    }
    ~Rig() {
        s.disconnect();
        destroy_adapter(a);
    }
};

long long elapsed_ms(TimePoint t0) {
    return (long long)std::chrono::duration_cast<Millis>(Clock::now() - t0).count();
}

} // namespace

TEST(stop_while_idle_is_noop) {
    Rig r;
    CHECK(r.inv.state() == InventoryState::Idle);
    CHECK(r.inv.stop_inventory().ok());
    CHECK(r.inv.stop_inventory().ok());
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_STOP), (size_t)0);
}

TEST(start_while_running_stops_first) {
    Rig r;
    CHECK(r.inv.start_inventory().ok());
    CHECK(r.inv.start_inventory().ok());
    std::vector<uint16_t> expect{ UHF_CMD_INVENTORY_START, UHF_CMD_INVENTORY_STOP, UHF_CMD_INVENTORY_START };
    CHECK(debug::call_log(r.a) == expect);
    CHECK(r.inv.is_running());
    CHECK(r.inv.stop_inventory().ok());
    CHECK(r.inv.state() == InventoryState::Idle);
}

TEST(poll_while_idle_does_no_io) {
    Rig r;
    std::optional<TagDetection> det;
    CHECK(r.inv.poll(100, det).ok());
    CHECK(!det);
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_POLL_TAG), (size_t)0);
}

TEST(closed_session_not_connected) {
    Rig r;
    r.s.disconnect();
    Status st = r.inv.start_inventory();
    CHECK_EQ(st.code, Err::NOT_CONNECTED);
    CHECK(r.inv.state() == InventoryState::Idle);
}

TEST(start_failure_stays_idle) {
    Rig r;
    debug::script_status(r.a, UHF_CMD_INVENTORY_START, STAT_CMD_INNER_ERR);
    Status st = r.inv.start_inventory();
    CHECK_EQ(st.code, Err::COMMAND_FAILURE);
    CHECK_EQ(st.raw, (uint32_t)STAT_CMD_INNER_ERR);
    CHECK(r.inv.state() == InventoryState::Idle);
}

TEST(start_reply_timeout_or_stopped_is_not_retried) {
    for (uint32_t reply : { (uint32_t)STAT_COMM_TIMEOUT, (uint32_t)STAT_CMD_INVENTORY_STOP }) {
        Rig r;
        r.inv.set_start_retry(RetryPolicy{ 3, Millis(0), 1.0 }, [](Millis) {});
        debug::script_status(r.a, UHF_CMD_INVENTORY_START, reply);
        Status st = r.inv.start_with_retry();
        CHECK(st.ok());
        CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_START), (size_t)1);
        CHECK(r.inv.state() == InventoryState::Running);
        CHECK(r.inv.stop_inventory().ok());
    }
}

TEST(stop_fault_keeps_running) {
    Rig r;
    CHECK(r.inv.start_inventory().ok());
    debug::script_status(r.a, UHF_CMD_INVENTORY_STOP, STAT_CMD_INNER_ERR);
    Status st = r.inv.stop_inventory();
    CHECK_EQ(st.code, Err::COMMAND_FAILURE);
    CHECK(r.inv.state() == InventoryState::Running);
    CHECK(r.inv.stop_inventory().ok());
    CHECK(r.inv.state() == InventoryState::Idle);
}

TEST(stop_reporting_already_stopped_is_ok) {
    Rig r;
    CHECK(r.inv.start_inventory().ok());
    debug::script_status(r.a, UHF_CMD_INVENTORY_STOP, STAT_CMD_INVENTORY_STOP);
    CHECK(r.inv.stop_inventory().ok());
    CHECK(r.inv.state() == InventoryState::Idle);
}

TEST(read_single_times_out_and_stops) {
    Rig r;
    std::optional<TagDetection> det;
    TimePoint t0 = Clock::now();
    Status st = r.inv.read_single(150, det);
    long long took = elapsed_ms(t0);
    CHECK(st.ok());
    CHECK(!det);
    CHECK(took >= 140);
    CHECK(took < 1000);

    std::vector<uint16_t> log = debug::call_log(r.a);
    CHECK(!log.empty());
    CHECK_EQ(log.front(), (uint16_t)UHF_CMD_INVENTORY_START);
    CHECK_EQ(log.back(), (uint16_t)UHF_CMD_INVENTORY_STOP);
    CHECK(r.inv.state() == InventoryState::Idle);
    CHECK(!debug::inventory_running(r.a));
}

TEST(tag_arriving_at_deadline_is_accepted) {
    Rig r;
    std::thread late([&] {
        std::this_thread::sleep_for(Millis(85));
        debug::script_tag(r.a, bytes{ 0xAB, 0xCD }, -450);
    });
    std::optional<TagDetection> det;
    Status st = r.inv.read_single(100, det);
    late.join();
    CHECK(st.ok());
    CHECK(det.has_value());
    CHECK_EQ(det->epc_hex, std::string("ABCD"));
    CHECK(r.inv.state() == InventoryState::Idle);
}

TEST(fault_mid_poll_still_stops) {
    Rig r;
    debug::script_status(r.a, UHF_CMD_POLL_TAG, STAT_CMD_INNER_ERR);
    std::optional<TagDetection> det;
    Status st = r.inv.read_single(500, det);
    CHECK_EQ(st.code, Err::COMMAND_FAILURE);
    CHECK_EQ(st.raw, (uint32_t)STAT_CMD_INNER_ERR);
    CHECK(!det);
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_STOP), (size_t)1);
    CHECK(r.inv.state() == InventoryState::Idle);
}

TEST(tag_after_two_timeouts) {
    Rig r;
    debug::script_status(r.a, UHF_CMD_POLL_TAG, STAT_COMM_TIMEOUT);
    debug::script_status(r.a, UHF_CMD_POLL_TAG, STAT_COMM_TIMEOUT);
    debug::script_tag(r.a, bytes{ 0xAB, 0xCD }, -450);

    std::optional<TagDetection> det;
    Status st = r.inv.read_single(2000, det);
    CHECK(st.ok());
    CHECK(det.has_value());
    CHECK_EQ(det->epc_hex, std::string("ABCD"));
    CHECK(det->rssi_dbm == -45.0f);
    CHECK_EQ(det->length, (uint8_t)2);
    CHECK(debug::call_count(r.a, UHF_CMD_POLL_TAG) <= 3);
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_STOP), (size_t)1);
}

TEST(read_until_skips_non_matching) {
    Rig r;
    debug::script_tag(r.a, bytes{ 0x11 }, -600);
    debug::script_tag(r.a, bytes{ 0x22 }, -500);
    std::optional<TagDetection> det;
    Status st = r.inv.read_until(1000, [](const TagDetection& d) { return d.epc_hex == "22"; }, det);
    CHECK(st.ok());
    CHECK(det.has_value());
    CHECK_EQ(det->epc_hex, std::string("22"));
}

TEST(read_many_applies_debounce) {
    Rig r;
    Debouncer deb(Millis(10000));
    r.inv.set_debouncer(&deb);
    debug::script_tag(r.a, bytes{ 0x0A }, -400);
    debug::script_tag(r.a, bytes{ 0x0A }, -410);
    debug::script_tag(r.a, bytes{ 0x0B }, -420);

    std::vector<TagDetection> tags;
    Status st = r.inv.read_many(0, 30, 2, tags);
    CHECK(st.ok());
    CHECK_EQ(tags.size(), (size_t)2);
    CHECK_EQ(tags[0].epc_hex, std::string("0A"));
    CHECK_EQ(tags[1].epc_hex, std::string("0B"));
    CHECK(r.inv.state() == InventoryState::Idle);
    r.inv.set_debouncer(nullptr);
}

TEST(stream_does_not_stop_inventory) {
    Rig r;
    debug::script_tag(r.a, bytes{ 0x01 }, -400);
    debug::script_tag(r.a, bytes{ 0x02 }, -400);

    TagStream ts = r.inv.stream(50, 2);
    size_t n = 0;
    while (!ts.done()) {
        if (ts.next()) ++n;
    }
    CHECK_EQ(n, (size_t)2);
    CHECK(ts.status().ok());
    CHECK_EQ(ts.delivered(), (size_t)2);
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_STOP), (size_t)0);
    CHECK(r.inv.is_running());
    CHECK(r.inv.stop_inventory().ok());
}

TEST(stream_without_empty_limit_keeps_going) {
    Rig r;
    TagStream ts = r.inv.stream(20, 0);
    CHECK(!ts.next());
    CHECK(!ts.done());
    debug::script_tag(r.a, bytes{ 0x33 }, -400);
    auto det = ts.next();
    CHECK(det.has_value());
    CHECK_EQ(det->epc_hex, std::string("33"));
    CHECK(r.inv.stop_inventory().ok());
}

TEST(trigger_drains_buffered_tags) {
    Rig r;
    r.inv.set_profile(TriggerProfile::fast());
    CHECK(r.inv.start_inventory().ok());
    debug::script_tag(r.a, bytes{ 0x01 }, -400);
    debug::script_tag(r.a, bytes{ 0x02 }, -400);
    debug::script_tag(r.a, bytes{ 0x03 }, -400);

    std::thread late([&] {
        std::this_thread::sleep_for(Millis(300));
        debug::script_tag(r.a, bytes{ 0xBE, 0xEF }, -300);
    });

    std::optional<TagDetection> det;
    size_t flushed = 0;
    Status st = r.inv.trigger(3000, det, &flushed);
    late.join();

    CHECK(st.ok());
    CHECK_EQ(flushed, (size_t)3);
    CHECK(det.has_value());
    CHECK_EQ(det->epc_hex, std::string("BEEF"));
    // 유지형: 새로 start 하지 않고 실행 중인 채로 남는다
    CHECK(r.inv.is_running());
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_START), (size_t)1);
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_STOP), (size_t)0);
}

TEST(trigger_restarts_once_on_fault) {
    Rig r;
    TriggerProfile p = TriggerProfile::standard();
    p.flush_window_ms = 0;
    r.inv.set_profile(p);
    debug::script_status(r.a, UHF_CMD_POLL_TAG, STAT_COMM_RD_FAILED);
    debug::script_status(r.a, UHF_CMD_POLL_TAG, STAT_COMM_RD_FAILED);

    std::optional<TagDetection> det;
    Status st = r.inv.trigger(2000, det);
    CHECK_EQ(st.code, Err::COMMAND_FAILURE);
    CHECK_EQ(st.raw, (uint32_t)STAT_COMM_RD_FAILED);
    CHECK(!det);
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_START), (size_t)2);
    CHECK(r.inv.stop_inventory().ok());
}

TEST(trigger_relaxed_stops_after) {
    Rig r;
    TriggerProfile p = TriggerProfile::relaxed();
    p.flush_window_ms = 0;
    r.inv.set_profile(p);
    debug::script_tag(r.a, bytes{ 0x44 }, -400);
    std::optional<TagDetection> det;
    CHECK(r.inv.trigger(1000, det).ok());
    CHECK(det.has_value());
    CHECK(r.inv.state() == InventoryState::Idle);
    CHECK(!debug::inventory_running(r.a));
}

TEST(trigger_without_flush_limit_skips_drain) {
    const std::string path = "uhf_test_inventory_flush.log";
    std::remove(path.c_str());
    LogSink sink;
    CHECK(sink.open(path));
    set_log_sink(&sink);

    Rig r;
    TriggerProfile p = TriggerProfile::fast();
    p.flush_max_count = 0;
    r.inv.set_profile(p);
    CHECK(r.inv.start_inventory().ok());
    debug::script_tag(r.a, bytes{ 0x07 }, -400);

    std::optional<TagDetection> det;
    size_t flushed = 99;
    Status st = r.inv.trigger(500, det, &flushed);
    set_log_sink(nullptr);

    CHECK(st.ok());
    CHECK_EQ(flushed, (size_t)0);
    // 비우기 상한 0: 버퍼에 있던 태그가 그대로 트리거 결과
    CHECK(det.has_value());
    CHECK_EQ(det->epc_hex, std::string("07"));

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    CHECK(text.str().find("flush 상한") == std::string::npos);
    std::remove(path.c_str());
}

TEST(session_close_forces_idle) {
    Rig r;
    r.s.set_before_close([&] { r.inv.on_session_closing(); });
    CHECK(r.inv.start_inventory().ok());
    r.s.disconnect();
    CHECK(r.inv.state() == InventoryState::Idle);
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_STOP), (size_t)1);
}

int main() {
    std::printf("\n=== inventory tests ===\n\n");
    RUN_TEST(stop_while_idle_is_noop);
    RUN_TEST(start_while_running_stops_first);
    RUN_TEST(poll_while_idle_does_no_io);
    RUN_TEST(closed_session_not_connected);
    RUN_TEST(start_failure_stays_idle);
    RUN_TEST(start_reply_timeout_or_stopped_is_not_retried);
    RUN_TEST(stop_fault_keeps_running);
    RUN_TEST(stop_reporting_already_stopped_is_ok);
    RUN_TEST(read_single_times_out_and_stops);
    RUN_TEST(tag_arriving_at_deadline_is_accepted);
    RUN_TEST(fault_mid_poll_still_stops);
    RUN_TEST(tag_after_two_timeouts);
    RUN_TEST(read_until_skips_non_matching);
    RUN_TEST(read_many_applies_debounce);
    RUN_TEST(stream_does_not_stop_inventory);
    RUN_TEST(stream_without_empty_limit_keeps_going);
    RUN_TEST(trigger_drains_buffered_tags);
    RUN_TEST(trigger_restarts_once_on_fault);
    RUN_TEST(trigger_relaxed_stops_after);
    RUN_TEST(trigger_without_flush_limit_skips_drain);
    RUN_TEST(session_close_forces_idle);
    return TEST_SUMMARY();
}
