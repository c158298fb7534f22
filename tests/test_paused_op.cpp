// 인벤토리 일시정지 범위: 상태 복구 / 예외 경로
#include "debug_adapter.hpp"
#include "paused_op.hpp"
#include "session.hpp"
#include "test_util.hpp"
#include <stdexcept>

using namespace uhf;

namespace {

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

} // namespace

TEST(restores_running_after_success) {
    Rig r;
    CHECK(r.inv.start_inventory(3, 7).ok());
    bool was_idle = false;
    bool device_stopped = false;
    int v = with_inventory_paused(r.inv, [&] {
        was_idle = r.inv.state() == InventoryState::Idle;
        device_stopped = !debug::inventory_running(r.a);
        return 42;
    });
    CHECK_EQ(v, 42);
    CHECK(was_idle);
    CHECK(device_stopped);
    CHECK(r.inv.is_running());
    CHECK(debug::inventory_running(r.a));
    std::vector<uint16_t> expect{ UHF_CMD_INVENTORY_START, UHF_CMD_INVENTORY_STOP, UHF_CMD_INVENTORY_START };
    CHECK(debug::call_log(r.a) == expect);
}

TEST(restores_running_after_throw) {
    Rig r;
    CHECK(r.inv.start_inventory().ok());
    bool caught = false;
    try {
        with_inventory_paused(r.inv, []() -> int { throw std::runtime_error("tag not found"); });
    }
    catch (const std::runtime_error&) {
        caught = true;
    }
    CHECK(caught);
    CHECK(r.inv.is_running());
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_START), (size_t)2);
}

TEST(idle_runs_once_without_io) {
    Rig r;
    int calls = 0;
    with_inventory_paused(r.inv, [&] { ++calls; });
    CHECK_EQ(calls, 1);
    CHECK(r.inv.state() == InventoryState::Idle);
    CHECK(debug::call_log(r.a).empty());
}

TEST(stop_failure_still_runs_op) {
    Rig r;
    CHECK(r.inv.start_inventory().ok());
    debug::script_status(r.a, UHF_CMD_INVENTORY_STOP, STAT_CMD_INNER_ERR);
    int calls = 0;
    with_inventory_paused(r.inv, [&] { ++calls; });
    CHECK_EQ(calls, 1);
    // 재시작 시 남은 Running 상태를 정리하고 다시 start
    CHECK(r.inv.is_running());
}

TEST(nested_pause_restores_outer) {
    Rig r;
    CHECK(r.inv.start_inventory().ok());
    with_inventory_paused(r.inv, [&] {
        with_inventory_paused(r.inv, [&] {});
    });
    CHECK(r.inv.is_running());
    CHECK_EQ(debug::call_count(r.a, UHF_CMD_INVENTORY_START), (size_t)2);
}

int main() {
    std::printf("\n=== paused operation tests ===\n\n");
    RUN_TEST(restores_running_after_success);
    RUN_TEST(restores_running_after_throw);
    RUN_TEST(idle_runs_once_without_io);
    RUN_TEST(stop_failure_still_runs_op);
    RUN_TEST(nested_pause_restores_outer);
    return TEST_SUMMARY();
}
