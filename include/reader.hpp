#pragma once
#include "adapter.hpp"
#include "debouncer.hpp"
#include "inventory.hpp"
#include "paused_op.hpp"
#include "reader_config.hpp"
#include "rfid_msg.hpp"
#include "session.hpp"
#include "tag_monitor.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace uhf {

/** 파라미터 블록 부분 갱신. 지정한 필드만 최신 스냅샷 위에 덮어쓴다. */
struct ConfigUpdate {
	std::optional<uint8_t> power;
	std::optional<uint8_t> antenna;
	std::optional<Region> region;
	std::optional<WorkMode> work_mode;
	std::optional<uint8_t> q_value;
	std::optional<uint8_t> session;
	std::optional<uint8_t> inventory_area;
	std::optional<uint8_t> filter_time;
	std::optional<uint8_t> trigger_time;
	std::optional<uint8_t> buzzer_time;

	bool empty() const {
		return !power && !antenna && !region && !work_mode && !q_value && !session &&
			!inventory_area && !filter_time && !trigger_time && !buzzer_time;
	}
};

/**
* Reader
* - 애플리케이션 진입점. Session + InventoryController + Debouncer + 콜백을 묶는다.
* - 범위 밖 인자는 I/O 전에 VALIDATION_FAILURE.
* - 메모리/잠금/킬/Q 직접 조회는 인벤토리를 일시정지한 상태에서 실행.
* - 검출 콜백은 read_single/read_many/trigger/monitor 경로에서 호출된다 (stream은 제외).
*/
class Reader {
public:
	/** adapter를 넘기면 소유권을 가져간다. nullptr이면 cfg.backend로 생성. */
	explicit Reader(ReaderConfig cfg = ReaderConfig(), Adapter* adapter = nullptr);
	~Reader();

	Reader(const Reader&) = delete;
	Reader& operator=(const Reader&) = delete;

	Status connect();
	void disconnect();
	bool connected() const { return session_.is_open(); }

	// ── 출력/거리
	Status set_power(uint8_t level);
	Status get_power(uint8_t& level);
	Status set_range(int distance_bucket);
	Status set_range(RangePreset preset);

	// ── 리드
	Status read_single(uint32_t timeout_ms, std::optional<TagDetection>& out);
	Status read_until(uint32_t timeout_ms, const TagFilter& pred, std::optional<TagDetection>& out);
	Status read_many(size_t max_count, uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty,
	                 std::vector<TagDetection>& out);
	Status read_strongest(size_t max_count, uint32_t per_poll_timeout_ms, std::optional<TagDetection>& out);
	/** 인벤토리를 멈추지 않는다: 다 쓴 뒤 stop_inventory() 호출 필요 */
	TagStream stream(uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty = 0, size_t max_count = 0);
	Status trigger(std::optional<TagDetection>& out, size_t* flushed = nullptr);
	Status trigger(uint32_t timeout_ms, std::optional<TagDetection>& out, size_t* flushed = nullptr);
	Status stop_inventory();

	template <typename Fn>
	auto with_inventory_paused(Fn&& fn) -> decltype(fn()) {
		return uhf::with_inventory_paused(inv_, std::forward<Fn>(fn));
	}

	// ── 콜백
	int register_callback(DetectionCallback cb); ///< 실패 시 -1
	bool unregister_callback(int id);

	// ── 디바이스 설정
	Status get_config(DeviceParams& out);
	Status update_config(const ConfigUpdate& upd);
	Status get_antenna(uint8_t& mask);
	Status set_antenna(uint8_t mask);
	Status get_q_value(uint8_t& q);
	Status set_q_value(uint8_t q);
	Status optimize_for_single_tag();

	// ── 선택 마스크 (인벤토리 응답 태그 제한)
	Status set_select_mask(uint16_t mask_ptr_bits, uint8_t mask_bits, const bytes& mask);
	Status filter_by_epc_prefix(const bytes& prefix); ///< EPC 시작(32비트)부터 prefix 전체
	Status clear_filter();
	Status device_info(DeviceInfo& out);

	// ── 태그 메모리 (password: 비었으면 00000000, 아니면 4바이트)
	Status read_memory(MemoryBank bank, uint16_t word_ptr, uint8_t word_count, bytes& out,
	                   const bytes& password = bytes());
	Status write_memory(MemoryBank bank, uint16_t word_ptr, const bytes& data, const bytes& password = bytes());
	Status write_epc(const bytes& epc, const bytes& password = bytes());
	Status lock_tag(LockArea area, LockAction action, const bytes& password = bytes());
	Status kill_tag(const bytes& password);

	// ── 부저/릴레이
	Status enable_buzzer(uint8_t duration = UHF_BUZZER_DURATION);
	Status disable_buzzer();
	Status activate_relay(uint8_t time_100ms = 1);
	Status deactivate_relay(uint8_t time_100ms = 0);

	// ── 백그라운드 모니터
	Status start_monitor(DetectionCallback cb = nullptr);
	void stop_monitor();
	TagMonitor* monitor() { return monitor_.get(); }

	InventoryController& inventory() { return inv_; }
	Session& session() { return session_; }
	Adapter* adapter() { return adapter_; }
	Debouncer& debouncer() { return debouncer_; }
	const ReaderConfig& config() const { return cfg_; }
	void set_sleeper(Sleeper s); ///< 재시도 대기(테스트 주입)

private:
	Status command_(uint16_t cmd, const bytes& args, bytes* out, const char* what);
	Status set_power_raw_(uint8_t level);
	void dispatch_(const TagDetection& det);

	ReaderConfig cfg_;
	Adapter* adapter_ = nullptr;
	Session session_;
	Debouncer debouncer_;
	InventoryController inv_;
	Sleeper sleeper_;

	std::mutex cb_mu_;
	std::map<int, DetectionCallback> callbacks_;
	int next_cb_id_ = 0;

	std::unique_ptr<TagMonitor> monitor_;
};

} // namespace uhf
