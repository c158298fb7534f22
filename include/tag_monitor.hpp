#pragma once
#include "common.hpp"
#include "config/app_config.h"
#include "debouncer.hpp"
#include "inventory.hpp"
#include "msg_queue.hpp"
#include <atomic>
#include <condition_variable>
#include <thread>

namespace uhf {

using DetectionCallback = std::function<void(const TagDetection&)>;

struct MonitorConfig {
	uint32_t poll_ms = UHF_MONITOR_POLL_MS;
	uint32_t debounce_ms = UHF_MONITOR_DEBOUNCE_MS;
	uint32_t fault_limit = UHF_MONITOR_FAULT_LIMIT;   ///< 연속 Fault 이 횟수면 인벤토리 재시작
	uint32_t join_timeout_ms = UHF_MONITOR_JOIN_MS;
	size_t queue_capacity = 0;                        ///< 0이면 큐 전달 안 함
	bool stop_on_exit = true;                         ///< 종료 시 인벤토리 정지
};

/**
* TagMonitor
* - 전용 스레드에서 poll 루프. 디바운스 통과분만 콜백/큐로 전달.
* - 취소는 협조적: run 플래그를 매 반복 확인. stop()은 exit 신호를 제한 시간 기다린 뒤 join.
* - 콜백 예외(std::exception)는 기록하고 루프는 계속.
*/
class TagMonitor {
public:
	TagMonitor(InventoryController& inv, MonitorConfig cfg = MonitorConfig());
	~TagMonitor() { stop(); }

	TagMonitor(const TagMonitor&) = delete;
	TagMonitor& operator=(const TagMonitor&) = delete;

	Status start(DetectionCallback cb);
	/** @return 제한 시간 안에 워커가 끝났으면 true */
	bool stop();
	bool running() const { return run_.load(); }

	/** queue_capacity > 0 일 때 소비 측 */
	bool next(TagDetection& out, Millis timeout);

	size_t delivered() const { return delivered_.load(); }
	size_t restarts() const { return restarts_.load(); }

private:
	void runLoop_();

	InventoryController& inv_;
	MonitorConfig cfg_;
	Debouncer debounce_;
	DetectionCallback cb_;
	MsgQueue<TagDetection> queue_;

	std::thread th_;
	std::atomic<bool> run_{ false };
	std::mutex exit_mu_;
	std::condition_variable exit_cv_;
	bool exited_ = true;

	std::atomic<size_t> delivered_{ 0 };
	std::atomic<size_t> restarts_{ 0 };
};

} // namespace uhf
