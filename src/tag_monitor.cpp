#include "tag_monitor.hpp"
#include "log_sink.hpp"
#include <exception>

namespace uhf {

TagMonitor::TagMonitor(InventoryController& inv, MonitorConfig cfg)
	: inv_(inv), cfg_(cfg), debounce_(Millis(cfg.debounce_ms)), queue_(cfg.queue_capacity) {}

Status TagMonitor::start(DetectionCallback cb) {
	if (run_.load()) return Status::Ok();
	if (th_.joinable()) th_.join();
	if (!inv_.session().is_open()) return Status::Error(Err::NOT_CONNECTED, "start monitor");

	if (!inv_.is_running()) {
		Status st = inv_.start_with_retry();
		if (!st.ok()) return st;
	}

	cb_ = std::move(cb);
	debounce_.reset();
	queue_.reopen();
	{
		std::lock_guard<std::mutex> lk(exit_mu_);
		exited_ = false;
	}
	run_ = true;
	th_ = std::thread([this] { runLoop_(); });
	logln("MON", "monitor started (poll " + std::to_string(cfg_.poll_ms) + "ms, debounce " +
		std::to_string(cfg_.debounce_ms) + "ms)");
	return Status::Ok();
}

bool TagMonitor::stop() {
	if (!th_.joinable()) return true;
	run_ = false;
	queue_.shutdown();

	bool in_time;
	{
		std::unique_lock<std::mutex> lk(exit_mu_);
		in_time = exit_cv_.wait_for(lk, Millis(cfg_.join_timeout_ms), [&] { return exited_; });
	}
	if (!in_time) logln("MON", "워커 종료 지연 (" + std::to_string(cfg_.join_timeout_ms) + "ms 초과), join 대기");
	th_.join();
	logln("MON", "monitor stopped, delivered=" + std::to_string(delivered_.load()));
	return in_time;
}

bool TagMonitor::next(TagDetection& out, Millis timeout) {
	if (cfg_.queue_capacity == 0) return false;
	return queue_.pop_for(out, timeout);
}

void TagMonitor::runLoop_() {
	uint32_t faults = 0;
	while (run_.load()) {
		std::optional<TagDetection> det;
		Status st = inv_.poll(cfg_.poll_ms, det);
		if (!st.ok()) {
			logln("MON", "poll 실패: " + describe(st));
			if (++faults >= cfg_.fault_limit) {
				faults = 0;
				restarts_++;
				logln("MON", "연속 Fault → 인벤토리 재시작");
				Status sp = inv_.stop_inventory();
				if (!sp.ok()) logln("MON", "stop 실패: " + describe(sp));
				Status rs = inv_.start_with_retry();
				if (!rs.ok()) logln("MON", "restart 실패: " + describe(rs));
			}
			continue;
		}
		faults = 0;
		if (!det) {
			// 다른 경로에서 인벤토리가 멈췄으면 I/O 없이 바로 돌아오므로 잠깐 쉼
			if (!inv_.is_running()) std::this_thread::sleep_for(Millis(cfg_.poll_ms));
			continue;
		}
		if (!debounce_.accept(*det)) continue;

		delivered_++;
		if (cfg_.queue_capacity > 0) queue_.push(*det);
		if (cb_) {
			try {
				cb_(*det);
			}
			catch (const std::exception& e) {
				logln("MON", std::string("callback 예외: ") + e.what());
			}
		}
	}

	if (cfg_.stop_on_exit) {
		Status st = inv_.stop_inventory();
		if (!st.ok()) logln("MON", "종료 stop 실패: " + describe(st));
	}
	{
		std::lock_guard<std::mutex> lk(exit_mu_);
		exited_ = true;
	}
	exit_cv_.notify_all();
}

} // namespace uhf
