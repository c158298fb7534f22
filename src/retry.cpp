#include "retry.hpp"
#include "log_sink.hpp"
#include <cmath>
#include <thread>

namespace uhf {

std::chrono::milliseconds RetryPolicy::delay_before(int retry) const {
	if (retry < 1) return std::chrono::milliseconds(0);
	double ms = (double)base_delay.count() * std::pow(multiplier, retry - 1);
	return std::chrono::milliseconds((long long)std::llround(ms));
}

Sleeper real_sleeper() {
	return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

Status with_retry(const std::function<Status()>& op, const RetryPolicy& policy,
                  const char* label, const Sleeper& sleep) {
	const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
	Status last = Status::Ok();
	for (int i = 0; i < attempts; ++i) {
		if (i > 0) {
			auto d = policy.delay_before(i);
			logln("RETRY", std::string(label) + " 재시도 " + std::to_string(i) + "/" +
				std::to_string(attempts - 1) + " (" + std::to_string(d.count()) + "ms 후)");
			if (sleep) sleep(d);
		}
		last = op();
		if (last.ok()) return last;
		if (last.code == Err::VALIDATION_FAILURE) return last;
		logln("RETRY", std::string(label) + " 실패: " + describe(last));
	}
	return last;
}

} // namespace uhf
