#pragma once
#include "status.hpp"
#include <chrono>
#include <functional>

namespace uhf {

/** 지수 백오프: n번째 재시도(n>=1) 전 base_delay * multiplier^(n-1) 대기 */
struct RetryPolicy {
	int max_attempts = 3;
	std::chrono::milliseconds base_delay{ 300 };
	double multiplier = 1.5;

	std::chrono::milliseconds delay_before(int retry) const; ///< retry는 1부터
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/** 기본 sleeper (std::this_thread::sleep_for) */
Sleeper real_sleeper();

/**
* with_retry
* - op가 ok()면 즉시 반환. VALIDATION_FAILURE는 재시도하지 않는다.
* - max_attempts 소진 시 마지막 실패를 그대로 반환.
* - label은 로그용.
*/
Status with_retry(const std::function<Status()>& op, const RetryPolicy& policy,
                  const char* label, const Sleeper& sleep = real_sleeper());

} // namespace uhf
