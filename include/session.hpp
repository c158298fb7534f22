#pragma once
#include "adapter.hpp"
#include "status.hpp"
#include "status_codes.hpp"
#include <atomic>
#include <functional>
#include <mutex>

namespace uhf {

/**
* Session
* - 디바이스 핸들 1개(시리얼/네트워크)를 소유. 모든 명령은 invoke()를 통과한다.
* - 드라이버 호출은 블로킹/재진입 불가 → io 뮤텍스로 직렬화.
* - disconnect()는 멱등, 예외 없음. 닫기 전에 before_close 훅(인벤토리 정지)을 먼저 실행.
* - Adapter는 소유하지 않는다.
*/
class Session {
public:
	explicit Session(Adapter* adapter) : adapter_(adapter) {}
	~Session() { disconnect(); }

	Session(const Session&) = delete;
	Session& operator=(const Session&) = delete;

	Status connect(const Endpoint& ep, uint32_t timeout_ms);
	void disconnect() noexcept;
	bool is_open() const { return open_.load(); }
	const Endpoint& endpoint() const { return ep_; }

	/** 닫기 직전 호출 (실패는 훅 내부에서 기록하고 삼킨다) */
	void set_before_close(std::function<void()> hook);

	/** raw 벤더 코드(32-bit) 반환. 닫힌 세션이면 DLL_UNCONNECT. */
	uint32_t invoke(uint16_t cmd, const bytes& args, bytes* out);

	/** invoke + classify. raw가 필요하면 out_raw로 받는다. */
	Outcome call(uint16_t cmd, const bytes& args, bytes* out, uint32_t* out_raw = nullptr);

private:
	Adapter* adapter_ = nullptr;
	AdapterHandle h_ = nullptr;
	Endpoint ep_;
	std::atomic<bool> open_{ false };
	std::atomic<bool> closing_{ false };
	std::mutex io_mu_; ///< 드라이버 호출 직렬화
	std::mutex hook_mu_;
	std::function<void()> before_close_;
};

} // namespace uhf
