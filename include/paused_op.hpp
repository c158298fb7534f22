#pragma once
#include "inventory.hpp"
#include "log_sink.hpp"
#include <utility>

namespace uhf {

/**
* InventoryPause
* - 생성 시 Running이면 최선 노력 stop, 소멸 시(예외 경로 포함) 이전 start 인자로 재시작.
* - stop/start 실패는 기록만 하고 던지지 않는다.
* - 상태 변경은 항상 InventoryController의 start/stop을 통해서만.
*/
class InventoryPause {
public:
	explicit InventoryPause(InventoryController& inv) : inv_(inv), was_running_(inv.is_running()) {
		if (!was_running_) return;
		Status st = inv_.stop_inventory();
		if (!st.ok()) logln("PAUSE", "stop 실패(계속 진행): " + describe(st));
	}

	~InventoryPause() {
		if (!was_running_) return;
		Status st = inv_.resume_inventory();
		if (!st.ok()) logln("PAUSE", "resume 실패: " + describe(st));
	}

	InventoryPause(const InventoryPause&) = delete;
	InventoryPause& operator=(const InventoryPause&) = delete;

	bool was_running() const { return was_running_; }

private:
	InventoryController& inv_;
	const bool was_running_;
};

/** 인벤토리를 멈춘 상태에서 fn 실행 후 원래 상태로 복구. fn의 반환값/예외를 그대로 전달. */
template <typename Fn>
auto with_inventory_paused(InventoryController& inv, Fn&& fn) -> decltype(fn()) {
	InventoryPause pause(inv);
	return std::forward<Fn>(fn)();
}

} // namespace uhf
