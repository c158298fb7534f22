#pragma once
#include "common.hpp"
#include "config/app_config.h"
#include "debouncer.hpp"
#include "retry.hpp"
#include "session.hpp"
#include <mutex>
#include <vector>

namespace uhf {

enum class InventoryState : uint8_t { Idle, Running, Stopping };
const char* state_name(InventoryState s);

/**
* TriggerProfile
* - 트리거 리드 타이밍 묶음. 변형별 코드 대신 프리셋으로 구분.
* - fast: 50ms 폴링 / 20ms 플러시(최대 0.2s, 500개, 연속 2회 빈 응답)
*/
struct TriggerProfile {
	uint32_t poll_timeout_ms = UHF_POLL_TIMEOUT_MS;   ///< 폴 1회 최대 대기
	uint32_t trigger_timeout_ms = UHF_TRIGGER_TIMEOUT_MS;
	uint32_t flush_poll_ms = UHF_FLUSH_POLL_MS;
	uint32_t flush_window_ms = UHF_FLUSH_WINDOW_MS;
	uint32_t flush_max_count = UHF_FLUSH_MAX_TAGS;
	uint32_t flush_empty_limit = UHF_FLUSH_EMPTY_LIMIT;
	uint32_t max_consecutive_empty = UHF_MAX_CONSECUTIVE_EMPTY;
	bool keep_running = true;      ///< 트리거 후 인벤토리 유지
	bool buzzer = false;           ///< 트리거 동안 부저 on
	uint8_t buzzer_duration = UHF_BUZZER_DURATION;

	static TriggerProfile standard();
	static TriggerProfile fast();
	static TriggerProfile relaxed();
};

std::optional<TriggerProfile> profile_by_name(const std::string& name);

using TagFilter = std::function<bool(const TagDetection&)>;

class InventoryController;

/**
* TagStream
* - pull 방식. next() 한 번 = 태그 1개가 나오거나 종료 조건까지 폴링.
* - max_consecutive_empty == 0 이면 빈 폴 1회마다 nullopt를 돌려주고 스트림은 계속(done() == false).
* - 인벤토리를 멈추지 않는다. 다 쓴 뒤 stop_inventory()는 호출 측 책임.
*/
class TagStream {
public:
	std::optional<TagDetection> next();
	bool done() const { return done_; }
	const Status& status() const { return status_; } ///< Fault로 끝났을 때 에러
	size_t delivered() const { return delivered_; }

private:
	friend class InventoryController;
	TagStream(InventoryController* inv, uint32_t per_poll_ms, uint32_t max_empty, size_t max_count)
		: inv_(inv), per_poll_ms_(per_poll_ms), max_empty_(max_empty), max_count_(max_count) {}

	InventoryController* inv_;
	uint32_t per_poll_ms_;
	uint32_t max_empty_;
	size_t max_count_;
	bool started_ = false;
	bool done_ = false;
	uint32_t empties_ = 0;
	size_t delivered_ = 0;
	Status status_;
};

/**
* InventoryController
* - Idle --start--> Running --stop--> Idle. Idle에서 stop은 no-op 성공.
* - Running에서 start → 내부 stop 후 재시작 (Running 상태는 항상 하나).
* - 상태 뮤텍스는 상태 확인/전이(start/stop 명령)에만 잡고 블로킹 폴 동안은 잡지 않는다.
* - Timeout/EmptyOrStopped는 에러가 아니다: poll은 nullopt, stop은 성공.
*/
class InventoryController {
public:
	explicit InventoryController(Session& s, TriggerProfile profile = TriggerProfile::standard());

	Status start_inventory(uint8_t count_limit = 0, uint32_t param = 0);
	Status stop_inventory(uint32_t timeout_ms = UHF_STOP_TIMEOUT_MS);
	/** 1회 대기. 태그 없음/종료는 ok + nullopt. Idle이면 I/O 없이 nullopt. */
	Status poll(uint32_t timeout_ms, std::optional<TagDetection>& out);

	/** start → 데드라인까지 폴 → 항상 stop. 타임아웃은 ok + nullopt. */
	Status read_single(uint32_t timeout_ms, std::optional<TagDetection>& out);
	Status read_until(uint32_t timeout_ms, const TagFilter& pred, std::optional<TagDetection>& out);
	Status read_many(size_t max_count, uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty,
	                 std::vector<TagDetection>& out);
	TagStream stream(uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty = 0, size_t max_count = 0);

	/**
	* 유지형 트리거 리드
	* - 필요하면 start, 실행 중인 채로 버퍼를 비운 뒤(drain) 새 태그를 기다린다.
	* - 폴 Fault 시 호출당 1회 인벤토리 재시작, 두 번째 Fault는 반환.
	* - profile.keep_running == false 면 끝나고 stop.
	* - on_flushed: 버퍼 비운 직후, 새 태그 대기 전에 호출 (부저 on 등)
	*/
	Status trigger(uint32_t timeout_ms, std::optional<TagDetection>& out, size_t* flushed = nullptr,
	               const std::function<void()>& on_flushed = nullptr);

	/** 마지막 start 인자로 재시작 (일시정지 해제용) */
	Status resume_inventory();
	/** 재시도 정책을 적용한 start */
	Status start_with_retry(uint8_t count_limit = 0, uint32_t param = 0);

	/** 세션 종료 직전: 최선 노력 stop, 실패는 기록 후 Idle로 강제 */
	void on_session_closing();

	InventoryState state() const;
	bool is_running() const { return state() == InventoryState::Running; }

	void set_debouncer(Debouncer* d) { debouncer_ = d; }
	void set_profile(const TriggerProfile& p);
	TriggerProfile profile() const;
	void set_start_retry(const RetryPolicy& policy, Sleeper sleeper = real_sleeper());

	Session& session() { return s_; }

private:
	friend class TagStream;
	Status stop_locked_(uint32_t timeout_ms);
	bool accept_(const TagDetection& det);
	Status poll_until_(TimePoint deadline, const TagFilter& pred, std::optional<TagDetection>& out);

	Session& s_;
	mutable std::mutex mu_;
	InventoryState state_ = InventoryState::Idle;
	uint8_t last_count_ = 0;
	uint32_t last_param_ = 0;

	TriggerProfile profile_;
	RetryPolicy start_retry_;
	Sleeper sleeper_;
	Debouncer* debouncer_ = nullptr;
};

} // namespace uhf
