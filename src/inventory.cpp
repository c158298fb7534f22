#include "inventory.hpp"
#include "log_sink.hpp"
#include "rfid_msg.hpp"
#include <algorithm>

namespace uhf {

const char* state_name(InventoryState s) {
	switch (s) {
	case InventoryState::Idle: return "Idle";
	case InventoryState::Running: return "Running";
	case InventoryState::Stopping: return "Stopping";
	}
	return "?";
}

TriggerProfile TriggerProfile::standard() {
	TriggerProfile p;
	p.poll_timeout_ms = 500;
	p.flush_poll_ms = 50;
	p.flush_window_ms = 500;
	return p;
}

TriggerProfile TriggerProfile::fast() {
	TriggerProfile p;
	p.poll_timeout_ms = UHF_TRIGGER_POLL_MS;
	p.flush_poll_ms = UHF_FLUSH_POLL_MS;
	p.flush_window_ms = UHF_FLUSH_WINDOW_MS;
	p.flush_max_count = UHF_FLUSH_MAX_TAGS;
	p.flush_empty_limit = UHF_FLUSH_EMPTY_LIMIT;
	p.buzzer = true;
	return p;
}

TriggerProfile TriggerProfile::relaxed() {
	TriggerProfile p;
	p.poll_timeout_ms = 1000;
	p.flush_poll_ms = 100;
	p.flush_window_ms = 1000;
	p.flush_empty_limit = 3;
	p.max_consecutive_empty = 5;
	p.keep_running = false;
	return p;
}

std::optional<TriggerProfile> profile_by_name(const std::string& name) {
	if (name == "standard") return TriggerProfile::standard();
	if (name == "fast") return TriggerProfile::fast();
	if (name == "relaxed") return TriggerProfile::relaxed();
	return std::nullopt;
}

namespace {

// 범위 종료 시 stop (에러 경로 포함)
class StopOnExit {
public:
	explicit StopOnExit(InventoryController& inv) : inv_(inv) {}
	~StopOnExit() {
		Status st = inv_.stop_inventory();
		if (!st.ok()) logln("INV", "cleanup stop 실패: " + describe(st));
	}
	StopOnExit(const StopOnExit&) = delete;
	StopOnExit& operator=(const StopOnExit&) = delete;
private:
	InventoryController& inv_;
};

uint32_t remaining_ms(TimePoint deadline) {
	auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now()).count();
	return left > 0 ? (uint32_t)left : 0;
}

} // namespace


InventoryController::InventoryController(Session& s, TriggerProfile profile)
	: s_(s), profile_(profile), sleeper_(real_sleeper()) {
	start_retry_.max_attempts = UHF_RETRY_START_ATTEMPTS;
	start_retry_.base_delay = Millis(UHF_RETRY_START_BASE_MS);
	start_retry_.multiplier = UHF_RETRY_MULTIPLIER;
}

InventoryState InventoryController::state() const {
	std::lock_guard<std::mutex> lk(mu_);
	return state_;
}

void InventoryController::set_profile(const TriggerProfile& p) {
	std::lock_guard<std::mutex> lk(mu_);
	profile_ = p;
}

TriggerProfile InventoryController::profile() const {
	std::lock_guard<std::mutex> lk(mu_);
	return profile_;
}

void InventoryController::set_start_retry(const RetryPolicy& policy, Sleeper sleeper) {
	std::lock_guard<std::mutex> lk(mu_);
	start_retry_ = policy;
	sleeper_ = std::move(sleeper);
}

Status InventoryController::start_inventory(uint8_t count_limit, uint32_t param) {
	if (!s_.is_open()) return Status::Error(Err::NOT_CONNECTED, "start inventory");

	std::lock_guard<std::mutex> lk(mu_);
	if (state_ == InventoryState::Running) {
		// 실행 중인 인벤토리 위에 start 금지: 먼저 정지
		Status st = stop_locked_(UHF_STOP_TIMEOUT_MS);
		if (!st.ok()) return st;
	}

	uint32_t raw = 0;
	Outcome o = s_.call(UHF_CMD_INVENTORY_START, PACK::inventory_start(count_limit, param), nullptr, &raw);
	// 타임아웃/이미 정지 응답은 실패가 아니다 (재시도 대상도 아님)
	if (o == Outcome::Fault) {
		state_ = InventoryState::Idle;
		return Status::Error(Err::COMMAND_FAILURE, "start inventory", raw);
	}
	state_ = InventoryState::Running;
	last_count_ = count_limit;
	last_param_ = param;
	return Status::Ok();
}

Status InventoryController::stop_inventory(uint32_t timeout_ms) {
	std::lock_guard<std::mutex> lk(mu_);
	return stop_locked_(timeout_ms);
}

Status InventoryController::stop_locked_(uint32_t timeout_ms) {
	if (state_ == InventoryState::Idle) return Status::Ok();
	state_ = InventoryState::Stopping;

	uint32_t raw = 0;
	uint16_t t = (uint16_t)std::min<uint32_t>(timeout_ms, 0xFFFF);
	Outcome o = s_.call(UHF_CMD_INVENTORY_STOP, PACK::timeout(t), nullptr, &raw);
	if (o == Outcome::Fault) {
		// 하드웨어는 아직 돌고 있다고 본다
		state_ = InventoryState::Running;
		return Status::Error(Err::COMMAND_FAILURE, "stop inventory", raw);
	}
	state_ = InventoryState::Idle;
	return Status::Ok();
}

Status InventoryController::poll(uint32_t timeout_ms, std::optional<TagDetection>& out) {
	out.reset();
	{
		std::lock_guard<std::mutex> lk(mu_);
		if (state_ != InventoryState::Running) return Status::Ok();
	}

	bytes buf;
	uint32_t raw = 0;
	uint16_t t = (uint16_t)std::min<uint32_t>(timeout_ms, 0xFFFF);
	Outcome o = s_.call(UHF_CMD_POLL_TAG, PACK::timeout(t), &buf, &raw);
	switch (o) {
	case Outcome::Success: {
		auto det = UNPACK::tag(buf);
		if (!det) return Status::Error(Err::COMMAND_FAILURE, "decode tag", STAT_RESP_FORMAT_ERR);
		out = std::move(det);
		return Status::Ok();
	}
	case Outcome::EmptyOrStopped:
	case Outcome::Timeout:
		return Status::Ok();
	case Outcome::Fault:
		break;
	}
	return Status::Error(Err::COMMAND_FAILURE, "poll tag", raw);
}

Status InventoryController::start_with_retry(uint8_t count_limit, uint32_t param) {
	RetryPolicy policy;
	Sleeper sleeper;
	{
		std::lock_guard<std::mutex> lk(mu_);
		policy = start_retry_;
		sleeper = sleeper_;
	}
	return with_retry([&] { return start_inventory(count_limit, param); }, policy, "start inventory", sleeper);
}

Status InventoryController::resume_inventory() {
	uint8_t count;
	uint32_t param;
	{
		std::lock_guard<std::mutex> lk(mu_);
		count = last_count_;
		param = last_param_;
	}
	return start_inventory(count, param);
}

void InventoryController::on_session_closing() {
	Status st = stop_inventory();
	if (!st.ok()) logln("INV", "disconnect 전 stop 실패(무시): " + describe(st));
	std::lock_guard<std::mutex> lk(mu_);
	state_ = InventoryState::Idle;
}

bool InventoryController::accept_(const TagDetection& det) {
	return debouncer_ ? debouncer_->accept(det) : true;
}

Status InventoryController::poll_until_(TimePoint deadline, const TagFilter& pred, std::optional<TagDetection>& out) {
	const uint32_t per = profile().poll_timeout_ms;
	// 데드라인 확인은 폴 호출 전에: 만료 직전 폴이 돌려준 태그도 채택
	while (Clock::now() < deadline) {
		uint32_t t = std::max<uint32_t>(1, std::min(per, remaining_ms(deadline)));
		std::optional<TagDetection> det;
		Status st = poll(t, det);
		if (!st.ok()) return st;
		if (!det) continue;
		if (pred && !pred(*det)) continue;
		if (!accept_(*det)) continue;
		out = std::move(det);
		return Status::Ok();
	}
	return Status::Ok();
}

Status InventoryController::read_single(uint32_t timeout_ms, std::optional<TagDetection>& out) {
	return read_until(timeout_ms, TagFilter(), out);
}

Status InventoryController::read_until(uint32_t timeout_ms, const TagFilter& pred, std::optional<TagDetection>& out) {
	out.reset();
	const TimePoint deadline = Clock::now() + Millis(timeout_ms);
	Status st = start_with_retry();
	if (!st.ok()) return st;

	StopOnExit guard(*this);
	return poll_until_(deadline, pred, out);
}

Status InventoryController::read_many(size_t max_count, uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty,
                                      std::vector<TagDetection>& out) {
	out.clear();
	if (max_consecutive_empty == 0) max_consecutive_empty = UHF_MAX_CONSECUTIVE_EMPTY;
	Status st = start_with_retry();
	if (!st.ok()) return st;

	StopOnExit guard(*this);
	uint32_t empties = 0;
	while (max_count == 0 || out.size() < max_count) {
		std::optional<TagDetection> det;
		st = poll(per_poll_timeout_ms, det);
		if (!st.ok()) return st;
		if (!det) {
			if (++empties >= max_consecutive_empty) break;
			continue;
		}
		empties = 0;
		if (accept_(*det)) out.push_back(std::move(*det));
	}
	return Status::Ok();
}

TagStream InventoryController::stream(uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty, size_t max_count) {
	return TagStream(this, per_poll_timeout_ms, max_consecutive_empty, max_count);
}

std::optional<TagDetection> TagStream::next() {
	if (done_) return std::nullopt;
	if (!started_) {
		if (!inv_->is_running()) {
			Status st = inv_->start_with_retry();
			if (!st.ok()) { status_ = st; done_ = true; return std::nullopt; }
		}
		started_ = true;
	}

	for (;;) {
		if (max_count_ > 0 && delivered_ >= max_count_) { done_ = true; return std::nullopt; }
		std::optional<TagDetection> det;
		Status st = inv_->poll(per_poll_ms_, det);
		if (!st.ok()) { status_ = st; done_ = true; return std::nullopt; }
		if (!det) {
			if (max_empty_ == 0) return std::nullopt;
			if (++empties_ >= max_empty_) { done_ = true; return std::nullopt; }
			continue;
		}
		empties_ = 0;
		if (!inv_->accept_(*det)) continue;
		++delivered_;
		return det;
	}
}

Status InventoryController::trigger(uint32_t timeout_ms, std::optional<TagDetection>& out, size_t* flushed,
                                    const std::function<void()>& on_flushed) {
	out.reset();
	const TriggerProfile prof = profile();

	if (!is_running()) {
		Status st = start_with_retry();
		if (!st.ok()) return st;
	}

	// 실행 중인 채로 버퍼 비우기
	size_t drained = 0;
	uint32_t empties = 0;
	const TimePoint flush_end = Clock::now() + Millis(prof.flush_window_ms);
	while (Clock::now() < flush_end && drained < prof.flush_max_count) {
		std::optional<TagDetection> old;
		Status st = poll(prof.flush_poll_ms, old);
		if (!st.ok()) {
			logln("INV", "flush 중단: " + describe(st));
			break;
		}
		if (old) { ++drained; empties = 0; }
		else if (++empties >= prof.flush_empty_limit) break;
	}
	if (flushed) *flushed = drained;
	if (prof.flush_max_count > 0 && drained >= prof.flush_max_count) logln("INV", "flush 상한 도달 (" + std::to_string(drained) + ")");
	if (on_flushed) on_flushed();

	Status result = Status::Ok();
	bool recovered = false;
	const TimePoint deadline = Clock::now() + Millis(timeout_ms);
	while (Clock::now() < deadline) {
		uint32_t t = std::max<uint32_t>(1, std::min(prof.poll_timeout_ms, remaining_ms(deadline)));
		std::optional<TagDetection> det;
		Status st = poll(t, det);
		if (!st.ok()) {
			if (recovered) { result = st; break; }
			recovered = true;
			logln("INV", "폴 Fault → 인벤토리 재시작: " + describe(st));
			Status sp = stop_inventory();
			if (!sp.ok()) logln("INV", "재시작 전 stop 실패: " + describe(sp));
			Status rs = start_with_retry();
			if (!rs.ok()) { result = rs; break; }
			continue;
		}
		if (det && accept_(*det)) {
			out = std::move(det);
			break;
		}
	}

	if (!prof.keep_running) {
		Status sp = stop_inventory();
		if (!sp.ok() && result.ok()) result = sp;
	}
	return result;
}

} // namespace uhf
