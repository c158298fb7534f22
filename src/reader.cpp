#include "reader.hpp"
#include "log_sink.hpp"
#include <algorithm>

namespace uhf {

namespace {

// 비었으면 00000000, 아니면 정확히 4바이트
bool to_password(const bytes& in, Password& out) {
	out = Password{ { 0, 0, 0, 0 } };
	if (in.empty()) return true;
	if (in.size() != out.size()) return false;
	std::copy(in.begin(), in.end(), out.begin());
	return true;
}

} // namespace


Reader::Reader(ReaderConfig cfg, Adapter* adapter)
	: cfg_(std::move(cfg)),
	  adapter_(adapter ? adapter : create_adapter(cfg_.backend)),
	  session_(adapter_),
	  debouncer_(Millis(cfg_.debounce_ms), cfg_.debounce_max_entries),
	  inv_(session_, cfg_.profile),
	  sleeper_(real_sleeper()) {
	inv_.set_debouncer(&debouncer_);
	inv_.set_start_retry(cfg_.start_retry, sleeper_);
	session_.set_before_close([this] { inv_.on_session_closing(); });
	if (!adapter_) logln("READER", "backend 생성 실패 (드라이버 미포함 빌드?)");
}

Reader::~Reader() {
	stop_monitor();
	session_.disconnect();
	destroy_adapter(adapter_);
	adapter_ = nullptr;
}

void Reader::set_sleeper(Sleeper s) {
	sleeper_ = s;
	inv_.set_start_retry(cfg_.start_retry, std::move(s));
}

Status Reader::connect() {
	if (!adapter_) return Status::Error(Err::CONNECTION_FAILURE, "driver backend not available");
	if (session_.is_open()) return Status::Ok();

	Status st = with_retry([&] { return session_.connect(cfg_.endpoint, cfg_.connect_timeout_ms); },
		cfg_.connect_retry, "connect", sleeper_);
	if (!st.ok()) {
		logln("READER", cfg_.endpoint.describe() + " 연결 실패: " + describe(st) +
			" (케이블/포트 권한/IP 확인)");
		return st;
	}
	logln("READER", "연결됨: " + cfg_.endpoint.describe());

	// 초기 출력: range 프리셋이 power보다 우선. 실패해도 연결은 유지.
	Status pw = Status::Ok();
	if (cfg_.range) pw = set_range(*cfg_.range);
	else if (cfg_.power) pw = set_power(*cfg_.power);
	if (!pw.ok()) logln("READER", "초기 출력 설정 실패: " + describe(pw));

	if (cfg_.optimize_single_tag) {
		Status o = optimize_for_single_tag();
		if (!o.ok()) logln("READER", "단일 태그 최적화 실패: " + describe(o));
	}
	return Status::Ok();
}

void Reader::disconnect() {
	stop_monitor();
	session_.disconnect();
}

Status Reader::command_(uint16_t cmd, const bytes& args, bytes* out, const char* what) {
	if (!session_.is_open()) return Status::Error(Err::NOT_CONNECTED, what);
	uint32_t raw = 0;
	Outcome o = session_.call(cmd, args, out, &raw);
	if (o != Outcome::Success) return Status::Error(Err::COMMAND_FAILURE, what, raw);
	return Status::Ok();
}

// ===== 출력/거리 =====

Status Reader::set_power_raw_(uint8_t level) {
	return command_(UHF_CMD_SET_POWER, PACK::u8_pair(level), nullptr, "set power");
}

Status Reader::set_power(uint8_t level) {
	if (level > cfg_.max_power) return Status::Error(Err::VALIDATION_FAILURE, "power out of range");
	if (!session_.is_open()) return Status::Error(Err::NOT_CONNECTED, "set power");
	Status st = with_retry([&] { return set_power_raw_(level); }, cfg_.power_retry, "set power", sleeper_);
	if (st.ok()) logln("READER", "출력 " + std::to_string(level) + " dBm");
	return st;
}

Status Reader::get_power(uint8_t& level) {
	bytes out;
	Status st = command_(UHF_CMD_GET_POWER, bytes(), &out, "get power");
	if (!st.ok()) return st;
	if (out.empty()) return Status::Error(Err::COMMAND_FAILURE, "get power", STAT_RESP_FORMAT_ERR);
	level = out[0];
	return Status::Ok();
}

Status Reader::set_range(int distance_bucket) {
	uint8_t level = range_to_power(distance_bucket, cfg_.max_power);
	logln("READER", "range " + std::to_string(distance_bucket) + "m -> power " + std::to_string(level));
	return set_power(level);
}

Status Reader::set_range(RangePreset preset) {
	uint8_t level = preset_power(preset, cfg_.max_power);
	logln("READER", std::string("range ") + range_preset_name(preset) + " -> power " + std::to_string(level));
	return set_power(level);
}

// ===== 리드 =====

void Reader::dispatch_(const TagDetection& det) {
	std::vector<DetectionCallback> cbs;
	{
		std::lock_guard<std::mutex> lk(cb_mu_);
		cbs.reserve(callbacks_.size());
		for (auto& kv : callbacks_) cbs.push_back(kv.second);
	}
	for (auto& cb : cbs) {
		try {
			cb(det);
		}
		catch (const std::exception& e) {
			logln("READER", std::string("callback 예외: ") + e.what());
		}
	}
}

Status Reader::read_single(uint32_t timeout_ms, std::optional<TagDetection>& out) {
	Status st = inv_.read_single(timeout_ms, out);
	if (st.ok() && out) dispatch_(*out);
	return st;
}

Status Reader::read_until(uint32_t timeout_ms, const TagFilter& pred, std::optional<TagDetection>& out) {
	Status st = inv_.read_until(timeout_ms, pred, out);
	if (st.ok() && out) dispatch_(*out);
	return st;
}

Status Reader::read_many(size_t max_count, uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty,
                         std::vector<TagDetection>& out) {
	Status st = inv_.read_many(max_count, per_poll_timeout_ms, max_consecutive_empty, out);
	for (const auto& d : out) dispatch_(d);
	return st;
}

Status Reader::read_strongest(size_t max_count, uint32_t per_poll_timeout_ms, std::optional<TagDetection>& out) {
	out.reset();
	std::vector<TagDetection> tags;
	Status st = inv_.read_many(max_count, per_poll_timeout_ms, 0, tags);
	if (!st.ok()) return st;
	auto it = std::max_element(tags.begin(), tags.end(),
		[](const TagDetection& a, const TagDetection& b) { return a.rssi_dbm < b.rssi_dbm; });
	if (it == tags.end()) return Status::Ok();
	out = *it;
	dispatch_(*out);
	return Status::Ok();
}

TagStream Reader::stream(uint32_t per_poll_timeout_ms, uint32_t max_consecutive_empty, size_t max_count) {
	return inv_.stream(per_poll_timeout_ms, max_consecutive_empty, max_count);
}

Status Reader::trigger(std::optional<TagDetection>& out, size_t* flushed) {
	return trigger(inv_.profile().trigger_timeout_ms, out, flushed);
}

Status Reader::trigger(uint32_t timeout_ms, std::optional<TagDetection>& out, size_t* flushed) {
	const TriggerProfile prof = inv_.profile();
	bool buzzer_on = false;
	std::function<void()> on_flushed;
	if (prof.buzzer) {
		on_flushed = [&] {
			Status b = enable_buzzer(prof.buzzer_duration);
			if (!b.ok()) logln("READER", "부저 on 실패: " + describe(b));
			buzzer_on = b.ok();
		};
	}

	Status st = inv_.trigger(timeout_ms, out, flushed, on_flushed);

	if (buzzer_on) {
		Status b = disable_buzzer();
		if (!b.ok()) logln("READER", "부저 off 실패: " + describe(b));
	}
	if (st.ok() && out) dispatch_(*out);
	return st;
}

Status Reader::stop_inventory() {
	return inv_.stop_inventory();
}

// ===== 콜백 =====

int Reader::register_callback(DetectionCallback cb) {
	if (!cb) return -1;
	std::lock_guard<std::mutex> lk(cb_mu_);
	int id = ++next_cb_id_;
	callbacks_.emplace(id, std::move(cb));
	return id;
}

bool Reader::unregister_callback(int id) {
	std::lock_guard<std::mutex> lk(cb_mu_);
	return callbacks_.erase(id) > 0;
}

// ===== 디바이스 설정 =====

Status Reader::get_config(DeviceParams& out) {
	bytes raw;
	Status st = command_(UHF_CMD_GET_PARAMS, bytes(), &raw, "get device params");
	if (!st.ok()) return st;
	auto p = UNPACK::params(raw);
	if (!p) return Status::Error(Err::COMMAND_FAILURE, "decode device params", STAT_RESP_FORMAT_ERR);
	out = *p;
	return Status::Ok();
}

Status Reader::update_config(const ConfigUpdate& upd) {
	if (upd.power && *upd.power > cfg_.max_power) return Status::Error(Err::VALIDATION_FAILURE, "power out of range");
	if (upd.q_value && *upd.q_value > UHF_Q_MAX) return Status::Error(Err::VALIDATION_FAILURE, "q value out of range");
	if (upd.session && *upd.session > 3) return Status::Error(Err::VALIDATION_FAILURE, "session out of range");
	if (upd.antenna && *upd.antenna == 0) return Status::Error(Err::VALIDATION_FAILURE, "empty antenna mask");
	if (upd.empty()) return Status::Ok();

	// 부분 쓰기 명령 없음: 최신 블록 위에 덮어써서 통째로 쓴다
	DeviceParams p;
	Status st = get_config(p);
	if (!st.ok()) return st;

	if (upd.power) p.power = *upd.power;
	if (upd.antenna) p.antenna = *upd.antenna;
	if (upd.region) p.region = (uint8_t)*upd.region;
	if (upd.work_mode) p.work_mode = (uint8_t)*upd.work_mode;
	if (upd.q_value) p.q_value = *upd.q_value;
	if (upd.session) p.session = *upd.session;
	if (upd.inventory_area) p.inventory_area = *upd.inventory_area;
	if (upd.filter_time) p.filter_time = *upd.filter_time;
	if (upd.trigger_time) p.trigger_time = *upd.trigger_time;
	if (upd.buzzer_time) p.buzzer_time = *upd.buzzer_time;

	return command_(UHF_CMD_SET_PARAMS, PACK::params(p), nullptr, "set device params");
}

Status Reader::get_antenna(uint8_t& mask) {
	bytes out;
	Status st = command_(UHF_CMD_GET_ANTENNA, bytes(), &out, "get antenna");
	if (!st.ok()) return st;
	if (out.empty()) return Status::Error(Err::COMMAND_FAILURE, "get antenna", STAT_RESP_FORMAT_ERR);
	mask = out[0];
	return Status::Ok();
}

Status Reader::set_antenna(uint8_t mask) {
	if (mask == 0) return Status::Error(Err::VALIDATION_FAILURE, "empty antenna mask");
	return command_(UHF_CMD_SET_ANTENNA, PACK::u8_pair(mask), nullptr, "set antenna");
}

Status Reader::get_q_value(uint8_t& q) {
	DeviceParams p;
	Status st = get_config(p);
	if (st.ok()) {
		q = p.q_value;
		return Status::Ok();
	}
	if (st.code == Err::NOT_CONNECTED) return st;

	// 파라미터 블록 실패 시 Q 전용 명령 (인벤토리 중에는 응답 안 함)
	logln("READER", "params 조회 실패, Q 직접 조회: " + describe(st));
	return with_inventory_paused([&]() -> Status {
		bytes out;
		Status s = command_(UHF_CMD_GET_Q, bytes(), &out, "get q value");
		if (!s.ok()) return s;
		if (out.empty()) return Status::Error(Err::COMMAND_FAILURE, "get q value", STAT_RESP_FORMAT_ERR);
		q = out[0];
		return Status::Ok();
	});
}

Status Reader::set_q_value(uint8_t q) {
	if (q > UHF_Q_MAX) return Status::Error(Err::VALIDATION_FAILURE, "q value out of range");
	return command_(UHF_CMD_SET_Q, PACK::u8_pair(q), nullptr, "set q value");
}

Status Reader::set_select_mask(uint16_t mask_ptr_bits, uint8_t mask_bits, const bytes& mask) {
	if ((size_t)mask_bits > mask.size() * 8) return Status::Error(Err::VALIDATION_FAILURE, "mask shorter than mask bits");
	SelectMask m;
	m.ptr_bits = mask_ptr_bits;
	m.bits = mask_bits;
	m.mask.assign(mask.begin(), mask.begin() + (mask_bits + 7) / 8);
	Status st = command_(UHF_CMD_SET_SELECT_MASK, PACK::select_mask(m), nullptr, "set select mask");
	if (st.ok()) logln("READER", "select mask ptr=" + std::to_string(m.ptr_bits) + " bits=" + std::to_string(m.bits) + " " + hex(m.mask));
	return st;
}

Status Reader::filter_by_epc_prefix(const bytes& prefix) {
	if (prefix.empty()) return Status::Error(Err::VALIDATION_FAILURE, "empty epc prefix");
	if (prefix.size() * 8 > 255) return Status::Error(Err::VALIDATION_FAILURE, "epc prefix too long");
	return set_select_mask(SelectMask::kEpcStartBit, (uint8_t)(prefix.size() * 8), prefix);
}

Status Reader::clear_filter() {
	return set_select_mask(0, 0, bytes());
}

Status Reader::optimize_for_single_tag() {
	DeviceParams p;
	Status st = get_config(p);
	if (!st.ok()) return st;
	if (p.q_value == 0 && p.session == 0) return Status::Ok();
	p.q_value = 0;
	p.session = 0;
	st = command_(UHF_CMD_SET_PARAMS, PACK::params(p), nullptr, "optimize single tag");
	if (st.ok()) logln("READER", "단일 태그 모드 (Q=0, S0)");
	return st;
}

Status Reader::device_info(DeviceInfo& out) {
	bytes raw;
	Status st = command_(UHF_CMD_GET_INFO, bytes(), &raw, "get device info");
	if (!st.ok()) return st;
	auto info = UNPACK::info(raw);
	if (!info) return Status::Error(Err::COMMAND_FAILURE, "decode device info", STAT_RESP_FORMAT_ERR);
	out = *info;
	return Status::Ok();
}

// ===== 태그 메모리 (인벤토리 일시정지 상태에서) =====

Status Reader::read_memory(MemoryBank bank, uint16_t word_ptr, uint8_t word_count, bytes& out,
                           const bytes& password) {
	out.clear();
	MemoryRequest req;
	if (!to_password(password, req.password)) return Status::Error(Err::VALIDATION_FAILURE, "password must be 4 bytes");
	if (word_count == 0 || word_count > 128) return Status::Error(Err::VALIDATION_FAILURE, "word count out of range");
	if (!session_.is_open()) return Status::Error(Err::NOT_CONNECTED, "read memory");

	req.bank = bank;
	req.word_ptr = word_ptr;
	req.word_count = word_count;
	req.timeout_ms = UHF_MEMORY_TIMEOUT_MS;
	return with_inventory_paused([&] {
		return command_(UHF_CMD_READ_MEMORY, PACK::memory_request(req), &out, "read memory");
	});
}

Status Reader::write_memory(MemoryBank bank, uint16_t word_ptr, const bytes& data, const bytes& password) {
	MemoryRequest req;
	if (!to_password(password, req.password)) return Status::Error(Err::VALIDATION_FAILURE, "password must be 4 bytes");
	if (data.empty() || data.size() % 2 != 0) return Status::Error(Err::VALIDATION_FAILURE, "data must be whole words");
	if (data.size() / 2 > 0xFF) return Status::Error(Err::VALIDATION_FAILURE, "data too long");
	if (!session_.is_open()) return Status::Error(Err::NOT_CONNECTED, "write memory");

	req.bank = bank;
	req.word_ptr = word_ptr;
	req.word_count = (uint8_t)(data.size() / 2);
	req.timeout_ms = UHF_MEMORY_TIMEOUT_MS;
	return with_inventory_paused([&] {
		return command_(UHF_CMD_WRITE_MEMORY, PACK::write_memory(req, data), nullptr, "write memory");
	});
}

Status Reader::write_epc(const bytes& epc, const bytes& password) {
	// EPC 뱅크: word0 CRC, word1 PC, word2부터 EPC
	return write_memory(MemoryBank::Epc, 2, epc, password);
}

Status Reader::lock_tag(LockArea area, LockAction action, const bytes& password) {
	Password pwd;
	if (!to_password(password, pwd)) return Status::Error(Err::VALIDATION_FAILURE, "password must be 4 bytes");
	if (!session_.is_open()) return Status::Error(Err::NOT_CONNECTED, "lock tag");
	return with_inventory_paused([&] {
		return command_(UHF_CMD_LOCK_TAG, PACK::lock(pwd, area, action), nullptr, "lock tag");
	});
}

Status Reader::kill_tag(const bytes& password) {
	if (password.size() != 4) return Status::Error(Err::VALIDATION_FAILURE, "kill password must be 4 bytes");
	Password pwd;
	std::copy(password.begin(), password.end(), pwd.begin());
	if (!session_.is_open()) return Status::Error(Err::NOT_CONNECTED, "kill tag");
	logln("READER", "kill 요청");
	return with_inventory_paused([&] {
		return command_(UHF_CMD_KILL_TAG, PACK::kill(pwd), nullptr, "kill tag");
	});
}

// ===== 부저/릴레이 =====

Status Reader::enable_buzzer(uint8_t duration) {
	return command_(UHF_CMD_BUZZER_ENABLE, PACK::u8(duration), nullptr, "enable buzzer");
}

Status Reader::disable_buzzer() {
	return command_(UHF_CMD_BUZZER_DISABLE, bytes(), nullptr, "disable buzzer");
}

Status Reader::activate_relay(uint8_t time_100ms) {
	return command_(UHF_CMD_RELAY_CLOSE, PACK::u8(time_100ms), nullptr, "close relay");
}

Status Reader::deactivate_relay(uint8_t time_100ms) {
	return command_(UHF_CMD_RELAY_RELEASE, PACK::u8(time_100ms), nullptr, "release relay");
}

// ===== 백그라운드 모니터 =====

Status Reader::start_monitor(DetectionCallback cb) {
	if (monitor_ && monitor_->running()) return Status::Ok();
	monitor_ = std::make_unique<TagMonitor>(inv_, cfg_.monitor);
	return monitor_->start([this, cb](const TagDetection& det) {
		dispatch_(det);
		if (cb) cb(det);
	});
}

void Reader::stop_monitor() {
	if (!monitor_) return;
	if (!monitor_->stop()) logln("READER", "monitor 종료 지연");
}

} // namespace uhf
