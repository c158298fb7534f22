#include "reader_config.hpp"
#include "log_sink.hpp"
#include <cmath>
#include <fstream>

using json = nlohmann::json;

namespace uhf {

static bool parse_retry(const json& j, const char* key, RetryPolicy& p) {
	if (!j.contains(key)) return true;
	const json& r = j.at(key);
	if (!r.is_object()) return false;
	p.max_attempts = r.value("attempts", p.max_attempts);
	p.base_delay = Millis(r.value("base_ms", (int64_t)p.base_delay.count()));
	p.multiplier = r.value("multiplier", p.multiplier);
	return p.max_attempts >= 1 && p.base_delay.count() >= 0 && p.multiplier >= 1.0;
}

Status parse_config(const json& j, ReaderConfig& out) {
	if (!j.is_object()) return Status::Error(Err::VALIDATION_FAILURE, "config must be a JSON object");
	ReaderConfig c = out;
	try {
		const std::string backend = j.value("backend", std::string(c.backend == UHF_DEVICE_DEBUG ? "debug" : "cfapi"));
		if (backend == "debug") c.backend = UHF_DEVICE_DEBUG;
		else if (backend == "cfapi") c.backend = UHF_DEVICE_CFAPI;
		else return Status::Error(Err::VALIDATION_FAILURE, "unknown backend");

		if (j.contains("host")) {
			int net_port = j.value("net_port", (int)UHF_DEFAULT_NET_PORT);
			if (net_port < 1 || net_port > 65535) return Status::Error(Err::VALIDATION_FAILURE, "net_port out of range");
			c.endpoint = Endpoint::network(j.value("host", std::string()), (uint16_t)net_port);
			if (c.endpoint.host.empty()) return Status::Error(Err::VALIDATION_FAILURE, "empty host");
		} else {
			c.endpoint = Endpoint::serial(j.value("port", c.endpoint.path.empty() ? std::string(UHF_DEFAULT_PORT) : c.endpoint.path),
				j.value("baud", c.endpoint.baud));
		}
		c.connect_timeout_ms = j.value("connect_timeout_ms", c.connect_timeout_ms);

		int max_power = j.value("max_power", (int)c.max_power);
		if (max_power < 0 || max_power > UHF_POWER_MAX) return Status::Error(Err::VALIDATION_FAILURE, "max_power out of range");
		c.max_power = (uint8_t)max_power;
		if (j.contains("power")) {
			int p = j.value("power", 0);
			if (p < 0 || p > c.max_power) return Status::Error(Err::VALIDATION_FAILURE, "power out of range");
			c.power = (uint8_t)p;
		}
		if (j.contains("range")) {
			auto r = parse_range_preset(j.value("range", std::string()));
			if (!r) return Status::Error(Err::VALIDATION_FAILURE, "unknown range preset");
			c.range = r;
		}

		c.debounce_ms = j.value("debounce_ms", c.debounce_ms);
		c.debounce_max_entries = j.value("debounce_max_entries", c.debounce_max_entries);

		if (j.contains("profile")) {
			c.profile_name = j.value("profile", std::string());
			auto p = profile_by_name(c.profile_name);
			if (!p) return Status::Error(Err::VALIDATION_FAILURE, "unknown trigger profile");
			c.profile = *p;
		}
		c.profile.poll_timeout_ms = j.value("poll_timeout_ms", c.profile.poll_timeout_ms);
		c.profile.trigger_timeout_ms = j.value("trigger_timeout_ms", c.profile.trigger_timeout_ms);
		c.profile.keep_running = j.value("keep_running", c.profile.keep_running);
		c.profile.buzzer = j.value("buzzer", c.profile.buzzer);
		if (c.profile.poll_timeout_ms == 0) return Status::Error(Err::VALIDATION_FAILURE, "poll_timeout_ms must be > 0");
		c.optimize_single_tag = j.value("optimize_single_tag", c.optimize_single_tag);

		if (j.contains("retry")) {
			const json& r = j.at("retry");
			if (!r.is_object() || !parse_retry(r, "connect", c.connect_retry) ||
				!parse_retry(r, "power", c.power_retry) || !parse_retry(r, "start", c.start_retry))
				return Status::Error(Err::VALIDATION_FAILURE, "invalid retry policy");
		}

		if (j.contains("monitor")) {
			const json& m = j.at("monitor");
			if (!m.is_object()) return Status::Error(Err::VALIDATION_FAILURE, "monitor must be an object");
			c.monitor.poll_ms = m.value("poll_ms", c.monitor.poll_ms);
			c.monitor.debounce_ms = m.value("debounce_ms", c.monitor.debounce_ms);
			c.monitor.fault_limit = m.value("fault_limit", c.monitor.fault_limit);
			c.monitor.queue_capacity = m.value("queue_capacity", c.monitor.queue_capacity);
			c.monitor.stop_on_exit = m.value("stop_on_exit", c.monitor.stop_on_exit);
			if (c.monitor.poll_ms == 0 || c.monitor.fault_limit == 0)
				return Status::Error(Err::VALIDATION_FAILURE, "monitor poll_ms/fault_limit must be > 0");
		}

		c.log_path = j.value("log_path", c.log_path);
	}
	catch (const json::exception& e) {
		logln("CONFIG", std::string("type error: ") + e.what());
		return Status::Error(Err::VALIDATION_FAILURE, "config type error");
	}
	out = c;
	return Status::Ok();
}

Status load_config(const std::string& path, ReaderConfig& out) {
	std::ifstream f(path);
	if (!f) return Status::Error(Err::VALIDATION_FAILURE, "cannot open config file");
	json j;
	try {
		f >> j;
	}
	catch (const json::parse_error& e) {
		logln("CONFIG", path + ": " + e.what());
		return Status::Error(Err::VALIDATION_FAILURE, "malformed config JSON");
	}
	return parse_config(j, out);
}

void to_json(json& j, const TagDetection& d) {
	j = json{
		{ "epc", d.epc_hex },
		{ "rssi", std::round(d.rssi_dbm * 10.0f) / 10.0 },
		{ "antenna", d.antenna },
		{ "channel", d.channel },
		{ "pc", hex(bytes{ d.pc[0], d.pc[1] }) },
		{ "crc", hex(bytes{ d.crc[0], d.crc[1] }) },
		{ "length", d.length },
		{ "sequence", d.sequence }
	};
}

} // namespace uhf
