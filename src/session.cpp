#include "session.hpp"
#include "log_sink.hpp"
#include <cstdio>
#include <exception>

namespace uhf {

static std::string hex32(uint32_t v) {
	char buf[16];
	std::snprintf(buf, sizeof(buf), "0x%08X", (unsigned)v);
	return buf;
}

Status Session::connect(const Endpoint& ep, uint32_t timeout_ms) {
	if (!adapter_ || !adapter_->v) return Status::Error(Err::CONNECTION_FAILURE, "no driver backend");
	if (open_.load()) disconnect();

	std::lock_guard<std::mutex> lk(io_mu_);
	if (adapter_->v->probe) {
		uint32_t p = adapter_->v->probe(adapter_);
		if (p != STAT_OK) return Status::Error(Err::CONNECTION_FAILURE, "driver not ready", p);
	}
	AdapterHandle h = nullptr;
	uint32_t r = adapter_->v->open(adapter_, &ep, timeout_ms, &h);
	if (r != STAT_OK || !h) {
		logln("SESSION", "open 실패 " + ep.describe() + " → " + hex32(r) + " " + status_name(r));
		return Status::Error(Err::CONNECTION_FAILURE, "open device", r);
	}
	h_ = h;
	ep_ = ep;
	open_ = true;
	logln("SESSION", "connected " + ep.describe());
	return Status::Ok();
}

void Session::disconnect() noexcept {
	if (!open_.load()) return;
	bool expected = false;
	if (!closing_.compare_exchange_strong(expected, true)) return;

	std::function<void()> hook;
	{
		std::lock_guard<std::mutex> lk(hook_mu_);
		hook = before_close_;
	}
	if (hook) {
		try {
			hook();
		}
		catch (const std::exception& e) {
			logln("SESSION", std::string("before-close 훅 예외 무시: ") + e.what());
		}
	}

	{
		std::lock_guard<std::mutex> lk(io_mu_);
		if (adapter_ && adapter_->v && adapter_->v->close) adapter_->v->close(adapter_, h_);
		h_ = nullptr;
		open_ = false;
	}
	closing_ = false;
	logln("SESSION", "disconnected " + ep_.describe());
}

void Session::set_before_close(std::function<void()> hook) {
	std::lock_guard<std::mutex> lk(hook_mu_);
	before_close_ = std::move(hook);
}

uint32_t Session::invoke(uint16_t cmd, const bytes& args, bytes* out) {
	bytes scratch;
	bytes* o = out ? out : &scratch;
	std::lock_guard<std::mutex> lk(io_mu_);
	if (!open_.load() || !h_) return STAT_DLL_UNCONNECT;
	return adapter_->v->invoke(adapter_, h_, cmd, args.data(), args.size(), o);
}

Outcome Session::call(uint16_t cmd, const bytes& args, bytes* out, uint32_t* out_raw) {
	uint32_t raw = invoke(cmd, args, out);
	if (out_raw) *out_raw = raw;
	Outcome o = classify(raw);
	if (o == Outcome::Fault)
		logln("SESSION", std::string(command_name(cmd)) + " → " + hex32(raw) + " " + status_name(raw));
	return o;
}

} // namespace uhf
