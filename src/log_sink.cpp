#include "log_sink.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace std::chrono;

namespace uhf {

bool LogSink::open(const std::string& path) {
	f_.open(path, std::ios::app);
	return (bool)f_;
}


void LogSink::write(const std::string& line) {
	std::lock_guard<std::mutex> lk(mu_);
	if (!f_) return;
	auto now = system_clock::now();
	std::time_t tt = system_clock::to_time_t(now);
	std::tm tm{}; localtime_r(&tt, &tm);
	f_ << std::put_time(&tm, "%F %T") << " | " << line << "\n";
	f_.flush();
}


static std::atomic<LogSink*> g_sink{ nullptr };
static std::mutex g_err_mu;

void set_log_sink(LogSink* sink) {
	g_sink.store(sink);
}

void logln(const char* tag, const std::string& msg) {
	auto t = system_clock::now();
	auto tt = system_clock::to_time_t(t);
	auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;
	std::tm tm{}; localtime_r(&tt, &tm);
	{
		std::lock_guard<std::mutex> lk(g_err_mu);
		std::cerr << "[" << std::put_time(&tm, "%F %T") << "."
			<< std::setw(3) << std::setfill('0') << ms.count()
			<< "][" << tag << "] " << msg << "\n";
	}
	if (LogSink* s = g_sink.load()) s->write(std::string("[") + tag + "] " + msg);
}

} // namespace uhf
