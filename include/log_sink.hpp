#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace uhf {

class LogSink {
public:
	bool open(const std::string& path); ///< 파일 오픈(append)
	bool is_open() const { return f_.is_open(); }
	void write(const std::string& line);///< 타임스탬프 + 라인 기록
private:
	std::ofstream f_;
	std::mutex mu_;
};

/** 프로세스 전역 파일 싱크 지정(nullptr이면 stderr만). 소유권은 호출 측. */
void set_log_sink(LogSink* sink);

/** "[%F %T.mmm][TAG] msg" 한 줄을 stderr로, 싱크가 있으면 파일에도 */
void logln(const char* tag, const std::string& msg);

} // namespace uhf
