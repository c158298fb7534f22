// uhf_triggerd: 리더 연결 → 백그라운드 모니터 → 검출마다 JSON 한 줄(stdout)
// 사용법: uhf_triggerd [config.json]
// Ctrl+C / SIGTERM 으로 종료 (인벤토리 정지 후 닫힘)

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

#include "log_sink.hpp"
#include "reader.hpp"
#include "reader_config.hpp"

static std::atomic_bool g_stop{ false };

static void on_signal(int) { g_stop.store(true); }

int main(int argc, char** argv) {
	std::signal(SIGINT, on_signal);
	std::signal(SIGTERM, on_signal);

	uhf::ReaderConfig cfg;
	if (argc > 1) {
		uhf::Status st = uhf::load_config(argv[1], cfg);
		if (!st.ok()) {
			std::fprintf(stderr, "config load failed: %s\n", uhf::describe(st).c_str());
			return 2;
		}
	}

	uhf::LogSink sink;
	if (!cfg.log_path.empty()) {
		if (sink.open(cfg.log_path)) uhf::set_log_sink(&sink);
		else std::fprintf(stderr, "log file open failed: %s\n", cfg.log_path.c_str());
	}

	int rc = 0;
	{
		uhf::Reader reader(cfg);
		uhf::Status st = reader.connect();
		if (!st.ok()) {
			std::fprintf(stderr, "connect failed: %s\n", uhf::describe(st).c_str());
			rc = 1;
		}
		else {
			uhf::DeviceInfo info;
			if (reader.device_info(info).ok())
				uhf::logln("MAIN", "firmware " + info.firmware + " / hardware " + info.hardware);

			st = reader.start_monitor([](const uhf::TagDetection& det) {
				nlohmann::json j = det;
				std::printf("%s\n", j.dump().c_str());
				std::fflush(stdout);
			});
			if (!st.ok()) {
				std::fprintf(stderr, "monitor start failed: %s\n", uhf::describe(st).c_str());
				rc = 1;
			}
			else {
				uhf::logln("MAIN", "running (Ctrl+C to stop)");
				while (!g_stop.load() && reader.monitor() && reader.monitor()->running())
					std::this_thread::sleep_for(std::chrono::milliseconds(200));
				uhf::logln("MAIN", "shutting down");
			}
		}
		reader.disconnect();
	}

	uhf::set_log_sink(nullptr);
	return rc;
}
