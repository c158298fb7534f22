#pragma once
#include "adapter.hpp"
#include "config/app_config.h"
#include "inventory.hpp"
#include "range_map.hpp"
#include "retry.hpp"
#include "status.hpp"
#include "tag_monitor.hpp"
#include <nlohmann/json.hpp>

namespace uhf {

/**
* ReaderConfig
* - 런타임 설정. 기본값은 app_config.h, JSON 파일로 덮어쓴다(모르는 키는 무시).
*/
struct ReaderConfig {
	uhf_device_t backend = UHF_DEVICE_CFAPI;
	Endpoint endpoint = Endpoint::serial(UHF_DEFAULT_PORT, UHF_DEFAULT_BAUD);
	uint32_t connect_timeout_ms = UHF_CONNECT_TIMEOUT_MS;

	uint8_t max_power = UHF_POWER_MAX;           ///< 30, 제한 펌웨어는 26
	std::optional<uint8_t> power;                ///< 연결 직후 적용
	std::optional<RangePreset> range;            ///< power보다 우선

	uint32_t debounce_ms = UHF_DEBOUNCE_MS;
	size_t debounce_max_entries = 0;

	std::string profile_name = "standard";
	TriggerProfile profile = TriggerProfile::standard();
	bool optimize_single_tag = false;            ///< 연결 후 Q=0, S0

	RetryPolicy connect_retry{ UHF_RETRY_CONNECT_ATTEMPTS, Millis(UHF_RETRY_CONNECT_BASE_MS), UHF_RETRY_MULTIPLIER };
	RetryPolicy power_retry{ UHF_RETRY_POWER_ATTEMPTS, Millis(UHF_RETRY_POWER_BASE_MS), UHF_RETRY_MULTIPLIER };
	RetryPolicy start_retry{ UHF_RETRY_START_ATTEMPTS, Millis(UHF_RETRY_START_BASE_MS), UHF_RETRY_MULTIPLIER };

	MonitorConfig monitor;
	std::string log_path;                        ///< 비어 있으면 파일 로그 없음
};

/** JSON 객체 → 설정. 형식/범위 오류는 VALIDATION_FAILURE, out은 변경하지 않는다. */
Status parse_config(const nlohmann::json& j, ReaderConfig& out);
Status load_config(const std::string& path, ReaderConfig& out);

/** 이벤트 로그/데몬 출력용 */
void to_json(nlohmann::json& j, const TagDetection& d);

} // namespace uhf
