#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace uhf {

enum class RangePreset : uint8_t { Short, Medium, Long };

/// 거리 버킷(1~10m, 범위 밖은 클램프) → 출력 레벨. 단조 비감소.
uint8_t range_to_power(int distance_bucket, uint8_t max_power = 30);

/// short=10, medium=20, long=30 (max_power로 클램프)
uint8_t preset_power(RangePreset preset, uint8_t max_power = 30);

std::optional<RangePreset> parse_range_preset(const std::string& name);
const char* range_preset_name(RangePreset preset);

} // namespace uhf
