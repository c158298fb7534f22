#include "range_map.hpp"
#include <algorithm>

namespace uhf {
namespace {

// 1m ~ 10m
constexpr uint8_t kPowerByMeter[10] = { 5, 8, 12, 16, 20, 23, 26, 28, 30, 30 };
constexpr uint8_t kDevicePowerMax = 30;

uint8_t clamp_power(int p, uint8_t max_power) {
	int hi = std::min<int>(max_power, kDevicePowerMax);
	return (uint8_t)std::max(0, std::min(p, hi));
}

} // namespace

uint8_t range_to_power(int distance_bucket, uint8_t max_power) {
	int b = std::max(1, std::min(distance_bucket, 10));
	return clamp_power(kPowerByMeter[b - 1], max_power);
}

uint8_t preset_power(RangePreset preset, uint8_t max_power) {
	switch (preset) {
	case RangePreset::Short: return clamp_power(10, max_power);
	case RangePreset::Medium: return clamp_power(20, max_power);
	case RangePreset::Long: return clamp_power(30, max_power);
	}
	return clamp_power(20, max_power);
}

std::optional<RangePreset> parse_range_preset(const std::string& name) {
	if (name == "short") return RangePreset::Short;
	if (name == "medium") return RangePreset::Medium;
	if (name == "long") return RangePreset::Long;
	return std::nullopt;
}

const char* range_preset_name(RangePreset preset) {
	switch (preset) {
	case RangePreset::Short: return "short";
	case RangePreset::Medium: return "medium";
	case RangePreset::Long: return "long";
	}
	return "medium";
}

} // namespace uhf
