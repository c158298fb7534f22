#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <functional>


// 바이트 배열 별칭
using bytes = std::vector<uint8_t>;


// 시간 타입 (데드라인/디바운스 계산에 사용)
using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using Millis = std::chrono::milliseconds;


namespace uhf {

/**
* TagDetection
* - 폴링 응답 1건을 디코드한 결과. 생성 후 변경하지 않는다.
* - RSSI는 디바이스 단위(0.1 dBm)를 디코드 경계에서 float dBm으로 변환.
*/
struct TagDetection {
	bytes epc; ///< 태그 식별자(보통 12바이트)
	std::string epc_hex; ///< 대문자 헥스
	float rssi_dbm = 0.0f; ///< 수신 세기(dBm)
	uint8_t antenna = 0; ///< 안테나 번호
	uint8_t channel = 0; ///< 주파수 채널
	uint8_t pc[2] = { 0, 0 }; ///< Protocol Control
	uint8_t crc[2] = { 0, 0 };
	uint8_t length = 0; ///< 식별자 바이트 길이
	uint16_t sequence = 0; ///< 현재 인벤토리 세션 내 디바이스 순번
};

} // namespace uhf


// 헥스 문자열 유틸 (로그/식별자 표시용)
inline std::string hex(const bytes& v) {
	static const char* k = "0123456789ABCDEF";
	std::string s; s.reserve(v.size() * 2);
	for (auto b : v) { s.push_back(k[b >> 4]); s.push_back(k[b & 0xF]); }
	return s;
}

// "E2 00-34.." 같은 구분자 허용, 홀수 길이/비헥스 문자는 실패
inline std::optional<bytes> unhex(const std::string& s) {
	bytes out; int hi = -1;
	for (char c : s) {
		int v;
		if (c >= '0' && c <= '9') v = c - '0';
		else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
		else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
		else if (c == ' ' || c == ':' || c == '-') continue;
		else return std::nullopt;
		if (hi < 0) hi = v;
		else { out.push_back((uint8_t)((hi << 4) | v)); hi = -1; }
	}
	if (hi >= 0) return std::nullopt;
	return out;
}
