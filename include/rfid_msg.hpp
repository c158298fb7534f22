#pragma once
#include "common.hpp"
#include <array>
#include <cstring>

namespace uhf {

// ===== 태그 메모리/잠금/설정 값 =====
enum class MemoryBank : uint8_t { Reserved = 0x00, Epc = 0x01, Tid = 0x02, User = 0x03 };
enum class LockAction : uint8_t { Unlock = 0x00, Lock = 0x01, PermanentUnlock = 0x02, PermanentLock = 0x03 };
enum class LockArea : uint8_t { KillPassword = 0x00, AccessPassword = 0x01, Epc = 0x02, Tid = 0x03, User = 0x04 };
enum class Region : uint8_t { FCC = 0x01, ETSI = 0x02, CHN = 0x03, KOREA = 0x04, JAPAN = 0x05, OPEN = 0x06 };
enum class WorkMode : uint8_t { Command = 0x00, Auto = 0x01, Trigger = 0x02, Wiegand = 0x03 };

using Password = std::array<uint8_t, 4>;

/**
* DeviceParams
* - 디바이스 파라미터 블록 전체(25B). 와이어에는 부분 설정 명령이 없으므로
*   항상 통째로 읽고-수정-쓰기 한다. 필드 순서 = 와이어 순서.
*/
struct DeviceParams {
	uint8_t address = 0;
	uint8_t protocol = 0;
	uint8_t work_mode = 0;
	uint8_t interface = 0;
	uint8_t baud_code = 0;
	uint8_t wiegand = 0;
	uint8_t antenna = 1;
	uint8_t region = 0;
	uint8_t start_freq_int[2] = { 0, 0 };
	uint8_t start_freq_dec[2] = { 0, 0 };
	uint8_t step_freq[2] = { 0, 0 };
	uint8_t channel_count = 0;
	uint8_t power = 0;
	uint8_t inventory_area = 0;
	uint8_t q_value = 0;
	uint8_t session = 0;
	uint8_t access_addr = 0;
	uint8_t access_len = 0;
	uint8_t filter_time = 0;
	uint8_t trigger_time = 0;
	uint8_t buzzer_time = 0;
	uint8_t interval_time = 0;

	static constexpr size_t kWireSize = 25;
};

/** 디바이스 정보 (버전 문자열은 NUL에서 절단) */
struct DeviceInfo {
	std::string firmware;
	std::string hardware;
	bytes serial; ///< SN 12B
	bytes paras;  ///< 12B
};

/** 메모리 읽기/쓰기 요청 공통부 */
struct MemoryRequest {
	uint8_t option = 0x00;          ///< 0x00: 매칭 생략
	Password password{ { 0, 0, 0, 0 } };
	MemoryBank bank = MemoryBank::Epc;
	uint16_t word_ptr = 0;
	uint8_t word_count = 0;
	uint16_t timeout_ms = 0;

	static constexpr size_t kWireSize = 11;
};

/**
* SelectMask
* - 인벤토리 선택 필터. ptr_bits는 EPC 뱅크 비트 주소(CRC 16 + PC 16 뒤, EPC는 32부터).
* - bits == 0 이면 필터 해제.
*/
struct SelectMask {
	uint16_t ptr_bits = 0;
	uint8_t bits = 0;
	bytes mask;

	static constexpr uint16_t kEpcStartBit = 32;
};

/** 폴링 응답 원본 필드(디바이스 단위 그대로) */
struct RawTag {
	uint16_t no = 0;
	int16_t rssi = 0; ///< 0.1 dBm
	uint8_t antenna = 0;
	uint8_t channel = 0;
	uint8_t crc[2] = { 0, 0 };
	uint8_t pc[2] = { 0, 0 };
	bytes code;
};

static constexpr size_t kTagHeaderSize = 11;
static constexpr size_t kInfoWireSize = 32 + 32 + 12 + 12;


// ===== 리틀엔디언 헬퍼 =====
inline void put_u16(bytes& b, uint16_t v) { b.push_back((uint8_t)(v & 0xFF)); b.push_back((uint8_t)(v >> 8)); }
inline void put_u32(bytes& b, uint32_t v) { for (int i = 0; i < 4; i++) b.push_back((uint8_t)((v >> (8 * i)) & 0xFF)); }
inline uint16_t get_u16(const uint8_t* p) { return (uint16_t)(p[0] | (p[1] << 8)); }
inline uint32_t get_u32(const uint8_t* p) { return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24); }

inline std::string fixed_str(const uint8_t* p, size_t n) {
	size_t len = 0; while (len < n && p[len] != 0) ++len;
	return std::string((const char*)p, len);
}


// === Pack(호스트 → 드라이버 인자, 디바이스 → 출력)/Unpack 헬퍼 ===
namespace PACK {
	inline bytes inventory_start(uint8_t count, uint32_t param) {
		bytes b; b.push_back(count); put_u32(b, param); return b;
	}
	inline bytes timeout(uint16_t ms) { bytes b; put_u16(b, ms); return b; }
	inline bytes u8_pair(uint8_t v, uint8_t reserved = 0) { return bytes{ v, reserved }; }
	inline bytes u8(uint8_t v) { return bytes{ v }; }

	inline bytes params(const DeviceParams& p) {
		bytes b; b.reserve(DeviceParams::kWireSize);
		b.push_back(p.address); b.push_back(p.protocol); b.push_back(p.work_mode); b.push_back(p.interface);
		b.push_back(p.baud_code); b.push_back(p.wiegand); b.push_back(p.antenna); b.push_back(p.region);
		b.push_back(p.start_freq_int[0]); b.push_back(p.start_freq_int[1]);
		b.push_back(p.start_freq_dec[0]); b.push_back(p.start_freq_dec[1]);
		b.push_back(p.step_freq[0]); b.push_back(p.step_freq[1]);
		b.push_back(p.channel_count); b.push_back(p.power); b.push_back(p.inventory_area); b.push_back(p.q_value);
		b.push_back(p.session); b.push_back(p.access_addr); b.push_back(p.access_len); b.push_back(p.filter_time);
		b.push_back(p.trigger_time); b.push_back(p.buzzer_time); b.push_back(p.interval_time);
		return b;
	}

	inline bytes memory_request(const MemoryRequest& r) {
		bytes b; b.reserve(MemoryRequest::kWireSize);
		b.push_back(r.option);
		b.insert(b.end(), r.password.begin(), r.password.end());
		b.push_back((uint8_t)r.bank);
		put_u16(b, r.word_ptr);
		b.push_back(r.word_count);
		put_u16(b, r.timeout_ms);
		return b;
	}
	inline bytes write_memory(const MemoryRequest& r, const bytes& data) {
		bytes b = memory_request(r); b.insert(b.end(), data.begin(), data.end()); return b;
	}

	inline bytes lock(const Password& pwd, LockArea area, LockAction action) {
		bytes b(pwd.begin(), pwd.end()); b.push_back((uint8_t)area); b.push_back((uint8_t)action); return b;
	}
	inline bytes kill(const Password& pwd) { return bytes(pwd.begin(), pwd.end()); }
	inline bytes select_mask(const SelectMask& m) {
		bytes b; put_u16(b, m.ptr_bits); b.push_back(m.bits);
		b.insert(b.end(), m.mask.begin(), m.mask.end()); return b;
	}

	inline bytes tag(const RawTag& t) {
		bytes b; b.reserve(kTagHeaderSize + t.code.size());
		put_u16(b, t.no); put_u16(b, (uint16_t)t.rssi);
		b.push_back(t.antenna); b.push_back(t.channel);
		b.push_back(t.crc[0]); b.push_back(t.crc[1]);
		b.push_back(t.pc[0]); b.push_back(t.pc[1]);
		b.push_back((uint8_t)t.code.size());
		b.insert(b.end(), t.code.begin(), t.code.end());
		return b;
	}

	inline bytes info(const uint8_t firm[32], const uint8_t hard[32], const uint8_t sn[12], const uint8_t paras[12]) {
		bytes b; b.reserve(kInfoWireSize);
		b.insert(b.end(), firm, firm + 32); b.insert(b.end(), hard, hard + 32);
		b.insert(b.end(), sn, sn + 12); b.insert(b.end(), paras, paras + 12);
		return b;
	}
}


namespace UNPACK {
	/** 폴링 응답 → TagDetection. RSSI는 여기서 dBm으로 변환. */
	inline std::optional<TagDetection> tag(const bytes& b) {
		if (b.size() < kTagHeaderSize) return std::nullopt;
		uint8_t len = b[10];
		if (b.size() < kTagHeaderSize + len) return std::nullopt;
		TagDetection d;
		d.sequence = get_u16(&b[0]);
		d.rssi_dbm = (float)(int16_t)get_u16(&b[2]) / 10.0f;
		d.antenna = b[4]; d.channel = b[5];
		d.crc[0] = b[6]; d.crc[1] = b[7];
		d.pc[0] = b[8]; d.pc[1] = b[9];
		d.length = len;
		d.epc.assign(b.begin() + kTagHeaderSize, b.begin() + kTagHeaderSize + len);
		d.epc_hex = hex(d.epc);
		return d;
	}

	inline std::optional<DeviceParams> params(const bytes& b) {
		if (b.size() < DeviceParams::kWireSize) return std::nullopt;
		DeviceParams p; const uint8_t* s = b.data();
		p.address = s[0]; p.protocol = s[1]; p.work_mode = s[2]; p.interface = s[3];
		p.baud_code = s[4]; p.wiegand = s[5]; p.antenna = s[6]; p.region = s[7];
		p.start_freq_int[0] = s[8]; p.start_freq_int[1] = s[9];
		p.start_freq_dec[0] = s[10]; p.start_freq_dec[1] = s[11];
		p.step_freq[0] = s[12]; p.step_freq[1] = s[13];
		p.channel_count = s[14]; p.power = s[15]; p.inventory_area = s[16]; p.q_value = s[17];
		p.session = s[18]; p.access_addr = s[19]; p.access_len = s[20]; p.filter_time = s[21];
		p.trigger_time = s[22]; p.buzzer_time = s[23]; p.interval_time = s[24];
		return p;
	}

	inline std::optional<DeviceInfo> info(const bytes& b) {
		if (b.size() < kInfoWireSize) return std::nullopt;
		DeviceInfo i;
		i.firmware = fixed_str(&b[0], 32);
		i.hardware = fixed_str(&b[32], 32);
		i.serial.assign(b.begin() + 64, b.begin() + 76);
		i.paras.assign(b.begin() + 76, b.begin() + 88);
		return i;
	}

	inline std::optional<MemoryRequest> memory_request(const uint8_t* p, size_t n) {
		if (n < MemoryRequest::kWireSize) return std::nullopt;
		MemoryRequest r;
		r.option = p[0];
		std::memcpy(r.password.data(), p + 1, 4);
		r.bank = (MemoryBank)p[5];
		r.word_ptr = get_u16(p + 6);
		r.word_count = p[8];
		r.timeout_ms = get_u16(p + 9);
		return r;
	}

	inline std::optional<SelectMask> select_mask(const uint8_t* p, size_t n) {
		if (n < 3) return std::nullopt;
		SelectMask m;
		m.ptr_bits = get_u16(p);
		m.bits = p[2];
		m.mask.assign(p + 3, p + n);
		if (m.mask.size() * 8 < m.bits) return std::nullopt;
		return m;
	}

	inline std::optional<std::pair<uint8_t, uint32_t>> inventory_start(const uint8_t* p, size_t n) {
		if (n < 5) return std::nullopt; return std::make_pair(p[0], get_u32(p + 1));
	}
	inline uint16_t timeout(const uint8_t* p, size_t n, uint16_t def) {
		return n >= 2 ? get_u16(p) : def;
	}
}

} // namespace uhf
