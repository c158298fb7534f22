#pragma once
#include <cstdint>

namespace uhf {

// ===== 벤더 상태 코드 (32-bit) =====
enum : uint32_t {
    STAT_OK = 0x00000000,

    STAT_PORT_HANDLE_ERR = 0xFFFFFF01,
    STAT_PORT_OPEN_FAILED = 0xFFFFFF02,
    STAT_DLL_INNER_FAILED = 0xFFFFFF03,
    STAT_CMD_PARAM_ERR = 0xFFFFFF04,
    STAT_SERIAL_NUM_EXIT = 0xFFFFFF05,
    STAT_CMD_INNER_ERR = 0xFFFFFF06,
    STAT_CMD_INVENTORY_STOP = 0xFFFFFF07, // 인벤토리 종료(에러 아님)
    STAT_TAG_NO_RESP = 0xFFFFFF08,
    STAT_DECODE_TAG_DATA_FAIL = 0xFFFFFF09,
    STAT_CODE_OVERFLOW = 0xFFFFFF0A,
    STAT_AUTH_FAIL = 0xFFFFFF0B,
    STAT_PWD_ERR = 0xFFFFFF0C,
    STAT_SAM_NO_RESP = 0xFFFFFF0D,
    STAT_SAM_CMD_FAIL = 0xFFFFFF0E,
    STAT_RESP_FORMAT_ERR = 0xFFFFFF0F,
    STAT_HAS_MORE_DATA = 0xFFFFFF10,
    STAT_BUF_OVERFLOW = 0xFFFFFF11,
    STAT_COMM_TIMEOUT = 0xFFFFFF12, // 아직 태그 없음(에러 아님)
    STAT_COMM_WR_FAILED = 0xFFFFFF13,
    STAT_COMM_RD_FAILED = 0xFFFFFF14,
    STAT_NOMORE_DATA = 0xFFFFFF15,
    STAT_DLL_UNCONNECT = 0xFFFFFF16,
    STAT_DLL_DISCONNECT = 0xFFFFFF17,
    STAT_RESP_CRC_ERR = 0xFFFFFF18,

    // 태그 응답 상태
    STAT_TAG_OTHER_ERR = 0xFFFFFF40,
    STAT_TAG_NOT_EXIST = 0xFFFFFF41,
    STAT_TAG_BEEN_LOCKED = 0xFFFFFF42,
    STAT_TAG_LOW_POWER = 0xFFFFFF43,
    STAT_TAG_UNKNOWN_ERR = 0xFFFFFF44,
    STAT_TAG_WRITE_ERR = 0xFFFFFF45,
    STAT_TAG_CMD_UNSUPPORT = 0xFFFFFF46,
    STAT_TAG_SELECT_FAIL = 0xFFFFFF50,
    STAT_TAG_ACCESS_FAIL = 0xFFFFFF51,
    STAT_TAG_READ_FAIL = 0xFFFFFF52,
    STAT_TAG_WRITE_FAIL = 0xFFFFFF53,
    STAT_TAG_LOCK_FAIL = 0xFFFFFF54,
    STAT_TAG_KILL_FAIL = 0xFFFFFF55,
    STAT_TAG_BLOCK_ERASE_FAIL = 0xFFFFFF56,
    STAT_TAG_BLOCK_PERMALOCK_FAIL = 0xFFFFFF57,
    STAT_TAG_UNTRACEABLE_FAIL = 0xFFFFFF58,
    STAT_TAG_AUTH_FAIL = 0xFFFFFF59,
    STAT_TAG_CRYPTO_FAIL = 0xFFFFFF5A,
    STAT_TAG_KEY_UPDATE_FAIL = 0xFFFFFF5B,
    STAT_TAG_FILE_OPEN_FAIL = 0xFFFFFF5C,
    STAT_TAG_MEM_OVERRUN = 0xFFFFFF5D,
};

/** 드라이버 호출 결과 분류. Fault만 실패로 전파된다. */
enum class Outcome : uint8_t {
    Success,
    EmptyOrStopped, ///< 인벤토리가 자연 종료/데이터 없음
    Timeout,        ///< 아직 태그 없음
    Fault           ///< 예상치 못한 코드(알 수 없는 코드 포함)
};

/** 바인딩이 부호 있는 값으로 넘겨도 하위 32비트만 본다 */
inline constexpr uint32_t normalize_status(int64_t raw) {
    return static_cast<uint32_t>(static_cast<uint64_t>(raw) & 0xFFFFFFFFu);
}

Outcome classify(int64_t raw);
const char* status_name(int64_t raw);  ///< 벤더 상수명, 모르면 "UNKNOWN"
const char* outcome_name(Outcome o);

inline bool is_recoverable(Outcome o) {
    return o == Outcome::EmptyOrStopped || o == Outcome::Timeout;
}

} // namespace uhf
