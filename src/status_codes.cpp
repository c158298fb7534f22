#include "status_codes.hpp"
#include <cstddef>

namespace uhf {
namespace {

struct StatusEntry {
    uint32_t code;
    Outcome outcome;
    const char* name;
};

// 코드 → 결과 매핑 테이블. 여기 없는 코드는 Fault.
constexpr StatusEntry kStatusTable[] = {
    { STAT_OK,                       Outcome::Success,        "OK" },
    { STAT_PORT_HANDLE_ERR,          Outcome::Fault,          "PORT_HANDLE_ERR" },
    { STAT_PORT_OPEN_FAILED,         Outcome::Fault,          "PORT_OPEN_FAILED" },
    { STAT_DLL_INNER_FAILED,         Outcome::Fault,          "DLL_INNER_FAILED" },
    { STAT_CMD_PARAM_ERR,            Outcome::Fault,          "CMD_PARAM_ERR" },
    { STAT_SERIAL_NUM_EXIT,          Outcome::Fault,          "SERIAL_NUM_EXIT" },
    { STAT_CMD_INNER_ERR,            Outcome::Fault,          "CMD_INNER_ERR" },
    { STAT_CMD_INVENTORY_STOP,       Outcome::EmptyOrStopped, "CMD_INVENTORY_STOP" },
    { STAT_TAG_NO_RESP,              Outcome::Fault,          "TAG_NO_RESP" },
    { STAT_DECODE_TAG_DATA_FAIL,     Outcome::Fault,          "DECODE_TAG_DATA_FAIL" },
    { STAT_CODE_OVERFLOW,            Outcome::Fault,          "CODE_OVERFLOW" },
    { STAT_AUTH_FAIL,                Outcome::Fault,          "AUTH_FAIL" },
    { STAT_PWD_ERR,                  Outcome::Fault,          "PWD_ERR" },
    { STAT_SAM_NO_RESP,              Outcome::Fault,          "SAM_NO_RESP" },
    { STAT_SAM_CMD_FAIL,             Outcome::Fault,          "SAM_CMD_FAIL" },
    { STAT_RESP_FORMAT_ERR,          Outcome::Fault,          "RESP_FORMAT_ERR" },
    { STAT_HAS_MORE_DATA,            Outcome::Fault,          "HAS_MORE_DATA" },
    { STAT_BUF_OVERFLOW,             Outcome::Fault,          "BUF_OVERFLOW" },
    { STAT_COMM_TIMEOUT,             Outcome::Timeout,        "COMM_TIMEOUT" },
    { STAT_COMM_WR_FAILED,           Outcome::Fault,          "COMM_WR_FAILED" },
    { STAT_COMM_RD_FAILED,           Outcome::Fault,          "COMM_RD_FAILED" },
    { STAT_NOMORE_DATA,              Outcome::EmptyOrStopped, "NOMORE_DATA" },
    { STAT_DLL_UNCONNECT,            Outcome::Fault,          "DLL_UNCONNECT" },
    { STAT_DLL_DISCONNECT,           Outcome::Fault,          "DLL_DISCONNECT" },
    { STAT_RESP_CRC_ERR,             Outcome::Fault,          "RESP_CRC_ERR" },
    { STAT_TAG_OTHER_ERR,            Outcome::Fault,          "TAG_OTHER_ERR" },
    { STAT_TAG_NOT_EXIST,            Outcome::Fault,          "TAG_NOT_EXIST" },
    { STAT_TAG_BEEN_LOCKED,          Outcome::Fault,          "TAG_BEEN_LOCKED" },
    { STAT_TAG_LOW_POWER,            Outcome::Fault,          "TAG_LOW_POWER" },
    { STAT_TAG_UNKNOWN_ERR,          Outcome::Fault,          "TAG_UNKNOWN_ERR" },
    { STAT_TAG_WRITE_ERR,            Outcome::Fault,          "TAG_WRITE_ERR" },
    { STAT_TAG_CMD_UNSUPPORT,        Outcome::Fault,          "TAG_CMD_UNSUPPORT" },
    { STAT_TAG_SELECT_FAIL,          Outcome::Fault,          "TAG_SELECT_FAIL" },
    { STAT_TAG_ACCESS_FAIL,          Outcome::Fault,          "TAG_ACCESS_FAIL" },
    { STAT_TAG_READ_FAIL,            Outcome::Fault,          "TAG_READ_FAIL" },
    { STAT_TAG_WRITE_FAIL,           Outcome::Fault,          "TAG_WRITE_FAIL" },
    { STAT_TAG_LOCK_FAIL,            Outcome::Fault,          "TAG_LOCK_FAIL" },
    { STAT_TAG_KILL_FAIL,            Outcome::Fault,          "TAG_KILL_FAIL" },
    { STAT_TAG_BLOCK_ERASE_FAIL,     Outcome::Fault,          "TAG_BLOCK_ERASE_FAIL" },
    { STAT_TAG_BLOCK_PERMALOCK_FAIL, Outcome::Fault,          "TAG_BLOCK_PERMALOCK_FAIL" },
    { STAT_TAG_UNTRACEABLE_FAIL,     Outcome::Fault,          "TAG_UNTRACEABLE_FAIL" },
    { STAT_TAG_AUTH_FAIL,            Outcome::Fault,          "TAG_AUTH_FAIL" },
    { STAT_TAG_CRYPTO_FAIL,          Outcome::Fault,          "TAG_CRYPTO_FAIL" },
    { STAT_TAG_KEY_UPDATE_FAIL,      Outcome::Fault,          "TAG_KEY_UPDATE_FAIL" },
    { STAT_TAG_FILE_OPEN_FAIL,       Outcome::Fault,          "TAG_FILE_OPEN_FAIL" },
    { STAT_TAG_MEM_OVERRUN,          Outcome::Fault,          "TAG_MEM_OVERRUN" },
};

const StatusEntry* find_entry(uint32_t code) {
    for (const auto& e : kStatusTable)
        if (e.code == code) return &e;
    return nullptr;
}

} // namespace

Outcome classify(int64_t raw) {
    const StatusEntry* e = find_entry(normalize_status(raw));
    return e ? e->outcome : Outcome::Fault;
}

const char* status_name(int64_t raw) {
    const StatusEntry* e = find_entry(normalize_status(raw));
    return e ? e->name : "UNKNOWN";
}

const char* outcome_name(Outcome o) {
    switch (o) {
    case Outcome::Success: return "Success";
    case Outcome::EmptyOrStopped: return "EmptyOrStopped";
    case Outcome::Timeout: return "Timeout";
    case Outcome::Fault: return "Fault";
    }
    return "Fault";
}

} // namespace uhf
