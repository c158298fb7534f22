#include "adapter.hpp"

namespace uhf {

const char* command_name(uint16_t cmd) {
    switch (cmd) {
    case UHF_CMD_OPEN: return "OPEN";
    case UHF_CMD_INVENTORY_START: return "INVENTORY_START";
    case UHF_CMD_POLL_TAG: return "POLL_TAG";
    case UHF_CMD_INVENTORY_STOP: return "INVENTORY_STOP";
    case UHF_CMD_GET_POWER: return "GET_POWER";
    case UHF_CMD_SET_POWER: return "SET_POWER";
    case UHF_CMD_GET_PARAMS: return "GET_PARAMS";
    case UHF_CMD_SET_PARAMS: return "SET_PARAMS";
    case UHF_CMD_READ_MEMORY: return "READ_MEMORY";
    case UHF_CMD_WRITE_MEMORY: return "WRITE_MEMORY";
    case UHF_CMD_LOCK_TAG: return "LOCK_TAG";
    case UHF_CMD_KILL_TAG: return "KILL_TAG";
    case UHF_CMD_GET_ANTENNA: return "GET_ANTENNA";
    case UHF_CMD_SET_ANTENNA: return "SET_ANTENNA";
    case UHF_CMD_GET_Q: return "GET_Q";
    case UHF_CMD_SET_Q: return "SET_Q";
    case UHF_CMD_GET_INFO: return "GET_INFO";
    case UHF_CMD_BUZZER_ENABLE: return "BUZZER_ENABLE";
    case UHF_CMD_BUZZER_DISABLE: return "BUZZER_DISABLE";
    case UHF_CMD_RELAY_CLOSE: return "RELAY_CLOSE";
    case UHF_CMD_RELAY_RELEASE: return "RELAY_RELEASE";
    case UHF_CMD_SET_SELECT_MASK: return "SET_SELECT_MASK";
    default: return "?";
    }
}

#ifndef UHF_HAVE_CFAPI
// 벤더 라이브러리 없이 빌드된 경우
Adapter* create_cfapi_adapter() { return nullptr; }
#endif

Adapter* create_adapter(uhf_device_t device) {
    switch (device) {
    case UHF_DEVICE_DEBUG: return create_debug_adapter();
    case UHF_DEVICE_CFAPI: return create_cfapi_adapter();
    }
    return nullptr;
}

} // namespace uhf
