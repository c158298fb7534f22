#pragma once
#include "common.hpp"
#include <cstddef>

namespace uhf {

// 전방선언
struct Adapter;
using AdapterHandle = void*;

// 백엔드 종류
enum uhf_device_t {
    UHF_DEVICE_DEBUG = 0,   // 메모리 내 스크립트 디바이스(테스트)
    UHF_DEVICE_CFAPI = 1,   // 벤더 libCFApi
};

// 드라이버 명령 ID (인자/출력 레이아웃은 rfid_msg.hpp)
enum uhf_cmd_t : uint16_t {
    UHF_CMD_OPEN = 0,           // 스크립트용 의사 명령(open 결과)
    UHF_CMD_INVENTORY_START,
    UHF_CMD_POLL_TAG,
    UHF_CMD_INVENTORY_STOP,
    UHF_CMD_GET_POWER,
    UHF_CMD_SET_POWER,
    UHF_CMD_GET_PARAMS,
    UHF_CMD_SET_PARAMS,
    UHF_CMD_READ_MEMORY,
    UHF_CMD_WRITE_MEMORY,
    UHF_CMD_LOCK_TAG,
    UHF_CMD_KILL_TAG,
    UHF_CMD_GET_ANTENNA,
    UHF_CMD_SET_ANTENNA,
    UHF_CMD_GET_Q,
    UHF_CMD_SET_Q,
    UHF_CMD_GET_INFO,
    UHF_CMD_BUZZER_ENABLE,
    UHF_CMD_BUZZER_DISABLE,
    UHF_CMD_RELAY_CLOSE,
    UHF_CMD_RELAY_RELEASE,
    UHF_CMD_SET_SELECT_MASK,
    UHF_CMD_COUNT
};

const char* command_name(uint16_t cmd);

/** 접속 대상: 시리얼(path+baud) 또는 네트워크(host+port) */
struct Endpoint {
    enum class Kind : uint8_t { Serial, Network };
    Kind kind = Kind::Serial;
    std::string path;          ///< "/dev/ttyUSB0"
    uint32_t baud = 115200;
    std::string host;          ///< "192.168.1.200"
    uint16_t port = 0;

    static Endpoint serial(const std::string& p, uint32_t b) {
        Endpoint e; e.kind = Kind::Serial; e.path = p; e.baud = b; return e;
    }
    static Endpoint network(const std::string& h, uint16_t pt) {
        Endpoint e; e.kind = Kind::Network; e.host = h; e.port = pt; return e;
    }
    std::string describe() const {
        return kind == Kind::Serial ? path + "@" + std::to_string(baud)
                                    : host + ":" + std::to_string(port);
    }
};

// 가상 테이블. 반환값은 모두 벤더 32-bit 상태 코드.
struct AdapterVTable {
    uint32_t (*probe)(Adapter* self);

    uint32_t (*open)(Adapter* self, const Endpoint* ep, uint32_t timeout_ms, AdapterHandle* out_handle);
    void     (*close)(Adapter* self, AdapterHandle handle);

    // 블로킹 호출, 재진입 불가 (Session이 직렬화)
    uint32_t (*invoke)(Adapter* self, AdapterHandle handle, uint16_t cmd,
                       const uint8_t* args, size_t args_len, bytes* out);

    void (*destroy)(Adapter* self);
};

// 어댑터 본체
struct Adapter {
    const AdapterVTable* v;
    void* priv;
};

// 팩토리: 해당 백엔드가 빌드되지 않았으면 nullptr
Adapter* create_adapter(uhf_device_t device);
Adapter* create_debug_adapter();
Adapter* create_cfapi_adapter();

inline void destroy_adapter(Adapter* a) {
    if (a && a->v && a->v->destroy) a->v->destroy(a);
}

} // namespace uhf
