// libCFApi(벤더 SDK) 바인딩. CMake가 CFApi.h/libCFApi를 찾았을 때만 빌드된다.
#include "adapter.hpp"
#include "rfid_msg.hpp"
#include "status_codes.hpp"
#include <CFApi.h>
#include <cstring>
#include <new>
#include <vector>

namespace uhf {

struct CfapiChannel {
    int64_t h = 0;
};

static inline uint32_t st(int r) { return normalize_status(r); }

static uint32_t cf_probe(Adapter* /*self*/) {
    return STAT_OK;
}

static uint32_t cf_open(Adapter* /*self*/, const Endpoint* ep, uint32_t timeout_ms, AdapterHandle* out) {
    if (!ep || !out) return STAT_PORT_HANDLE_ERR;
    auto* ch = new (std::nothrow) CfapiChannel();
    if (!ch) return STAT_DLL_INNER_FAILED;

    int r;
    if (ep->kind == Endpoint::Kind::Serial) {
        std::vector<char> port(ep->path.begin(), ep->path.end());
        port.push_back('\0');
        r = OpenDevice(&ch->h, port.data(), (int)ep->baud);
    } else {
        std::vector<char> ip(ep->host.begin(), ep->host.end());
        ip.push_back('\0');
        r = OpenNetConnection(&ch->h, ip.data(), ep->port, (long)timeout_ms);
    }
    if (st(r) != STAT_OK) {
        delete ch;
        return st(r);
    }
    *out = (AdapterHandle)ch;
    return STAT_OK;
}

static void cf_close(Adapter* /*self*/, AdapterHandle h) {
    auto* ch = (CfapiChannel*)h;
    if (!ch) return;
    (void)CloseDevice(ch->h);
    delete ch;
}

static uint32_t get_params(int64_t h, DevicePara& p) {
    std::memset(&p, 0, sizeof(p));
    return st(GetDevicePara(h, &p));
}

static bytes params_to_bytes(const DevicePara& p) {
    return bytes((const uint8_t*)&p, (const uint8_t*)&p + sizeof(DevicePara));
}

static uint32_t cf_invoke(Adapter* /*self*/, AdapterHandle hh, uint16_t cmd,
                          const uint8_t* args, size_t len, bytes* out) {
    auto* ch = (CfapiChannel*)hh;
    if (!ch || !out) return STAT_PORT_HANDLE_ERR;
    out->clear();
    const int64_t h = ch->h;
    static_assert(sizeof(DevicePara) == DeviceParams::kWireSize, "DevicePara layout");

    switch (cmd) {
    case UHF_CMD_INVENTORY_START: {
        auto a = UNPACK::inventory_start(args, len);
        if (!a) return STAT_CMD_PARAM_ERR;
        return st(InventoryContinue(h, a->first, (unsigned long)a->second));
    }
    case UHF_CMD_POLL_TAG: {
        TagInfo info; std::memset(&info, 0, sizeof(info));
        uint32_t r = st(GetTagUii(h, &info, UNPACK::timeout(args, len, 0)));
        if (r != STAT_OK) return r;
        RawTag t;
        t.no = info.NO; t.rssi = info.rssi; t.antenna = info.antenna; t.channel = info.channel;
        std::memcpy(t.crc, info.crc, 2); std::memcpy(t.pc, info.pc, 2);
        t.code.assign(info.code, info.code + info.codeLen);
        *out = PACK::tag(t);
        return STAT_OK;
    }
    case UHF_CMD_INVENTORY_STOP:
        return st(InventoryStop(h, UNPACK::timeout(args, len, 0)));

    case UHF_CMD_GET_POWER: {
        unsigned char p = 0, rsv = 0;
        uint32_t r = st(GetRFPower(h, &p, &rsv));
        if (r == STAT_OK) *out = PACK::u8_pair(p, rsv);
        return r;
    }
    case UHF_CMD_SET_POWER:
        if (len < 1) return STAT_CMD_PARAM_ERR;
        return st(SetRFPower(h, args[0], len > 1 ? args[1] : 0));

    case UHF_CMD_GET_PARAMS: {
        DevicePara p;
        uint32_t r = get_params(h, p);
        if (r == STAT_OK) *out = params_to_bytes(p);
        return r;
    }
    case UHF_CMD_SET_PARAMS: {
        if (len < sizeof(DevicePara)) return STAT_CMD_PARAM_ERR;
        DevicePara p; std::memcpy(&p, args, sizeof(p));
        return st(SetDevicePara(h, p));
    }

    case UHF_CMD_READ_MEMORY: {
        auto req = UNPACK::memory_request(args, len);
        if (!req) return STAT_CMD_PARAM_ERR;
        uint32_t r = st(ReadTag(h, req->option, req->password.data(), (unsigned char)req->bank,
                                req->word_ptr, req->word_count));
        if (r != STAT_OK) return r;
        TagResp resp; std::memset(&resp, 0, sizeof(resp));
        unsigned char words = 0;
        unsigned char data[256] = {};
        r = st(GetReadTagResp(h, &resp, &words, data, req->timeout_ms));
        if (r == STAT_OK) out->assign(data, data + (size_t)words * 2);
        return r;
    }
    case UHF_CMD_WRITE_MEMORY: {
        auto req = UNPACK::memory_request(args, len);
        if (!req || len != MemoryRequest::kWireSize + (size_t)req->word_count * 2) return STAT_CMD_PARAM_ERR;
        std::vector<unsigned char> data(args + MemoryRequest::kWireSize, args + len);
        uint32_t r = st(WriteTag(h, req->option, req->password.data(), (unsigned char)req->bank,
                                 req->word_ptr, req->word_count, data.data()));
        if (r != STAT_OK) return r;
        TagResp resp; std::memset(&resp, 0, sizeof(resp));
        return st(GetTagResp(h, 0x0004, &resp, req->timeout_ms));
    }
    case UHF_CMD_LOCK_TAG: {
        if (len < 6) return STAT_CMD_PARAM_ERR;
        unsigned char pwd[4]; std::memcpy(pwd, args, 4);
        return st(LockTag(h, pwd, args[4], args[5]));
    }
    case UHF_CMD_KILL_TAG: {
        if (len < 4) return STAT_CMD_PARAM_ERR;
        unsigned char pwd[4]; std::memcpy(pwd, args, 4);
        return st(KillTag(h, pwd));
    }

    case UHF_CMD_GET_ANTENNA: {
        unsigned char mask = 0;
        uint32_t r = st(GetAntenna(h, &mask));
        if (r == STAT_OK) *out = PACK::u8(mask);
        return r;
    }
    case UHF_CMD_SET_ANTENNA: {
        if (len < 1) return STAT_CMD_PARAM_ERR;
        unsigned char mask = args[0];
        return st(SetAntenna(h, &mask));
    }
    case UHF_CMD_GET_Q: {
        unsigned char q = 0, rsv = 0;
        uint32_t r = st(GetCoilPRM(h, &q, &rsv));
        if (r == STAT_OK) *out = PACK::u8_pair(q, rsv);
        return r;
    }
    case UHF_CMD_SET_Q:
        if (len < 1) return STAT_CMD_PARAM_ERR;
        return st(SetCoilPRM(h, args[0], len > 1 ? args[1] : 0));

    case UHF_CMD_GET_INFO: {
        ::DeviceInfo info; std::memset(&info, 0, sizeof(info));
        uint32_t r = st(GetInfo(h, &info));
        if (r == STAT_OK) *out = PACK::info(info.firmVersion, info.hardVersion, info.SN, info.PARAS);
        return r;
    }

    // 부저 전용 명령이 SDK에 없으므로 파라미터 블록의 BUZZERTIME을 읽고-수정-쓰기
    case UHF_CMD_BUZZER_ENABLE:
    case UHF_CMD_BUZZER_DISABLE: {
        DevicePara p;
        uint32_t r = get_params(h, p);
        if (r != STAT_OK) return r;
        p.BUZZERTIME = (cmd == UHF_CMD_BUZZER_ENABLE && len) ? args[0] : 0;
        return st(SetDevicePara(h, p));
    }

    case UHF_CMD_RELAY_CLOSE:
        return st(Close_Relay(h, len ? args[0] : 0));
    case UHF_CMD_RELAY_RELEASE:
        return st(Release_Relay(h, len ? args[0] : 0));

    case UHF_CMD_SET_SELECT_MASK: {
        auto m = UNPACK::select_mask(args, len);
        if (!m) return STAT_CMD_PARAM_ERR;
        std::vector<unsigned char> data(m->mask.begin(), m->mask.end());
        data.push_back(0); // 해제(0비트)일 때도 유효한 버퍼
        return st(SetSelectMask(h, m->ptr_bits, m->bits, data.data()));
    }

    default:
        return STAT_CMD_PARAM_ERR;
    }
}

static void cf_destroy(Adapter* self) {
    delete self;
}

static AdapterVTable g_vtbl = {
    cf_probe,
    cf_open,
    cf_close,
    cf_invoke,
    cf_destroy
};

Adapter* create_cfapi_adapter() {
    auto* a = new (std::nothrow) Adapter();
    if (!a) return nullptr;
    a->v = &g_vtbl;
    a->priv = nullptr;
    return a;
}

} // namespace uhf
