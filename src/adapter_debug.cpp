#include "debug_adapter.hpp"
#include "status_codes.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <new>

namespace uhf {

// 디바이스 핸들(디버그용): 스크립트 큐 + 시뮬레이션 상태
struct DebugDevice {
    std::mutex m;
    std::condition_variable cv;

    std::map<uint16_t, std::deque<debug::Reply>> scripts;
    std::vector<uint16_t> log;
    size_t counts[UHF_CMD_COUNT] = {};

    bool opened = false;
    bool running = false;

    DeviceParams params;
    std::array<bytes, 4> banks;
    uint8_t buzzer_time = 0;
    bool relay_closed = false;
    SelectMask select;

    DebugDevice() {
        params.region = (uint8_t)Region::FCC;
        params.power = 26;
        params.q_value = 4;
        params.session = 1;
        params.antenna = 1;
        // Reserved: kill pwd + access pwd
        banks[0] = bytes(8, 0x00);
        // EPC: CRC(2) PC(2) EPC(12)
        banks[1] = { 0x00, 0x00, 0x30, 0x00,
                     0xE2, 0x00, 0x00, 0x17, 0x22, 0x0A, 0x01, 0x23, 0x18, 0x50, 0x6A, 0x0F };
        banks[2] = { 0xE2, 0x80, 0x11, 0x00, 0x20, 0x00, 0x55, 0x43, 0x21, 0x0B, 0x00, 0x01 };
        banks[3] = bytes(32, 0x00);
    }
};

static DebugDevice* dev_of(Adapter* a) {
    return a ? static_cast<DebugDevice*>(a->priv) : nullptr;
}

// 스크립트 1건 꺼내기 (호출 측이 락 보유)
static bool pop_script(DebugDevice* d, uint16_t cmd, debug::Reply& out) {
    auto it = d->scripts.find(cmd);
    if (it == d->scripts.end() || it->second.empty()) return false;
    out = std::move(it->second.front());
    it->second.pop_front();
    return true;
}

// EPC 뱅크 이미지(CRC + PC + EPC)에서 ptr_bits부터 bits만큼 마스크와 비교
static bool mask_matches(const SelectMask& m, const TagDetection& t) {
    if (m.bits == 0) return true;
    bytes image{ t.crc[0], t.crc[1], t.pc[0], t.pc[1] };
    image.insert(image.end(), t.epc.begin(), t.epc.end());
    for (size_t i = 0; i < m.bits; ++i) {
        size_t at = (size_t)m.ptr_bits + i;
        if (at / 8 >= image.size()) return false;
        bool have = (image[at / 8] >> (7 - at % 8)) & 1;
        bool want = (m.mask[i / 8] >> (7 - i % 8)) & 1;
        if (have != want) return false;
    }
    return true;
}

// POLL_TAG 스크립트 꺼내기: 선택 마스크에 걸리지 않는 태그는 무선 구간에서 응답하지 않은 것으로 버림
static bool pop_poll(DebugDevice* d, debug::Reply& out) {
    while (pop_script(d, UHF_CMD_POLL_TAG, out)) {
        if (out.status != STAT_OK) return true;
        auto t = UNPACK::tag(out.out);
        if (!t || mask_matches(d->select, *t)) return true;
    }
    return false;
}

static bool has_script(DebugDevice* d, uint16_t cmd) {
    auto it = d->scripts.find(cmd);
    return it != d->scripts.end() && !it->second.empty();
}

static uint32_t dbg_probe(Adapter* self) {
    return dev_of(self) ? STAT_OK : STAT_DLL_INNER_FAILED;
}

static uint32_t dbg_open(Adapter* self, const Endpoint* ep, uint32_t /*timeout_ms*/, AdapterHandle* out) {
    auto* d = dev_of(self);
    if (!d || !ep || !out) return STAT_PORT_HANDLE_ERR;
    std::lock_guard<std::mutex> lk(d->m);
    d->counts[UHF_CMD_OPEN]++;
    debug::Reply r;
    if (pop_script(d, UHF_CMD_OPEN, r) && r.status != STAT_OK) return r.status;
    d->opened = true;
    d->running = false;
    *out = (AdapterHandle)d;
    return STAT_OK;
}

static void dbg_close(Adapter* /*self*/, AdapterHandle h) {
    auto* d = (DebugDevice*)h;
    if (!d) return;
    {
        std::lock_guard<std::mutex> lk(d->m);
        d->opened = false;
        d->running = false;
    }
    d->cv.notify_all();
}

static uint32_t simulate(DebugDevice* d, uint16_t cmd, const uint8_t* args, size_t len, bytes* out) {
    switch (cmd) {
    case UHF_CMD_INVENTORY_START:
        d->running = true;
        return STAT_OK;
    case UHF_CMD_INVENTORY_STOP:
        if (!d->running) return STAT_CMD_INVENTORY_STOP;
        d->running = false;
        return STAT_OK;
    case UHF_CMD_GET_POWER:
        *out = PACK::u8_pair(d->params.power);
        return STAT_OK;
    case UHF_CMD_SET_POWER:
        if (len < 1 || args[0] > 30) return STAT_CMD_PARAM_ERR;
        d->params.power = args[0];
        return STAT_OK;
    case UHF_CMD_GET_PARAMS:
        *out = PACK::params(d->params);
        return STAT_OK;
    case UHF_CMD_SET_PARAMS: {
        auto p = UNPACK::params(bytes(args, args + len));
        if (!p) return STAT_CMD_PARAM_ERR;
        d->params = *p;
        d->buzzer_time = p->buzzer_time;
        return STAT_OK;
    }
    case UHF_CMD_READ_MEMORY: {
        if (d->running) return STAT_CMD_INNER_ERR;
        auto r = UNPACK::memory_request(args, len);
        if (!r || (uint8_t)r->bank > 3) return STAT_CMD_PARAM_ERR;
        const bytes& bank = d->banks[(uint8_t)r->bank];
        size_t off = (size_t)r->word_ptr * 2, n = (size_t)r->word_count * 2;
        if (off + n > bank.size()) return STAT_TAG_MEM_OVERRUN;
        out->assign(bank.begin() + off, bank.begin() + off + n);
        return STAT_OK;
    }
    case UHF_CMD_WRITE_MEMORY: {
        if (d->running) return STAT_CMD_INNER_ERR;
        auto r = UNPACK::memory_request(args, len);
        if (!r || (uint8_t)r->bank > 3) return STAT_CMD_PARAM_ERR;
        size_t n = (size_t)r->word_count * 2;
        if (len != MemoryRequest::kWireSize + n) return STAT_CMD_PARAM_ERR;
        bytes& bank = d->banks[(uint8_t)r->bank];
        size_t off = (size_t)r->word_ptr * 2;
        if (bank.size() < off + n) bank.resize(off + n, 0x00);
        std::copy(args + MemoryRequest::kWireSize, args + len, bank.begin() + off);
        return STAT_OK;
    }
    case UHF_CMD_LOCK_TAG:
        if (d->running) return STAT_CMD_INNER_ERR;
        return len == 6 ? STAT_OK : STAT_CMD_PARAM_ERR;
    case UHF_CMD_KILL_TAG:
        if (d->running) return STAT_CMD_INNER_ERR;
        return len == 4 ? STAT_OK : STAT_CMD_PARAM_ERR;
    case UHF_CMD_GET_ANTENNA:
        *out = PACK::u8(d->params.antenna);
        return STAT_OK;
    case UHF_CMD_SET_ANTENNA:
        if (len < 1 || args[0] == 0) return STAT_CMD_PARAM_ERR;
        d->params.antenna = args[0];
        return STAT_OK;
    case UHF_CMD_GET_Q:
        *out = PACK::u8_pair(d->params.q_value);
        return STAT_OK;
    case UHF_CMD_SET_Q:
        if (len < 1 || args[0] > 15) return STAT_CMD_PARAM_ERR;
        d->params.q_value = args[0];
        return STAT_OK;
    case UHF_CMD_GET_INFO: {
        uint8_t firm[32] = "DBG-FW-1.0", hard[32] = "DBG-HW-SIM";
        uint8_t sn[12] = { 0x43, 0x46, 0x35, 0x39, 0x31, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01 };
        uint8_t paras[12] = {};
        *out = PACK::info(firm, hard, sn, paras);
        return STAT_OK;
    }
    case UHF_CMD_BUZZER_ENABLE:
        d->buzzer_time = len ? args[0] : 0;
        d->params.buzzer_time = d->buzzer_time;
        return STAT_OK;
    case UHF_CMD_BUZZER_DISABLE:
        d->buzzer_time = 0;
        d->params.buzzer_time = 0;
        return STAT_OK;
    case UHF_CMD_RELAY_CLOSE:
        d->relay_closed = true;
        return STAT_OK;
    case UHF_CMD_RELAY_RELEASE:
        d->relay_closed = false;
        return STAT_OK;
    case UHF_CMD_SET_SELECT_MASK: {
        auto m = UNPACK::select_mask(args, len);
        if (!m) return STAT_CMD_PARAM_ERR;
        d->select = *m;
        return STAT_OK;
    }
    default:
        return STAT_CMD_PARAM_ERR;
    }
}

static uint32_t dbg_invoke(Adapter* /*self*/, AdapterHandle h, uint16_t cmd,
                           const uint8_t* args, size_t len, bytes* out) {
    auto* d = (DebugDevice*)h;
    if (!d || !out || cmd == UHF_CMD_OPEN || cmd >= UHF_CMD_COUNT) return STAT_PORT_HANDLE_ERR;
    out->clear();

    std::unique_lock<std::mutex> lk(d->m);
    if (!d->opened) return STAT_DLL_UNCONNECT;
    d->log.push_back(cmd);
    d->counts[cmd]++;

    debug::Reply r;
    if (cmd == UHF_CMD_POLL_TAG) {
        const auto deadline = std::chrono::steady_clock::now()
            + std::chrono::milliseconds(UNPACK::timeout(args, len, 0));
        for (;;) {
            if (pop_poll(d, r)) { *out = std::move(r.out); return r.status; }
            if (!d->running) return STAT_CMD_INVENTORY_STOP;
            bool woke = d->cv.wait_until(lk, deadline, [&] {
                return has_script(d, cmd) || !d->running;
            });
            if (!woke) return STAT_COMM_TIMEOUT;
        }
    }

    if (pop_script(d, cmd, r)) {
        if (r.status != STAT_OK || !r.out.empty()) { *out = std::move(r.out); return r.status; }
    }
    return simulate(d, cmd, args, len, out);
}

static void dbg_destroy(Adapter* self) {
    if (!self) return;
    delete (DebugDevice*)self->priv;
    self->priv = nullptr;
    delete self;
}

static AdapterVTable g_vtbl = {
    dbg_probe,
    dbg_open,
    dbg_close,
    dbg_invoke,
    dbg_destroy
};

Adapter* create_debug_adapter() {
    auto* a = new (std::nothrow) Adapter();
    if (!a) return nullptr;
    a->v = &g_vtbl;
    a->priv = new (std::nothrow) DebugDevice();
    if (!a->priv) { delete a; return nullptr; }
    return a;
}


namespace debug {

void script(Adapter* a, uint16_t cmd, Reply r) {
    auto* d = dev_of(a);
    if (!d) return;
    {
        std::lock_guard<std::mutex> lk(d->m);
        d->scripts[cmd].push_back(std::move(r));
    }
    d->cv.notify_all();
}

void script_status(Adapter* a, uint16_t cmd, uint32_t status) {
    script(a, cmd, Reply{ status, {} });
}

void script_tag(Adapter* a, const bytes& epc, int16_t rssi_raw, uint8_t antenna, uint16_t no) {
    RawTag t;
    t.no = no; t.rssi = rssi_raw; t.antenna = antenna; t.channel = 3;
    t.pc[0] = (uint8_t)((epc.size() / 2) << 3); t.pc[1] = 0x00;
    t.code = epc;
    script(a, UHF_CMD_POLL_TAG, Reply{ STAT_OK, PACK::tag(t) });
}

void clear_script(Adapter* a) {
    auto* d = dev_of(a);
    if (!d) return;
    std::lock_guard<std::mutex> lk(d->m);
    d->scripts.clear();
}

size_t call_count(Adapter* a, uint16_t cmd) {
    auto* d = dev_of(a);
    if (!d || cmd >= UHF_CMD_COUNT) return 0;
    std::lock_guard<std::mutex> lk(d->m);
    return d->counts[cmd];
}

std::vector<uint16_t> call_log(Adapter* a) {
    auto* d = dev_of(a);
    if (!d) return {};
    std::lock_guard<std::mutex> lk(d->m);
    return d->log;
}

void reset_calls(Adapter* a) {
    auto* d = dev_of(a);
    if (!d) return;
    std::lock_guard<std::mutex> lk(d->m);
    d->log.clear();
    for (auto& c : d->counts) c = 0;
}

bool inventory_running(Adapter* a) {
    auto* d = dev_of(a);
    if (!d) return false;
    std::lock_guard<std::mutex> lk(d->m);
    return d->running;
}

DeviceParams params(Adapter* a) {
    auto* d = dev_of(a);
    if (!d) return {};
    std::lock_guard<std::mutex> lk(d->m);
    return d->params;
}

void set_params(Adapter* a, const DeviceParams& p) {
    auto* d = dev_of(a);
    if (!d) return;
    std::lock_guard<std::mutex> lk(d->m);
    d->params = p;
}

bytes memory(Adapter* a, MemoryBank bank) {
    auto* d = dev_of(a);
    if (!d || (uint8_t)bank > 3) return {};
    std::lock_guard<std::mutex> lk(d->m);
    return d->banks[(uint8_t)bank];
}

void set_memory(Adapter* a, MemoryBank bank, const bytes& data) {
    auto* d = dev_of(a);
    if (!d || (uint8_t)bank > 3) return;
    std::lock_guard<std::mutex> lk(d->m);
    d->banks[(uint8_t)bank] = data;
}

SelectMask select_mask(Adapter* a) {
    auto* d = dev_of(a);
    if (!d) return {};
    std::lock_guard<std::mutex> lk(d->m);
    return d->select;
}

uint8_t buzzer_time(Adapter* a) {
    auto* d = dev_of(a);
    if (!d) return 0;
    std::lock_guard<std::mutex> lk(d->m);
    return d->buzzer_time;
}

} // namespace debug
} // namespace uhf
