#pragma once
#include "adapter.hpp"
#include "rfid_msg.hpp"

namespace uhf {
namespace debug {

/** 스크립트 응답 1건: 상태 코드 + 출력 바이트 */
struct Reply {
    uint32_t status = 0;
    bytes out;
};

/**
* 디버그 어댑터 스크립트 API
* - 명령별 응답 큐. 큐가 비면 내장 시뮬레이션(파라미터 블록/메모리 뱅크)으로 응답.
* - 스크립트 없는 POLL_TAG는 인자 timeout 만큼 기다린 뒤 COMM_TIMEOUT (대기 중 push되면 즉시 깨어남).
* - 인벤토리가 멈춘 상태의 POLL_TAG는 CMD_INVENTORY_STOP.
* - 선택 마스크가 설정되면 마스크와 맞지 않는 스크립트 태그는 POLL_TAG에서 버려진다.
*/
void script(Adapter* a, uint16_t cmd, Reply r);
void script_status(Adapter* a, uint16_t cmd, uint32_t status);
void script_tag(Adapter* a, const bytes& epc, int16_t rssi_raw, uint8_t antenna = 1, uint16_t no = 0);
void clear_script(Adapter* a);

size_t call_count(Adapter* a, uint16_t cmd);
std::vector<uint16_t> call_log(Adapter* a);   ///< 호출 순서(OPEN 제외)
void reset_calls(Adapter* a);

bool inventory_running(Adapter* a);           ///< 시뮬레이션 디바이스 기준
DeviceParams params(Adapter* a);
void set_params(Adapter* a, const DeviceParams& p);
bytes memory(Adapter* a, MemoryBank bank);
void set_memory(Adapter* a, MemoryBank bank, const bytes& data);
uint8_t buzzer_time(Adapter* a);
SelectMask select_mask(Adapter* a);

} // namespace debug
} // namespace uhf
