#pragma once

// ── 리더 연결 기본값
#define UHF_DEFAULT_PORT            "/dev/ttyUSB0"
#define UHF_DEFAULT_BAUD            115200
#define UHF_DEFAULT_NET_PORT        60000
#define UHF_CONNECT_TIMEOUT_MS      3000

// ── 출력(dBm 단위 X, 디바이스 레벨 0~30)
#define UHF_POWER_MAX               30
#define UHF_POWER_MAX_LIMITED       26      // 일부 펌웨어는 26까지만 허용
#define UHF_POWER_DEFAULT           15
#define UHF_Q_MAX                   15

// ── 인벤토리 폴링(ms)
#define UHF_POLL_TIMEOUT_MS         500
#define UHF_STOP_TIMEOUT_MS         1000
#define UHF_READ_TIMEOUT_MS         5000
#define UHF_MAX_CONSECUTIVE_EMPTY   3
#define UHF_MEMORY_TIMEOUT_MS       1000

// ── 트리거 리드 (fast 프리셋 기준)
#define UHF_TRIGGER_TIMEOUT_MS      10000
#define UHF_TRIGGER_POLL_MS         50
#define UHF_FLUSH_POLL_MS           20
#define UHF_FLUSH_WINDOW_MS         200
#define UHF_FLUSH_MAX_TAGS          500
#define UHF_FLUSH_EMPTY_LIMIT       2
#define UHF_BUZZER_DURATION         5       // 10ms 단위 → 50ms

// ── 디바운스: 0이면 모든 검출 통과
#define UHF_DEBOUNCE_MS             0
#define UHF_MONITOR_DEBOUNCE_MS     1000
#define UHF_MONITOR_POLL_MS         500
#define UHF_MONITOR_JOIN_MS         2000
#define UHF_MONITOR_FAULT_LIMIT     3

// ── 재시도 스케줄 (지연 = base * mult^(n-1))
#define UHF_RETRY_CONNECT_ATTEMPTS  5
#define UHF_RETRY_CONNECT_BASE_MS   500
#define UHF_RETRY_POWER_ATTEMPTS    3
#define UHF_RETRY_POWER_BASE_MS     300
#define UHF_RETRY_START_ATTEMPTS    5
#define UHF_RETRY_START_BASE_MS     200
#define UHF_RETRY_MULTIPLIER        1.5

// ── 로그
#define UHF_LOG_PATH                "./uhf_reader.log"
