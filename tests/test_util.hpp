#pragma once
// 테스트 공용 매크로: 프레임워크 없이 실행 파일 1개 = 스위트 1개
#include <cstdio>

static int testsPassed = 0;
static int testsFailed = 0;
static int checksFailed = 0;

#define TEST(name) static void test_##name()

// 실패 시 현재 테스트 함수에서 바로 빠진다
#define CHECK(x) do { \
    if (!(x)) { \
        std::printf("\n  CHECK failed %s:%d: %s", __FILE__, __LINE__, #x); \
        ++checksFailed; \
        return; \
    } \
} while (0)

#define CHECK_EQ(a, b) CHECK((a) == (b))

#define RUN_TEST(name) do { \
    int before_ = checksFailed; \
    std::printf("Running %s... ", #name); \
    std::fflush(stdout); \
    test_##name(); \
    if (checksFailed == before_) { std::printf("PASSED\n"); ++testsPassed; } \
    else { std::printf("\nFAILED\n"); ++testsFailed; } \
} while (0)

#define TEST_SUMMARY() ( \
    std::printf("\n%d passed, %d failed\n", testsPassed, testsFailed), \
    testsFailed == 0 ? 0 : 1)
