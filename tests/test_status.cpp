// 벤더 상태 코드 분류 / Status 표시
#include "status.hpp"
#include "status_codes.hpp"
#include "test_util.hpp"
#include <string>

using namespace uhf;

TEST(ok_is_success) {
    CHECK(classify(STAT_OK) == Outcome::Success);
    CHECK(!is_recoverable(classify(STAT_OK)));
}

TEST(driver_range_never_success) {
    for (uint32_t c = 0xFFFFFF01; c <= 0xFFFFFF18; ++c) {
        Outcome o = classify(c);
        CHECK(o != Outcome::Success);
        if (c == STAT_CMD_INVENTORY_STOP || c == STAT_NOMORE_DATA) CHECK(o == Outcome::EmptyOrStopped);
        else if (c == STAT_COMM_TIMEOUT) CHECK(o == Outcome::Timeout);
        else CHECK(o == Outcome::Fault);
    }
}

TEST(tag_codes_are_faults) {
    for (uint32_t c = 0xFFFFFF40; c <= 0xFFFFFF46; ++c) CHECK(classify(c) == Outcome::Fault);
    for (uint32_t c = 0xFFFFFF50; c <= 0xFFFFFF5D; ++c) CHECK(classify(c) == Outcome::Fault);
}

TEST(recoverable_codes) {
    CHECK(is_recoverable(classify(STAT_CMD_INVENTORY_STOP)));
    CHECK(is_recoverable(classify(STAT_COMM_TIMEOUT)));
    CHECK(!is_recoverable(classify(STAT_HAS_MORE_DATA)));
    CHECK(!is_recoverable(classify(STAT_CMD_INNER_ERR)));
}

TEST(signed_values_normalize) {
    // 0xFFFFFF12 를 부호 있는 32비트로 받은 경우
    CHECK_EQ(normalize_status(-238), (uint32_t)STAT_COMM_TIMEOUT);
    CHECK(classify(-238) == Outcome::Timeout);
    CHECK(classify(-249) == Outcome::EmptyOrStopped); // 0xFFFFFF07
    CHECK(classify((int64_t)STAT_COMM_TIMEOUT) == Outcome::Timeout);
}

TEST(unknown_code_is_fault) {
    CHECK(classify(0x12345) == Outcome::Fault);
    CHECK(classify(0xFFFFFF30) == Outcome::Fault);
    CHECK_EQ(std::string(status_name(0x12345)), std::string("UNKNOWN"));
    CHECK_EQ(std::string(status_name(STAT_CMD_INNER_ERR)), std::string("CMD_INNER_ERR"));
}

TEST(status_describe) {
    Status ok = Status::Ok();
    CHECK(ok.ok());
    CHECK_EQ(ok.code, Err::OK);

    Status st = Status::Error(Err::COMMAND_FAILURE, "start inventory", STAT_CMD_INNER_ERR);
    CHECK(!st.ok());
    CHECK_EQ(st.raw, (uint32_t)STAT_CMD_INNER_ERR);
    std::string s = describe(st);
    CHECK(s.find("COMMAND_FAILURE") != std::string::npos);
    CHECK(s.find("start inventory") != std::string::npos);
    CHECK(s.find("0xFFFFFF06") != std::string::npos);
    CHECK(s.find("CMD_INNER_ERR") != std::string::npos);

    CHECK_EQ(describe(Status::Error(Err::VALIDATION_FAILURE, "power out of range")),
                     std::string("VALIDATION_FAILURE: power out of range"));
}

int main() {
    std::printf("\n=== status tests ===\n\n");
    RUN_TEST(ok_is_success);
    RUN_TEST(driver_range_never_success);
    RUN_TEST(tag_codes_are_faults);
    RUN_TEST(recoverable_codes);
    RUN_TEST(signed_values_normalize);
    RUN_TEST(unknown_code_is_fault);
    RUN_TEST(status_describe);
    return TEST_SUMMARY();
}
