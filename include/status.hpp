#pragma once
#include <cstdint>
#include <string>

namespace uhf {

/// 모든 실패 가능 연산의 에러 분류
enum class Err : uint8_t {
	OK = 0,
	CONNECTION_FAILURE,   ///< 오픈 실패 / 재시도 소진
	COMMAND_FAILURE,      ///< 디바이스가 Fault 코드로 거부
	VALIDATION_FAILURE,   ///< 범위 밖 인자 (I/O 전에 거부)
	NOT_CONNECTED         ///< 닫힌 세션에 대한 호출
};

/// 반환 상태. raw에는 진단용 벤더 코드(32-bit)를 담는다.
struct Status {
	Err code = Err::OK;
	uint32_t raw = 0;
	const char* msg = "";

	constexpr Status() = default;
	constexpr Status(Err codeIn, uint32_t rawIn, const char* msgIn)
		: code(codeIn), raw(rawIn), msg(msgIn) {}

	constexpr bool ok() const { return code == Err::OK; }

	static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

	static constexpr Status Error(Err err, const char* message, uint32_t rawCode = 0) {
		return Status{err, rawCode, message};
	}
};

const char* err_name(Err e);

/// "COMMAND_FAILURE: start inventory (0xFFFFFF06 CMD_INNER_ERR)"
std::string describe(const Status& st);

} // namespace uhf
