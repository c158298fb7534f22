#include "status.hpp"
#include "status_codes.hpp"
#include <cstdio>

namespace uhf {

const char* err_name(Err e) {
	switch (e) {
	case Err::OK: return "OK";
	case Err::CONNECTION_FAILURE: return "CONNECTION_FAILURE";
	case Err::COMMAND_FAILURE: return "COMMAND_FAILURE";
	case Err::VALIDATION_FAILURE: return "VALIDATION_FAILURE";
	case Err::NOT_CONNECTED: return "NOT_CONNECTED";
	}
	return "?";
}

std::string describe(const Status& st) {
	std::string s = std::string(err_name(st.code)) + ": " + (st.msg ? st.msg : "");
	if (st.raw != 0) {
		char buf[16];
		std::snprintf(buf, sizeof(buf), "0x%08X", (unsigned)st.raw);
		s += std::string(" (") + buf + " " + status_name(st.raw) + ")";
	}
	return s;
}

} // namespace uhf
