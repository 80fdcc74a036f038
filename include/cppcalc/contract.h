#pragma once

namespace cppcalc {

	enum ERRORS : unsigned int {
		DIVISION_BY_ZERO = 1,
		UNSUPPORTED_OPERATION = 2,
		INVALID_ARGUMENTS = 3,
		INVALID_OPERAND = 4,
		CONFIGURATION = 0xFF + 1,
	};
}
