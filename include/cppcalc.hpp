/**
 * @file cppcalc.hpp
 * @brief Main include file for the cppcalc library
 * @version 0.1.0
 */

#ifndef CPPCALC_HPP
#define CPPCALC_HPP

#include "cppcalc/contract.h"
#include "cppcalc/fault_exception.hpp"
#include "cppcalc/utils.hpp"
#include "cppcalc/operations.hpp"
#include "cppcalc/calculation.hpp"
#include "cppcalc/calculation_factory.hpp"
#include "cppcalc/result.hpp"
#include "cppcalc/history.hpp"
#include "cppcalc/history_logger.hpp"
#include "cppcalc/calculator_config.hpp"
#include "cppcalc/session.hpp"
#include <string>
#include <istream>
#include <ostream>

namespace cppcalc {

	struct Version {
		static constexpr int major = 0;
		static constexpr int minor = 1;
		static constexpr int patch = 0;

		static constexpr const char* toString() {
			return "0.1.0";
		}
	};

	// Resolves name through the default registry and executes it.
	// Faults are returned in the Result rather than thrown.
	inline Result Evaluate(const string& operationName, Operand a, Operand b) {
		try {
			const Calculation calculation = CalculationFactory::Default().Create(operationName, a, b);
			return Result::Success(calculation.Execute());
		}
		catch (const FaultException& ex) {
			return Result::Failure(ex);
		}
	}

	inline int RunSession(istream& in, ostream& out, const CalculatorConfig& config = {}) {
		Session session(config);
		return session.Run(in, out);
	}
}

#endif // CPPCALC_HPP
