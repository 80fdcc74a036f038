#pragma once
#include <string>
#include <variant>
#include <stdexcept>
#include "cppcalc/calculation.hpp"
#include "cppcalc/fault_exception.hpp"

namespace cppcalc {
    using namespace std;

    // Outcome of one evaluation: a value or the fault that prevented it.
    class Result {
    public:
        static Result Success(Operand value) {
            return Result(value);
        }

        static Result Failure(const FaultException& ex) {
            return Result(ex.Details());
        }

        bool Succeeded() const { return holds_alternative<Operand>(_outcome); }

        Operand Value() const {
            if (!Succeeded()) {
                throw logic_error("Result holds an error: " + ErrorMessage());
            }
            return get<Operand>(_outcome);
        }

        string ErrorMessage() const {
            return Succeeded() ? string() : get<proto::Fault>(_outcome).message();
        }

        unsigned int ErrorCode() const {
            return Succeeded() ? 0 : get<proto::Fault>(_outcome).code();
        }

    private:
        explicit Result(Operand value) : _outcome(value) {}
        explicit Result(const proto::Fault& fault) : _outcome(fault) {}

        variant<Operand, proto::Fault> _outcome;
    };
}
