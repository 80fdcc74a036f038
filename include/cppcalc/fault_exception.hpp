#pragma once 
#include <string>
#include <stdexcept>
#include "cppcalc/contract.h"
#include "proto/history.pb.h"

namespace cppcalc {
    using namespace std;

    class FaultException : public runtime_error {
    public:
        FaultException(const string& message, unsigned int errorCode = 0)
            : runtime_error(message), _errorCode(errorCode) {
        }

        virtual ~FaultException() = default;

        unsigned int ErrorCode() const { return _errorCode; }

        // Wire form used when the fault is recorded in history
        proto::Fault Details() const {
            proto::Fault fault;
            fault.set_code(_errorCode);
            fault.set_message(what());
            return fault;
        }

    private:
        unsigned int _errorCode;
    };

    class DivisionByZeroException : public FaultException {
    public:
        DivisionByZeroException()
            : FaultException("division by zero", ERRORS::DIVISION_BY_ZERO) {
        }
    };

    class UnsupportedOperationException : public FaultException {
    public:
        explicit UnsupportedOperationException(const string& name)
            : FaultException("unsupported operation '" + name + "'", ERRORS::UNSUPPORTED_OPERATION),
            _name(name) {
        }

        const string& Name() const { return _name; }

    private:
        string _name;
    };

    class InvalidArgumentsException : public FaultException {
    public:
        InvalidArgumentsException(size_t expected, size_t got)
            : FaultException("expected " + to_string(expected) + " operands, got " + to_string(got),
                ERRORS::INVALID_ARGUMENTS),
            _expected(expected), _got(got) {
        }

        size_t Expected() const { return _expected; }
        size_t Got() const { return _got; }

    private:
        size_t _expected;
        size_t _got;
    };

    class InvalidOperandException : public FaultException {
    public:
        explicit InvalidOperandException(const string& token)
            : FaultException("'" + token + "' is not a number", ERRORS::INVALID_OPERAND),
            _token(token) {
        }

        const string& Token() const { return _token; }

    private:
        string _token;
    };

    class ConfigurationException : public FaultException {
    public:
        explicit ConfigurationException(const string& message)
            : FaultException(message, ERRORS::CONFIGURATION) {
        }
    };
}
