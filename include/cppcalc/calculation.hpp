#pragma once
#include <string>
#include <variant>
#include <stdexcept>
#include "proto/history.pb.h"
#include "cppcalc/operations.hpp"

namespace cppcalc
{
    using namespace std;

    using Operand = double;
    using OperationKind = proto::OperationKind;

    inline const char* OperationName(OperationKind kind) {
        switch (kind) {
        case proto::OPERATION_KIND_ADD: return "add";
        case proto::OPERATION_KIND_SUBTRACT: return "subtract";
        case proto::OPERATION_KIND_MULTIPLY: return "multiply";
        case proto::OPERATION_KIND_DIVIDE: return "divide";
        default:
            throw invalid_argument("Unknown operation kind: " + to_string(static_cast<int>(kind)));
        }
    }

    inline const char* OperationSymbol(OperationKind kind) {
        switch (kind) {
        case proto::OPERATION_KIND_ADD: return "+";
        case proto::OPERATION_KIND_SUBTRACT: return "-";
        case proto::OPERATION_KIND_MULTIPLY: return "*";
        case proto::OPERATION_KIND_DIVIDE: return "/";
        default:
            throw invalid_argument("Unknown operation kind: " + to_string(static_cast<int>(kind)));
        }
    }

    struct AddCalculation {
        static constexpr OperationKind kind = proto::OPERATION_KIND_ADD;
        Operand a;
        Operand b;

        Operand Execute() const { return add(a, b); }
    };

    struct SubtractCalculation {
        static constexpr OperationKind kind = proto::OPERATION_KIND_SUBTRACT;
        Operand a;
        Operand b;

        Operand Execute() const { return subtract(a, b); }
    };

    struct MultiplyCalculation {
        static constexpr OperationKind kind = proto::OPERATION_KIND_MULTIPLY;
        Operand a;
        Operand b;

        Operand Execute() const { return multiply(a, b); }
    };

    struct DivideCalculation {
        static constexpr OperationKind kind = proto::OPERATION_KIND_DIVIDE;
        Operand a;
        Operand b;

        // Throws DivisionByZeroException
        Operand Execute() const { return divide(a, b); }
    };

    // Immutable pairing of two operands with one of the four operation kinds.
    class Calculation {
    public:
        using Variant = variant<AddCalculation, SubtractCalculation, MultiplyCalculation, DivideCalculation>;

        template<typename TCalculation>
            requires is_constructible_v<Variant, TCalculation>
        explicit Calculation(const TCalculation& calculation)
            : _calculation(calculation) {
        }

        Operand Execute() const {
            return visit([](const auto& c) { return c.Execute(); }, _calculation);
        }

        OperationKind Kind() const {
            return visit([](const auto& c) { return c.kind; }, _calculation);
        }

        Operand A() const {
            return visit([](const auto& c) { return c.a; }, _calculation);
        }

        Operand B() const {
            return visit([](const auto& c) { return c.b; }, _calculation);
        }

        const char* Name() const { return OperationName(Kind()); }
        const char* Symbol() const { return OperationSymbol(Kind()); }

    private:
        Variant _calculation;
    };
}
