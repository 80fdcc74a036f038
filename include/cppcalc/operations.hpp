#ifndef CPPCALC_OPERATIONS_HPP
#define CPPCALC_OPERATIONS_HPP

#include <concepts>
#include "cppcalc/fault_exception.hpp"

namespace cppcalc {

    template<typename T>
        requires std::is_arithmetic_v<T>
    constexpr T add(T a, T b) {
        return a + b;
    }

    template<typename T>
        requires std::is_arithmetic_v<T>
    constexpr T subtract(T a, T b) {
        return a - b;
    }

    template<typename T>
        requires std::is_arithmetic_v<T>
    constexpr T multiply(T a, T b) {
        return a * b;
    }

    // Throws DivisionByZeroException when b is zero (either sign)
    template<typename T>
        requires std::is_arithmetic_v<T>
    T divide(T a, T b) {
        if (b == T{ 0 }) {
            throw DivisionByZeroException();
        }
        return a / b;
    }

} // namespace cppcalc

#endif // CPPCALC_OPERATIONS_HPP
