#ifndef CPPCALC_UTILS_HPP
#define CPPCALC_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace cppcalc {

    class Utils {
    public:
        static std::string getLowerCase(const std::string& input) {
            std::string result = input;
            std::ranges::transform(result, result.begin(),
                [](unsigned char c) { return std::tolower(c); });
            return result;
        }

        // Splits on any run of whitespace
        static std::vector<std::string> tokenize(const std::string& line) {
            std::vector<std::string> tokens;
            std::istringstream stream(line);
            std::string token;
            while (stream >> token) {
                tokens.push_back(token);
            }
            return tokens;
        }

        // The whole token must be a finite decimal number; an optional
        // leading '+' is allowed. Literals too small to represent round
        // to zero, literals too large are rejected.
        static std::optional<double> parseNumber(std::string_view token) {
            if (!token.empty() && token.front() == '+') {
                token.remove_prefix(1);
                if (!token.empty() && token.front() == '-') {
                    return std::nullopt;
                }
            }
            if (token.empty()) {
                return std::nullopt;
            }

            double value = 0.0;
            const char* last = token.data() + token.size();
            auto [ptr, ec] = std::from_chars(token.data(), last, value);
            if (ec == std::errc::result_out_of_range && ptr == last) {
                // from_chars leaves value untouched; strtod tells underflow from overflow
                value = std::strtod(std::string(token).c_str(), nullptr);
                ec = std::errc();
            }
            if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
                return std::nullopt;
            }
            return value;
        }

        static std::optional<int> parseInt(std::string_view token) {
            int value = 0;
            const char* last = token.data() + token.size();
            auto [ptr, ec] = std::from_chars(token.data(), last, value);
            if (token.empty() || ec != std::errc() || ptr != last) {
                return std::nullopt;
            }
            return value;
        }

        // Shortest general form with the given number of significant digits
        static std::string formatNumber(double value, int precision) {
            std::ostringstream stream;
            stream << std::setprecision(precision) << value;
            return stream.str();
        }
    };

} // namespace cppcalc

#endif // CPPCALC_UTILS_HPP
