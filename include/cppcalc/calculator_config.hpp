#pragma once
#include <string>
#include <functional>
#include <cstdlib>
#include "cppcalc/fault_exception.hpp"
#include "cppcalc/utils.hpp"

namespace cppcalc {
    using namespace std;

    struct CalculatorConfig {
        static constexpr int minPrecision = 1;
        static constexpr int maxPrecision = 17;

        // Significant digits used when printing numbers
        int precision = 10;
        string prompt = ">> ";
        bool showBanner = true;
        // Empty disables the history log
        string logFile;

        void Validate() const {
            if (precision < minPrecision || precision > maxPrecision) {
                throw ConfigurationException("precision must be between " + to_string(minPrecision)
                    + " and " + to_string(maxPrecision) + ", got " + to_string(precision));
            }
        }

        // Reads CALCULATOR_* variables through lookup; unset variables keep their defaults.
        static CalculatorConfig FromLookup(const function<const char* (const char*)>& lookup) {
            CalculatorConfig config;

            if (const char* value = lookup("CALCULATOR_PRECISION")) {
                auto precision = Utils::parseInt(value);
                if (!precision) {
                    throw ConfigurationException("CALCULATOR_PRECISION is not an integer: '" + string(value) + "'");
                }
                config.precision = *precision;
            }
            if (const char* value = lookup("CALCULATOR_PROMPT")) {
                config.prompt = value;
            }
            if (const char* value = lookup("CALCULATOR_SHOW_BANNER")) {
                config.showBanner = ParseBool("CALCULATOR_SHOW_BANNER", value);
            }
            if (const char* value = lookup("CALCULATOR_LOG_FILE")) {
                config.logFile = value;
            }

            config.Validate();
            return config;
        }

        static CalculatorConfig FromEnvironment() {
            return FromLookup([](const char* name) -> const char* { return getenv(name); });
        }

    private:
        static bool ParseBool(const string& name, const string& value) {
            const string lower = Utils::getLowerCase(value);
            if (lower == "true" || lower == "1" || lower == "yes") return true;
            if (lower == "false" || lower == "0" || lower == "no") return false;
            throw ConfigurationException(name + " is not a boolean: '" + value + "'");
        }
    };
}
