#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <functional>
#include <stdexcept>

#include "cppcalc/calculation.hpp"
#include "cppcalc/fault_exception.hpp"

namespace cppcalc
{
    using namespace std;

    class CalculationFactory {
    public:
        using Constructor = function<Calculation(Operand, Operand)>;

        // Maps an operation name to the variant it constructs. Names are
        // matched exactly; a name can be registered only once.
        template<typename TCalculation>
        void Register(const string& name, const string& description = "") {
            if (_constructors.contains(name)) {
                throw invalid_argument("Calculation type '" + name + "' is already registered");
            }

            _constructors.emplace(name, [](Operand a, Operand b) {
                return Calculation(TCalculation{ a, b });
                });
            _names.push_back(name);
            _descriptions.emplace(name, description);
        }

        Calculation Create(const string& name, Operand a, Operand b) const {
            auto it = _constructors.find(name);
            if (it == _constructors.end()) {
                throw UnsupportedOperationException(name);
            }
            return it->second(a, b);
        }

        bool Contains(const string& name) const {
            return _constructors.contains(name);
        }

        // Names in registration order
        const vector<string>& Names() const { return _names; }

        const string& Describe(const string& name) const {
            auto it = _descriptions.find(name);
            if (it == _descriptions.end()) {
                throw UnsupportedOperationException(name);
            }
            return it->second;
        }

        static CalculationFactory CreateDefault() {
            CalculationFactory factory;
            factory.Register<AddCalculation>(OperationName(AddCalculation::kind), "Adds two numbers.");
            factory.Register<SubtractCalculation>(OperationName(SubtractCalculation::kind), "Subtracts the second number from the first.");
            factory.Register<MultiplyCalculation>(OperationName(MultiplyCalculation::kind), "Multiplies two numbers.");
            factory.Register<DivideCalculation>(OperationName(DivideCalculation::kind), "Divides the first number by the second.");
            return factory;
        }

        // Built once on first use, read-only afterwards
        static const CalculationFactory& Default() {
            static const CalculationFactory factory = CreateDefault();
            return factory;
        }

    private:
        unordered_map<string, Constructor> _constructors;
        unordered_map<string, string> _descriptions;
        vector<string> _names;
    };
}
