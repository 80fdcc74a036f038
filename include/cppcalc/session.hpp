#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <iomanip>
#include <utility>

#include "cppcalc/calculation_factory.hpp"
#include "cppcalc/calculator_config.hpp"
#include "cppcalc/fault_exception.hpp"
#include "cppcalc/history.hpp"
#include "cppcalc/utils.hpp"

namespace cppcalc {
    using namespace std;

    // Read-evaluate-print loop over a pair of streams. Owns the session history.
    class Session {
    public:
        enum class State { Running, Terminated };

        static constexpr size_t operandCount = 2;

        explicit Session(const CalculatorConfig& config = {},
            CalculationFactory factory = CalculationFactory::Default())
            : _config(config), _factory(std::move(factory)) {
            _config.Validate();

            RegisterCommand("help", "Display this help message.", [this](ostream& out) { WriteHelp(out); });
            RegisterCommand("history", "Show the calculations performed in this session.", [this](ostream& out) { WriteHistory(out); });
            RegisterCommand("clear", "Clear the calculation history.", [this](ostream& out) {
                _history.Clear();
                out << "History cleared." << endl;
                });
            RegisterCommand("exit", "Exit the calculator.", [this](ostream&) { _state = State::Terminated; });
            RegisterCommand("quit", "Exit the calculator.", [this](ostream&) { _state = State::Terminated; });
        }

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        // Returns the exit status once input ends or an exit command is read.
        int Run(istream& in, ostream& out) {
            if (_config.showBanner) {
                out << "Welcome to cppcalc (type 'help' for instructions or 'exit' to quit)" << endl;
            }

            string line;
            while (_state == State::Running) {
                out << _config.prompt << flush;
                if (!getline(in, line)) {
                    _state = State::Terminated;
                    if (!_config.prompt.empty()) {
                        out << endl;
                    }
                    break;
                }
                ProcessLine(line, out);
            }

            if (_config.showBanner) {
                out << "Goodbye!" << endl;
            }
            return 0;
        }

        // Handles a single input line. Input and evaluation faults are reported
        // on out and never end the session.
        void ProcessLine(const string& line, ostream& out) {
            if (_state == State::Terminated) {
                throw logic_error("Session has terminated");
            }

            const vector<string> tokens = Utils::tokenize(line);
            if (tokens.empty()) {
                return;
            }

            const string& command = tokens.front();
            auto it = _commands.find(command);
            if (it != _commands.end()) {
                it->second(out);
                return;
            }

            try {
                Calculate(command, vector<string>(tokens.begin() + 1, tokens.end()), out);
            }
            catch (const FaultException& ex) {
                out << "Error: " << ex.what() << endl;
            }
        }

        State CurrentState() const { return _state; }
        bool IsRunning() const { return _state == State::Running; }

        History& GetHistory() { return _history; }
        const History& GetHistory() const { return _history; }

        const CalculatorConfig& Config() const { return _config; }

    private:
        using CommandHandler = function<void(ostream&)>;

        void RegisterCommand(const string& name, const string& description, CommandHandler handler) {
            _commands.insert_or_assign(name, std::move(handler));
            _commandHelp.emplace_back(name, description);
        }

        // Arity is checked first, then the operands left to right, then the name.
        void Calculate(const string& name, const vector<string>& args, ostream& out) {
            if (args.size() != operandCount) {
                throw InvalidArgumentsException(operandCount, args.size());
            }

            const Operand a = ParseOperand(args[0]);
            const Operand b = ParseOperand(args[1]);
            const Calculation calculation = _factory.Create(name, a, b);

            try {
                const Operand result = calculation.Execute();
                _history.RecordSuccess(calculation, result);
                out << Format(a) << " " << calculation.Symbol() << " " << Format(b)
                    << " = " << Format(result) << endl;
            }
            catch (const DivisionByZeroException& ex) {
                _history.RecordFailure(calculation, ex);
                throw;
            }
        }

        static Operand ParseOperand(const string& token) {
            auto value = Utils::parseNumber(token);
            if (!value) {
                throw InvalidOperandException(token);
            }
            return *value;
        }

        string Format(Operand value) const {
            return Utils::formatNumber(value, _config.precision);
        }

        void WriteHelp(ostream& out) const {
            out << "Usage:" << endl
                << "  <operation> <number1> <number2>" << endl
                << "Operations:" << endl;
            for (const auto& name : _factory.Names()) {
                out << "  " << left << setw(10) << name << _factory.Describe(name) << endl;
            }
            out << "Commands:" << endl;
            for (const auto& [name, description] : _commandHelp) {
                out << "  " << left << setw(10) << name << description << endl;
            }
            out << "Examples:" << endl
                << "  add 10 5" << endl
                << "  divide 20 4" << endl;
        }

        void WriteHistory(ostream& out) const {
            if (_history.Empty()) {
                out << "No calculations performed yet." << endl;
                return;
            }
            for (const auto& entry : _history.Entries()) {
                out << History::Format(entry, _config.precision) << endl;
            }
        }

        CalculatorConfig _config;
        CalculationFactory _factory;
        History _history;
        State _state = State::Running;
        unordered_map<string, CommandHandler> _commands;
        vector<pair<string, string>> _commandHelp;
    };
}
