#include <iostream>
#include <fstream>
#include <memory>
#include "cppcalc.hpp"

using namespace cppcalc;
using namespace std;

int main() {
    CalculatorConfig config;
    try {
        config = CalculatorConfig::FromEnvironment();
    }
    catch (const ConfigurationException& ex) {
        cerr << "Invalid configuration: " << ex.what() << endl;
        return 1;
    }

    Session session(config);

    // Logging is off unless CALCULATOR_LOG_FILE names a file
    ofstream logStream;
    unique_ptr<HistoryLogger> logger;
    if (!config.logFile.empty()) {
        logStream.open(config.logFile, ios::app);
        if (!logStream) {
            cerr << "Cannot open log file: " << config.logFile << endl;
            return 1;
        }
        logStream << "[cppcalc] session started, version " << Version::toString() << endl;
        logger = make_unique<HistoryLogger>(session.GetHistory(), logStream, config.precision);
    }

    return session.Run(cin, cout);
}
