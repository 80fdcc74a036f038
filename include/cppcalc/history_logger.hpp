#pragma once
#include <ostream>
#include <boost/signals2.hpp>
#include "cppcalc/history.hpp"

namespace cppcalc {
	using namespace std;
	using namespace boost::signals2;

	// Writes one line per history event to the log stream for as long as it lives.
	class HistoryLogger
	{
	public:
		HistoryLogger(History& history, ostream& log, int precision = 10)
			: _log(log), _precision(precision)
		{
			_appended = history.OnAppended([this](const History::Entry& entry) { Write(entry); });
			_cleared = history.OnCleared([this]() { _log << "[cppcalc] history cleared" << endl; });
		}

		// Slots capture this
		HistoryLogger(const HistoryLogger&) = delete;
		HistoryLogger& operator=(const HistoryLogger&) = delete;

	private:
		void Write(const History::Entry& entry)
		{
			if (entry.outcome_case() == History::Entry::kFault) {
				_log << "[cppcalc] failed calculation: " << History::Format(entry, _precision) << endl;
			}
			else {
				_log << "[cppcalc] calculation: " << History::Format(entry, _precision) << endl;
			}
		}

		ostream& _log;
		int _precision;
		scoped_connection _appended;
		scoped_connection _cleared;
	};
}
