#pragma once
#include <string>
#include <vector>
#include <functional>
#include <boost/signals2.hpp>
#include "proto/history.pb.h"
#include "cppcalc/calculation.hpp"
#include "cppcalc/fault_exception.hpp"
#include "cppcalc/utils.hpp"

namespace cppcalc {
	using namespace std;
	using namespace boost::signals2;

	// Append-only record of attempted calculations, in submission order.
	// Subscribers are notified synchronously after each mutation.
	class History
	{
	public:
		using Entry = proto::HistoryEntry;

		const Entry& Append(const Entry& entry)
		{
			_entries.push_back(entry);
			_appended(_entries.back());
			return _entries.back();
		}

		const Entry& RecordSuccess(const Calculation& calculation, Operand value)
		{
			Entry entry = MakeEntry(calculation);
			entry.set_value(value);
			return Append(entry);
		}

		const Entry& RecordFailure(const Calculation& calculation, const FaultException& ex)
		{
			Entry entry = MakeEntry(calculation);
			*entry.mutable_fault() = ex.Details();
			return Append(entry);
		}

		void Clear()
		{
			_entries.clear();
			_cleared();
		}

		const vector<Entry>& Entries() const { return _entries; }
		size_t Size() const { return _entries.size(); }
		bool Empty() const { return _entries.empty(); }

		connection OnAppended(const function<void(const Entry&)>& slot)
		{
			return _appended.connect(slot);
		}

		connection OnCleared(const function<void()>& slot)
		{
			return _cleared.connect(slot);
		}

		// "<op> <a> <b> = <result>" or "<op> <a> <b> -> error: <message>"
		static string Format(const Entry& entry, int precision)
		{
			string line = string(OperationName(entry.operation())) + " "
				+ Utils::formatNumber(entry.a(), precision) + " "
				+ Utils::formatNumber(entry.b(), precision);
			if (entry.outcome_case() == Entry::kValue) {
				return line + " = " + Utils::formatNumber(entry.value(), precision);
			}
			return line + " -> error: " + entry.fault().message();
		}

	private:
		static Entry MakeEntry(const Calculation& calculation)
		{
			Entry entry;
			entry.set_operation(calculation.Kind());
			entry.set_a(calculation.A());
			entry.set_b(calculation.B());
			return entry;
		}

		vector<Entry> _entries;
		boost::signals2::signal<void(const Entry&)> _appended;
		boost::signals2::signal<void()> _cleared;
	};
}
