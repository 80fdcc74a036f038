#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include <string>
#include <type_traits>
#include "cppcalc/history.hpp"
#include "cppcalc/history_logger.hpp"

using namespace cppcalc;
using namespace std;
using namespace testing;

class MockHistoryObserver {
public:
    MOCK_METHOD(void, OnAppended, (const History::Entry& entry));
    MOCK_METHOD(void, OnCleared, ());
};

class HistoryTest : public Test {
protected:
    History history;
};

TEST_F(HistoryTest, StartsEmpty) {
    EXPECT_TRUE(history.Empty());
    EXPECT_EQ(history.Size(), 0u);
}

TEST_F(HistoryTest, RecordsInSubmissionOrder) {
    history.RecordSuccess(Calculation(AddCalculation{ 2, 3 }), 5);
    history.RecordFailure(Calculation(DivideCalculation{ 10, 0 }), DivisionByZeroException());
    history.RecordSuccess(Calculation(MultiplyCalculation{ 4, 2 }), 8);

    ASSERT_EQ(history.Size(), 3u);
    const auto& entries = history.Entries();
    EXPECT_EQ(entries[0].operation(), proto::OPERATION_KIND_ADD);
    EXPECT_EQ(entries[1].operation(), proto::OPERATION_KIND_DIVIDE);
    EXPECT_EQ(entries[2].operation(), proto::OPERATION_KIND_MULTIPLY);

    EXPECT_EQ(entries[0].outcome_case(), History::Entry::kValue);
    EXPECT_DOUBLE_EQ(entries[0].value(), 5.0);
    EXPECT_EQ(entries[1].outcome_case(), History::Entry::kFault);
    EXPECT_EQ(entries[1].fault().code(), ERRORS::DIVISION_BY_ZERO);
    EXPECT_DOUBLE_EQ(entries[1].a(), 10.0);
    EXPECT_DOUBLE_EQ(entries[1].b(), 0.0);
}

TEST_F(HistoryTest, FormatsValueAndFaultEntries) {
    const auto& ok = history.RecordSuccess(Calculation(DivideCalculation{ 1, 3 }), 1.0 / 3.0);
    EXPECT_EQ(History::Format(ok, 10), "divide 1 3 = 0.3333333333");
    EXPECT_EQ(History::Format(ok, 2), "divide 1 3 = 0.33");

    const auto& failed = history.RecordFailure(Calculation(DivideCalculation{ 8, 0 }), DivisionByZeroException());
    EXPECT_EQ(History::Format(failed, 10), "divide 8 0 -> error: division by zero");
}

TEST_F(HistoryTest, ClearEmptiesEntries) {
    history.RecordSuccess(Calculation(AddCalculation{ 1, 1 }), 2);
    history.Clear();
    EXPECT_TRUE(history.Empty());

    history.RecordSuccess(Calculation(SubtractCalculation{ 1, 1 }), 0);
    ASSERT_EQ(history.Size(), 1u);
    EXPECT_EQ(history.Entries()[0].operation(), proto::OPERATION_KIND_SUBTRACT);
}

TEST_F(HistoryTest, NotifiesSubscribersAfterAppend) {
    StrictMock<MockHistoryObserver> observer;
    auto appended = history.OnAppended([&](const History::Entry& e) { observer.OnAppended(e); });
    auto cleared = history.OnCleared([&]() { observer.OnCleared(); });

    InSequence sequence;
    EXPECT_CALL(observer, OnAppended(Property(&History::Entry::operation, proto::OPERATION_KIND_ADD)))
        .WillOnce([this](const History::Entry&) { EXPECT_EQ(history.Size(), 1u); });
    EXPECT_CALL(observer, OnAppended(Property(&History::Entry::operation, proto::OPERATION_KIND_DIVIDE)));
    EXPECT_CALL(observer, OnCleared())
        .WillOnce([this]() { EXPECT_TRUE(history.Empty()); });

    history.RecordSuccess(Calculation(AddCalculation{ 2, 3 }), 5);
    history.RecordFailure(Calculation(DivideCalculation{ 1, 0 }), DivisionByZeroException());
    history.Clear();

    appended.disconnect();
    cleared.disconnect();
    history.RecordSuccess(Calculation(AddCalculation{ 2, 3 }), 5);
}

TEST(HistoryLoggerTest, CannotBeCopiedOrMoved) {
    static_assert(!is_copy_constructible_v<HistoryLogger>);
    static_assert(!is_move_constructible_v<HistoryLogger>);
    static_assert(!is_copy_assignable_v<HistoryLogger>);
    static_assert(!is_move_assignable_v<HistoryLogger>);
}

TEST_F(HistoryTest, LoggerWritesOneLinePerEvent) {
    ostringstream log;
    {
        HistoryLogger logger(history, log);
        history.RecordSuccess(Calculation(AddCalculation{ 2, 3 }), 5);
        history.RecordFailure(Calculation(DivideCalculation{ 10, 0 }), DivisionByZeroException());
        history.Clear();
    }
    history.RecordSuccess(Calculation(AddCalculation{ 1, 1 }), 2);

    EXPECT_EQ(log.str(),
        "[cppcalc] calculation: add 2 3 = 5\n"
        "[cppcalc] failed calculation: divide 10 0 -> error: division by zero\n"
        "[cppcalc] history cleared\n");
}
