#include <QtTest/QtTest>

#include "daytrack/core/UndoCommand.hpp"
#include "daytrack/core/UndoStack.hpp"

namespace {

class CounterCommand : public daytrack::core::UndoCommand
{
public:
    CounterCommand(int delta, int &value)
        : m_delta(delta)
        , m_value(value)
    {
    }

    void redo() override { m_value += m_delta; }
    void undo() override { m_value -= m_delta; }
    QString text() const override { return QStringLiteral("add %1").arg(m_delta); }

private:
    int m_delta;
    int &m_value;
};

} // namespace

class UndoStackTest : public QObject
{
    Q_OBJECT

private slots:
    void pushUndoRedo();
    void respectsLimit();
    void pushDropsRedoTail();
    void shrinkingLimitDropsOldest();
};

void UndoStackTest::pushUndoRedo()
{
    daytrack::core::UndoStack stack;
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(5, value));
    QCOMPARE(value, 5);
    QVERIFY(stack.canUndo());
    QCOMPARE(stack.undoText(), QStringLiteral("add 5"));

    QVERIFY(stack.undo());
    QCOMPARE(value, 0);
    QVERIFY(stack.canRedo());
    QVERIFY(!stack.undo());
    QVERIFY(stack.undoText().isEmpty());

    QVERIFY(stack.redo());
    QCOMPARE(value, 5);
    QVERIFY(!stack.redo());
}

void UndoStackTest::respectsLimit()
{
    daytrack::core::UndoStack stack;
    QCOMPARE(stack.limit(), static_cast<std::size_t>(10));
    int value = 0;
    for (int i = 0; i < 12; ++i) {
        stack.push(std::make_unique<CounterCommand>(1, value));
    }
    QCOMPARE(stack.count(), static_cast<std::size_t>(10));

    while (stack.undo()) {
    }
    // The two oldest commands were dropped and can no longer be undone.
    QCOMPARE(value, 2);
}

void UndoStackTest::pushDropsRedoTail()
{
    daytrack::core::UndoStack stack;
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(1, value));
    stack.push(std::make_unique<CounterCommand>(10, value));
    stack.undo();
    stack.push(std::make_unique<CounterCommand>(100, value));

    QCOMPARE(value, 101);
    QCOMPARE(stack.count(), static_cast<std::size_t>(2));
    QVERIFY(!stack.canRedo());
}

void UndoStackTest::shrinkingLimitDropsOldest()
{
    daytrack::core::UndoStack stack(0);
    QCOMPARE(stack.limit(), static_cast<std::size_t>(1));

    stack.setLimit(3);
    int value = 0;
    for (int i = 1; i <= 3; ++i) {
        stack.push(std::make_unique<CounterCommand>(i, value));
    }
    stack.setLimit(2);
    QCOMPARE(stack.count(), static_cast<std::size_t>(2));
    QCOMPARE(stack.undoText(), QStringLiteral("add 3"));
}

QTEST_GUILESS_MAIN(UndoStackTest)
#include "UndoStackTest.moc"
