#pragma once

#include "daytrack/core/Settings.hpp"

#include <QString>

#include <memory>

namespace daytrack {
namespace data {
class DataProvider;
class ReportGenerator;
}

namespace core {

class Clock;
class Notifier;
class Tracker;
class UndoStack;

class AppContext
{
public:
    explicit AppContext(const Settings &settings);
    AppContext(const Settings &settings, std::unique_ptr<data::DataProvider> dataProvider,
               std::unique_ptr<Clock> clock, std::unique_ptr<Notifier> notifier);
    ~AppContext();

    bool start(QString *errorMessage = nullptr);
    void tick();
    bool shutdown(QString *errorMessage = nullptr);

    QString journal() const;
    bool setJournal(const QString &text, QString *errorMessage = nullptr);
    void setReportGenerator(data::ReportGenerator *generator);

    const Settings &settings() const;
    data::DataProvider &dataProvider();
    Tracker &tracker();
    UndoStack &undoStack();

private:
    Settings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<Notifier> m_notifier;
    std::unique_ptr<UndoStack> m_undoStack;
    std::unique_ptr<Tracker> m_tracker;
    QString m_journal;
};

} // namespace core
} // namespace daytrack
