#include "daytrack/core/AppContext.hpp"

#include "daytrack/core/Clock.hpp"
#include "daytrack/core/Logging.hpp"
#include "daytrack/core/Notifier.hpp"
#include "daytrack/core/Tracker.hpp"
#include "daytrack/core/UndoStack.hpp"
#include "daytrack/data/DataDirectory.hpp"
#include "daytrack/data/DataProvider.hpp"
#include "daytrack/data/DayRepository.hpp"

#include <QDir>

namespace daytrack {
namespace core {

AppContext::AppContext(const Settings &settings)
    : AppContext(settings,
                 std::make_unique<data::DataProvider>(
                     data::DataDirectory::resolve(QDir::currentPath(), settings.dataDirectory)),
                 std::make_unique<SystemClock>(), std::make_unique<LogNotifier>())
{
}

AppContext::AppContext(const Settings &settings, std::unique_ptr<data::DataProvider> dataProvider,
                       std::unique_ptr<Clock> clock, std::unique_ptr<Notifier> notifier)
    : m_settings(settings)
    , m_dataProvider(std::move(dataProvider))
    , m_clock(std::move(clock))
    , m_notifier(std::move(notifier))
    , m_undoStack(std::make_unique<UndoStack>(static_cast<std::size_t>(settings.undoLimit)))
    , m_tracker(std::make_unique<Tracker>(m_dataProvider->dayRepository(), *m_undoStack, *m_clock, *m_notifier,
                                          m_settings))
{
}

AppContext::~AppContext() = default;

bool AppContext::start(QString *errorMessage)
{
    const QDateTime now = m_clock->now();
    if (!m_dataProvider->prepare(now.date(), now, errorMessage)) {
        return false;
    }
    if (!m_tracker->load(now.date(), errorMessage)) {
        return false;
    }
    std::optional<QString> journal = m_dataProvider->dayRepository().loadJournal(now.date(), errorMessage);
    if (!journal) {
        return false;
    }
    m_journal = *journal;
    return true;
}

void AppContext::tick()
{
    if (m_tracker->hasDayChanged()) {
        const QDate previousDay = m_tracker->day();
        const QDate today = m_clock->now().date();
        QString error;
        if (!m_dataProvider->dayRepository().saveJournal(previousDay, m_journal, &error)) {
            qCWarning(lcStorage) << "cannot save journal for" << previousDay << error;
        }
        if (!m_tracker->rollOver(today, &error)) {
            qCWarning(lcTracker) << "day rollover failed:" << error;
        } else {
            std::optional<QString> journal = m_dataProvider->dayRepository().loadJournal(today, &error);
            if (journal) {
                m_journal = *journal;
            } else {
                qCWarning(lcStorage) << "cannot load journal for" << today << error;
                m_journal.clear();
            }
        }
    }
    m_tracker->tick();
}

bool AppContext::shutdown(QString *errorMessage)
{
    m_tracker->idleAll();
    if (!m_dataProvider->dayRepository().saveJournal(m_tracker->day(), m_journal, errorMessage)) {
        qCCritical(lcStorage) << "journal not saved on exit";
        return false;
    }
    if (!m_tracker->save(errorMessage)) {
        qCCritical(lcStorage) << "day not saved on exit";
        return false;
    }
    return true;
}

QString AppContext::journal() const
{
    return m_journal;
}

bool AppContext::setJournal(const QString &text, QString *errorMessage)
{
    if (!m_dataProvider->dayRepository().saveJournal(m_tracker->day(), text, errorMessage)) {
        return false;
    }
    m_journal = text;
    return true;
}

void AppContext::setReportGenerator(data::ReportGenerator *generator)
{
    m_tracker->setReportGenerator(generator);
}

const Settings &AppContext::settings() const
{
    return m_settings;
}

data::DataProvider &AppContext::dataProvider()
{
    return *m_dataProvider;
}

Tracker &AppContext::tracker()
{
    return *m_tracker;
}

UndoStack &AppContext::undoStack()
{
    return *m_undoStack;
}

} // namespace core
} // namespace daytrack
