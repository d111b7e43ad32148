#include "daytrack/data/MetadataStore.hpp"

#include "daytrack/core/Logging.hpp"
#include "daytrack/data/DailyFileCodec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>

namespace daytrack {
namespace data {

namespace {
constexpr auto KEY_MODE = "mode";
constexpr auto KEY_PAUSED = "pausedByMode";
constexpr auto KEY_SECONDS = "modeSeconds";
constexpr auto KEY_LAST_CHANGE = "lastModeChange";
} // namespace

qint64 Metadata::secondsIn(LifeMode mode) const
{
    return modeSeconds[lifeModeIndex(mode)];
}

QByteArray MetadataStore::encode(const Metadata &metadata)
{
    QJsonObject root;
    root.insert(QLatin1String(KEY_MODE), lifeModeName(metadata.mode));
    root.insert(QLatin1String(KEY_PAUSED), QJsonArray::fromStringList(metadata.pausedByMode));

    QJsonObject seconds;
    for (LifeMode mode : allLifeModes()) {
        seconds.insert(lifeModeName(mode), static_cast<double>(metadata.secondsIn(mode)));
    }
    root.insert(QLatin1String(KEY_SECONDS), seconds);
    if (metadata.lastModeChange.isValid()) {
        root.insert(QLatin1String(KEY_LAST_CHANGE), DailyFileCodec::formatTimestamp(metadata.lastModeChange));
    }
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

std::optional<Metadata> MetadataStore::decode(const QByteArray &json, QString *errorMessage)
{
    Metadata metadata;
    if (json.trimmed().isEmpty()) {
        return metadata;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (errorMessage) {
            *errorMessage = parseError.error != QJsonParseError::NoError
                                ? parseError.errorString()
                                : QStringLiteral("metadata is not a JSON object");
        }
        return std::nullopt;
    }

    const QJsonObject root = document.object();
    const QString modeName = root.value(QLatin1String(KEY_MODE)).toString();
    if (const std::optional<LifeMode> mode = lifeModeFromName(modeName)) {
        metadata.mode = *mode;
    } else if (!modeName.isEmpty()) {
        qCWarning(lcStorage) << "unknown mode" << modeName << "in metadata, using Working";
    }

    for (const QJsonValue &value : root.value(QLatin1String(KEY_PAUSED)).toArray()) {
        const QString key = value.toString();
        if (!key.isEmpty()) {
            metadata.pausedByMode << key;
        }
    }

    const QJsonObject seconds = root.value(QLatin1String(KEY_SECONDS)).toObject();
    for (LifeMode mode : allLifeModes()) {
        const qint64 stored = static_cast<qint64>(seconds.value(lifeModeName(mode)).toDouble());
        metadata.modeSeconds[lifeModeIndex(mode)] = std::max<qint64>(0, stored);
    }

    metadata.lastModeChange = DailyFileCodec::parseTimestamp(root.value(QLatin1String(KEY_LAST_CHANGE)).toString());
    return metadata;
}

bool MetadataStore::resetIfStale(Metadata &metadata, const QDate &today)
{
    if (metadata.lastModeChange.isValid() && metadata.lastModeChange.toLocalTime().date() == today) {
        return false;
    }
    metadata.modeSeconds.fill(0);
    return true;
}

} // namespace data
} // namespace daytrack
