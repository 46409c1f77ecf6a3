#include "qt/ulid_qt.hpp"

#include <QByteArray>
#include <QTimeZone>
#include <string_view>

namespace sortid::qt {

QUuid to_quuid(const Ulid& id) {
    const auto bytes = id.to_guid_bytes();
    return QUuid::fromRfc4122(QByteArray(reinterpret_cast<const char*>(bytes.data()),
                                         static_cast<qsizetype>(bytes.size())));
}

Result<Ulid> from_quuid(const QUuid& uuid) {
    const auto raw = uuid.toRfc4122();
    return Ulid::from_guid_bytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(raw.constData()), static_cast<size_t>(raw.size())));
}

QString to_qstring(const Ulid& id) {
    const auto text = id.to_string();
    return QString::fromLatin1(text.data(), static_cast<qsizetype>(text.size()));
}

Result<Ulid> from_qstring(const QString& text) {
    if (text.isNull() || text.isEmpty()) {
        return Result<Ulid>::err(Error{ErrorCode::InvalidInput, "identifier text is empty"});
    }
    // toLatin1 keeps one byte per UTF-16 unit, mapping the rest to '?'.
    const auto latin = text.toLatin1();
    return Ulid::parse(std::string_view(latin.constData(), static_cast<size_t>(latin.size())));
}

QDateTime to_qdatetime(Timestamp time) {
    return QDateTime::fromMSecsSinceEpoch(time.millis(), QTimeZone::utc());
}

Timestamp from_qdatetime(const QDateTime& dt) {
    return Timestamp(static_cast<int64_t>(dt.toMSecsSinceEpoch()));
}

} // namespace sortid::qt
