#pragma once

#include "core/result.hpp"
#include "core/ulid.hpp"
#include <QDateTime>
#include <QString>
#include <QUuid>

namespace sortid::qt {

/**
 * QUuid in RFC 4122 byte order carries the identifier's 16 bytes as-is,
 * so the time prefix stays in front and sort order is kept.
 */
[[nodiscard]] QUuid to_quuid(const Ulid& id);
[[nodiscard]] Result<Ulid> from_quuid(const QUuid& uuid);

[[nodiscard]] QString to_qstring(const Ulid& id);

/**
 * Parse through Ulid::parse. Characters outside Latin-1 can never be valid
 * symbols and are reported as InvalidCharacter.
 */
[[nodiscard]] Result<Ulid> from_qstring(const QString& text);

// UTC QDateTime with millisecond precision.
[[nodiscard]] QDateTime to_qdatetime(Timestamp time);
[[nodiscard]] Timestamp from_qdatetime(const QDateTime& dt);

} // namespace sortid::qt
