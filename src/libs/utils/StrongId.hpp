// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QString>
#include <QtCore/QUuid>

#include <compare>
#include <optional>
#include <utility>

namespace Utils {

// Opaque identifier tagged by the entity it names. Ids are assigned by the
// persistence layer and are never interpreted, only compared and hashed.
template <typename Tag>
class StrongId final {
public:
    using tag_type = Tag;

    StrongId() noexcept = default;
    explicit StrongId(QString value) noexcept : m_value(std::move(value)) {}

    static StrongId create(QStringView prefix = {})
    {
        const QString uuid = QUuid::createUuid().toString(QUuid::WithoutBraces);
        if (prefix.isEmpty())
            return StrongId(uuid);
        return StrongId(prefix.toString() + QLatin1Char('-') + uuid);
    }

    static std::optional<StrongId> fromString(const QString& s)
    {
        const QString trimmed = s.trimmed();
        if (trimmed.isEmpty())
            return std::nullopt;
        return StrongId(trimmed);
    }

    bool isNull() const noexcept { return m_value.isEmpty(); }
    explicit operator bool() const noexcept { return !isNull(); }

    const QString& toString() const noexcept { return m_value; }

    friend bool operator==(const StrongId& a, const StrongId& b) noexcept
    {
        return a.m_value == b.m_value;
    }

    friend std::strong_ordering operator<=>(const StrongId& a, const StrongId& b) noexcept
    {
        const int c = QString::compare(a.m_value, b.m_value);
        if (c < 0) return std::strong_ordering::less;
        if (c > 0) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

private:
    QString m_value;
};

template <typename Tag>
size_t qHash(const StrongId<Tag>& id, size_t seed = 0) noexcept
{
    return qHash(id.toString(), seed);
}

} // namespace Utils
