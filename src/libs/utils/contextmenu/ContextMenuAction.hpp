// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QList>
#include <QtCore/QString>

#include <utility>

namespace Utils {

// Toolkit-neutral menu entry. Whoever draws the menu reports the chosen id back.
struct UTILS_EXPORT ContextMenuAction final {
    QString id;
    QString text;
    bool enabled = true;
    bool checkable = false;
    bool checked = false;
    bool isSeparator = false;

    static ContextMenuAction item(QString id, QString text, bool enabled = true)
    {
        ContextMenuAction action;
        action.id = std::move(id);
        action.text = std::move(text);
        action.enabled = enabled;
        return action;
    }

    static ContextMenuAction separatorAction()
    {
        ContextMenuAction action;
        action.isSeparator = true;
        return action;
    }

    bool operator==(const ContextMenuAction&) const = default;
};

// Number of entries a user could pick, ignoring separators.
inline int selectableActionCount(const QList<ContextMenuAction>& actions)
{
    int count = 0;
    for (const auto& action : actions) {
        if (!action.isSeparator)
            ++count;
    }
    return count;
}

inline const ContextMenuAction* findAction(const QList<ContextMenuAction>& actions, const QString& id)
{
    for (const auto& action : actions) {
        if (!action.isSeparator && action.id == id)
            return &action;
    }
    return nullptr;
}

} // namespace Utils
