// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/state/ContextMenuState.hpp"

#include <utils/contextmenu/ContextMenuAction.hpp>

#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QString>

namespace ArchDiagram {
class DiagramEngine;
} // namespace ArchDiagram

namespace ArchDiagram::Controllers {

// Derives the entries of the open context menu and runs the chosen one
// against the engine.
class ARCHDIAGRAM_EXPORT DiagramContextMenuController final : public QObject
{
    Q_OBJECT

public:
    explicit DiagramContextMenuController(DiagramEngine* engine, QObject* parent = nullptr);

    // Empty when the menu is closed or its target is gone.
    QList<Utils::ContextMenuAction> actionsFor(const State::ContextMenuState& state) const;

    bool handleMenuAction(const State::ContextMenuState& state, const QString& actionId);

private:
    void appendCanvasActions(QList<Utils::ContextMenuAction>& actions) const;
    void appendBlockActions(QList<Utils::ContextMenuAction>& actions) const;
    void appendConnectorActions(QList<Utils::ContextMenuAction>& actions) const;

    bool executeCanvasAction(const State::ContextMenuState& state, const QString& actionId);
    bool executeBlockAction(const State::ContextMenuState& state, const QString& actionId);
    bool executeConnectorAction(const State::ContextMenuState& state, const QString& actionId);

    DiagramEngine* m_engine = nullptr;
};

} // namespace ArchDiagram::Controllers
