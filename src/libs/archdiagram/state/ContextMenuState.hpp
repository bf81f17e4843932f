// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>

#include <cstdint>

namespace ArchDiagram::State {

enum class ARCHDIAGRAM_EXPORT ContextMenuKind : uint8_t {
    Closed,
    Canvas,
    Node,
    Edge
};

enum class ARCHDIAGRAM_EXPORT ContextMenuCloseReason : uint8_t {
    PrimaryClick,
    Scroll,
    Escape,
    DiagramSwitch,
    ActionTriggered
};

struct ARCHDIAGRAM_EXPORT ContextMenuState final {
    ContextMenuKind kind = ContextMenuKind::Closed;
    QPointF screenPos;
    // Canvas menus remember where in the diagram they were opened.
    QPointF worldPos;
    BlockId blockId;
    ConnectorId connectorId;

    bool isOpen() const noexcept { return kind != ContextMenuKind::Closed; }

    static ContextMenuState closed() { return {}; }
    static ContextMenuState canvas(const QPointF& screenPos, const QPointF& worldPos);
    static ContextMenuState node(const BlockId& blockId, const QPointF& screenPos);
    static ContextMenuState edge(const ConnectorId& connectorId, const QPointF& screenPos);

    bool operator==(const ContextMenuState&) const = default;
};

// What the pointer was over when the menu was requested.
struct ARCHDIAGRAM_EXPORT ContextMenuTarget final {
    ContextMenuKind kind = ContextMenuKind::Canvas;
    BlockId blockId;
    ConnectorId connectorId;

    static ContextMenuTarget pane() { return {}; }
    static ContextMenuTarget node(const BlockId& id) { return {ContextMenuKind::Node, id, {}}; }
    static ContextMenuTarget edge(const ConnectorId& id) { return {ContextMenuKind::Edge, {}, id}; }
};

class ARCHDIAGRAM_EXPORT ContextMenuStateMachine final : public QObject
{
    Q_OBJECT

public:
    explicit ContextMenuStateMachine(QObject* parent = nullptr);

    const ContextMenuState& state() const noexcept { return m_state; }
    bool isOpen() const noexcept { return m_state.isOpen(); }

    void openCanvas(const QPointF& screenPos, const QPointF& worldPos);
    void openNode(const BlockId& blockId, const QPointF& screenPos);
    void openEdge(const ConnectorId& connectorId, const QPointF& screenPos);
    // Returns false when the menu was already closed.
    bool close(ContextMenuCloseReason reason);

signals:
    void stateChanged();
    void closed(ArchDiagram::State::ContextMenuCloseReason reason);

private:
    void setState(const ContextMenuState& next);

    ContextMenuState m_state;
};

} // namespace ArchDiagram::State
