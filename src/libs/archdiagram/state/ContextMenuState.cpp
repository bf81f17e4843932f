// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/state/ContextMenuState.hpp"

namespace ArchDiagram::State {

ContextMenuState ContextMenuState::canvas(const QPointF& screenPos, const QPointF& worldPos)
{
    ContextMenuState state;
    state.kind = ContextMenuKind::Canvas;
    state.screenPos = screenPos;
    state.worldPos = worldPos;
    return state;
}

ContextMenuState ContextMenuState::node(const BlockId& blockId, const QPointF& screenPos)
{
    ContextMenuState state;
    state.kind = ContextMenuKind::Node;
    state.screenPos = screenPos;
    state.blockId = blockId;
    return state;
}

ContextMenuState ContextMenuState::edge(const ConnectorId& connectorId, const QPointF& screenPos)
{
    ContextMenuState state;
    state.kind = ContextMenuKind::Edge;
    state.screenPos = screenPos;
    state.connectorId = connectorId;
    return state;
}

ContextMenuStateMachine::ContextMenuStateMachine(QObject* parent)
    : QObject(parent)
{}

void ContextMenuStateMachine::openCanvas(const QPointF& screenPos, const QPointF& worldPos)
{
    setState(ContextMenuState::canvas(screenPos, worldPos));
}

void ContextMenuStateMachine::openNode(const BlockId& blockId, const QPointF& screenPos)
{
    setState(ContextMenuState::node(blockId, screenPos));
}

void ContextMenuStateMachine::openEdge(const ConnectorId& connectorId, const QPointF& screenPos)
{
    setState(ContextMenuState::edge(connectorId, screenPos));
}

bool ContextMenuStateMachine::close(ContextMenuCloseReason reason)
{
    if (!m_state.isOpen())
        return false;
    setState(ContextMenuState::closed());
    emit closed(reason);
    return true;
}

void ContextMenuStateMachine::setState(const ContextMenuState& next)
{
    if (m_state == next)
        return;
    m_state = next;
    emit stateChanged();
}

} // namespace ArchDiagram::State
