// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/state/DiagramSelectionModel.hpp"

namespace ArchDiagram::State {

DiagramSelectionModel::DiagramSelectionModel(QObject* parent)
    : QObject(parent)
{}

void DiagramSelectionModel::selectBlock(const BlockId& id)
{
    const PortRef port = (m_port.blockId == id) ? m_port : PortRef{};
    setState(id, ConnectorId{}, port);
}

void DiagramSelectionModel::selectConnector(const ConnectorId& id)
{
    setState(BlockId{}, id, PortRef{});
}

void DiagramSelectionModel::selectPort(const PortRef& port)
{
    if (!port.isValid()) {
        clearSelectedPort();
        return;
    }
    setState(port.blockId, ConnectorId{}, port);
}

void DiagramSelectionModel::clearSelectedPort()
{
    setState(m_block, m_connector, PortRef{});
}

void DiagramSelectionModel::clear()
{
    setState(BlockId{}, ConnectorId{}, PortRef{});
}

void DiagramSelectionModel::applySurfaceSelection(const QList<BlockId>& nodes, const QList<ConnectorId>& edges)
{
    if (!nodes.isEmpty()) {
        selectBlock(nodes.front());
        return;
    }
    if (!edges.isEmpty()) {
        selectConnector(edges.front());
        return;
    }
    clear();
}

bool DiagramSelectionModel::pruneMissing(const DiagramSnapshot& snapshot)
{
    BlockId block = m_block;
    ConnectorId connector = m_connector;
    PortRef port = m_port;

    const Block* selected = block.isNull() ? nullptr : snapshot.findBlock(block);
    if (!block.isNull() && !selected)
        block = BlockId{};
    if (!connector.isNull() && !snapshot.findConnector(connector))
        connector = ConnectorId{};
    if (port.isValid() && (!selected || !selected->ownsPort(port.portId)))
        port = PortRef{};

    return setState(block, connector, port);
}

bool DiagramSelectionModel::setState(const BlockId& block, const ConnectorId& connector, const PortRef& port)
{
    const bool selectionDiffers = block != m_block || connector != m_connector;
    const bool portDiffers = !(port == m_port);
    if (!selectionDiffers && !portDiffers)
        return false;

    m_block = block;
    m_connector = connector;
    m_port = port;

    if (selectionDiffers)
        emit selectionChanged();
    if (portDiffers)
        emit selectedPortChanged();
    return true;
}

} // namespace ArchDiagram::State
