// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"
#include "archdiagram/model/DiagramSnapshot.hpp"

#include <QtCore/QList>
#include <QtCore/QObject>

namespace ArchDiagram::State {

// Single selection: one block or one connector (never both), plus at most one
// port of the selected block.
class ARCHDIAGRAM_EXPORT DiagramSelectionModel final : public QObject
{
    Q_OBJECT

public:
    explicit DiagramSelectionModel(QObject* parent = nullptr);

    const BlockId& selectedBlock() const noexcept { return m_block; }
    const ConnectorId& selectedConnector() const noexcept { return m_connector; }
    const PortRef& selectedPort() const noexcept { return m_port; }
    bool hasSelection() const noexcept { return !m_block.isNull() || !m_connector.isNull(); }
    bool hasSelectedPort() const noexcept { return m_port.isValid(); }

    void selectBlock(const BlockId& id);
    void selectConnector(const ConnectorId& id);
    // Also selects the owning block.
    void selectPort(const PortRef& port);
    void clearSelectedPort();
    void clear();

    // Surface-reported selection: the first node wins, else the first edge.
    void applySurfaceSelection(const QList<BlockId>& nodes, const QList<ConnectorId>& edges);

    // Drops selections whose entity is no longer in |snapshot|. Returns true
    // when anything changed.
    bool pruneMissing(const DiagramSnapshot& snapshot);

signals:
    void selectionChanged();
    void selectedPortChanged();

private:
    bool setState(const BlockId& block, const ConnectorId& connector, const PortRef& port);

    BlockId m_block;
    ConnectorId m_connector;
    PortRef m_port;
};

} // namespace ArchDiagram::State
