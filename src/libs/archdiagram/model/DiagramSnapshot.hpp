// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/model/DiagramModel.hpp"

#include <optional>

namespace ArchDiagram {

// Authoritative content of the active diagram as last seen from the store,
// with local optimistic edits applied on top.
struct ARCHDIAGRAM_EXPORT DiagramSnapshot final {
    std::optional<Diagram> diagram;
    QVector<Block> blocks;
    QVector<Connector> connectors;

    bool hasDiagram() const noexcept { return diagram.has_value(); }

    const Block* findBlock(const BlockId& id) const;
    Block* findBlock(const BlockId& id);
    const Connector* findConnector(const ConnectorId& id) const;
    Connector* findConnector(const ConnectorId& id);

    bool removeBlock(const BlockId& id);
    bool removeConnector(const ConnectorId& id);
    // Removes every connector touching |blockId|; returns how many went.
    int removeConnectorsOf(const BlockId& blockId);

    bool operator==(const DiagramSnapshot&) const = default;
};

} // namespace ArchDiagram
