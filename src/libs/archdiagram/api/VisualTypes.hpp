// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"
#include "archdiagram/model/DiagramModel.hpp"
#include "archdiagram/utils/DiagramGeometry.hpp"
#include "archdiagram/utils/DiagramStyle.hpp"

#include <QtCore/QPointF>
#include <QtCore/QSizeF>
#include <QtCore/QVector>

#include <memory>
#include <optional>

namespace ArchDiagram::Api {

struct ARCHDIAGRAM_EXPORT VisualPort final {
    PortId id;
    QString name;
    PortDirection direction = PortDirection::In;
    Support::PortPlacement placement;
    // Relative to the node's top-left corner.
    QPointF anchor;
    Support::ResolvedPortStyle style;
    bool selected = false;
    bool dragging = false;

    bool operator==(const VisualPort&) const = default;
};

// What the surface draws for a block. Never persisted.
struct ARCHDIAGRAM_EXPORT VisualNode final {
    BlockId id;
    QPointF position;
    QSizeF size;
    Block block;
    Support::ResolvedBlockStyle style;
    QVector<VisualPort> ports;
    bool selected = false;
    bool dragging = false;

    const VisualPort* findPort(const PortId& portId) const;

    bool operator==(const VisualNode&) const = default;
};

struct ARCHDIAGRAM_EXPORT VisualEdge final {
    ConnectorId id;
    BlockId source;
    BlockId target;
    std::optional<PortId> sourceHandle;
    std::optional<PortId> targetHandle;
    std::optional<QString> label;
    ConnectorKind kind = ConnectorKind::Flow;
    Support::ResolvedConnectorStyle style;
    bool selected = false;

    bool operator==(const VisualEdge&) const = default;
};

using VisualNodePtr = std::shared_ptr<const VisualNode>;
using VisualEdgePtr = std::shared_ptr<const VisualEdge>;

// Unchanged entries keep their pointer from one pass to the next, so a
// surface can skip work by comparing pointers.
struct ARCHDIAGRAM_EXPORT VisualScene final {
    QVector<VisualNodePtr> nodes;
    QVector<VisualEdgePtr> edges;

    bool isEmpty() const noexcept { return nodes.isEmpty() && edges.isEmpty(); }
    VisualNodePtr node(const BlockId& id) const;
    VisualEdgePtr edge(const ConnectorId& id) const;
};

} // namespace ArchDiagram::Api
