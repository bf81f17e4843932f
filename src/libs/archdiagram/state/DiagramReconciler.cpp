// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/state/DiagramReconciler.hpp"

#include "archdiagram/utils/DiagramStyle.hpp"

#include <QtCore/QHash>
#include <QtCore/QLoggingCategory>
#include <QtCore/QRectF>

#include <memory>

Q_LOGGING_CATEGORY(reconcilelog, "archdiagram.reconcile")

namespace ArchDiagram::State {

using Api::VisualEdge;
using Api::VisualEdgePtr;
using Api::VisualNode;
using Api::VisualNodePtr;
using Api::VisualPort;
using Api::VisualScene;

DiagramReconciler::DiagramReconciler(const EngineSettings& settings)
    : m_settings(settings)
{}

VisualScene DiagramReconciler::reconcile(const DiagramSnapshot& snapshot,
                                         const VisualScene& previous,
                                         const ReconcileContext& context,
                                         ReconcileStats* stats) const
{
    ReconcileStats local;
    ReconcileStats& s = stats ? *stats : local;
    s = ReconcileStats{};

    VisualScene out;
    if (!snapshot.hasDiagram()) {
        s.removedNodes = previous.nodes.size();
        s.removedEdges = previous.edges.size();
        return out;
    }

    QHash<BlockId, VisualNodePtr> previousNodes;
    for (const VisualNodePtr& node : previous.nodes) {
        if (node)
            previousNodes.insert(node->id, node);
    }
    QHash<ConnectorId, VisualEdgePtr> previousEdges;
    for (const VisualEdgePtr& edge : previous.edges) {
        if (edge)
            previousEdges.insert(edge->id, edge);
    }

    QHash<BlockId, const Block*> blocks;
    out.nodes.reserve(snapshot.blocks.size());
    for (const Block& block : snapshot.blocks) {
        if (blocks.contains(block.id)) {
            qCDebug(reconcilelog) << "Skipping duplicate block" << block.id.toString();
            continue;
        }
        blocks.insert(block.id, &block);

        const VisualNodePtr prev = previousNodes.take(block.id);
        VisualNode candidate = buildNode(block, prev, context);
        if (prev && *prev == candidate) {
            out.nodes.push_back(prev);
            ++s.reusedNodes;
        } else {
            out.nodes.push_back(std::make_shared<const VisualNode>(std::move(candidate)));
            ++s.rebuiltNodes;
        }
    }
    s.removedNodes = previousNodes.size();

    out.edges.reserve(snapshot.connectors.size());
    for (const Connector& connector : snapshot.connectors) {
        auto candidate = buildEdge(connector, blocks, context, s);
        if (!candidate)
            continue;

        const VisualEdgePtr prev = previousEdges.take(connector.id);
        if (prev && *prev == *candidate) {
            out.edges.push_back(prev);
            ++s.reusedEdges;
        } else {
            out.edges.push_back(std::make_shared<const VisualEdge>(std::move(*candidate)));
            ++s.rebuiltEdges;
        }
    }
    s.removedEdges = previousEdges.size();

    qCDebug(reconcilelog).nospace() << "reconcile: nodes " << s.reusedNodes << " kept/" << s.rebuiltNodes
                                    << " rebuilt/" << s.removedNodes << " removed, edges " << s.reusedEdges
                                    << " kept/" << s.rebuiltEdges << " rebuilt/" << s.removedEdges
                                    << " removed";
    return out;
}

VisualNode DiagramReconciler::buildNode(const Block& block,
                                        const VisualNodePtr& previous,
                                        const ReconcileContext& context) const
{
    VisualNode node;
    node.id = block.id;
    node.dragging = context.dragging.contains(block.id);
    node.position = (node.dragging && previous) ? previous->position : block.position;
    node.size = Support::clampBlockSize(block.size, m_settings);
    node.selected = context.selectedBlock == block.id;

    node.block = block;
    node.block.position = node.position;
    node.block.size = node.size;
    node.style = Support::resolveBlockStyle(block, node.selected);

    const QVector<Support::PortPlacement> layout = Support::resolvePortLayout(block, m_settings);
    const QRectF localRect(QPointF(0.0, 0.0), node.size);
    node.ports.reserve(block.ports.size());
    for (qsizetype i = 0; i < block.ports.size(); ++i) {
        const Port& port = block.ports.at(i);
        const PortRef ref{block.id, port.id};

        VisualPort visual;
        visual.id = port.id;
        visual.name = port.name;
        visual.direction = port.direction;
        visual.placement = layout.at(i);
        if (context.inflightPort && context.inflightPort->port == ref) {
            visual.placement = context.inflightPort->placement;
            visual.dragging = true;
        }
        visual.anchor = Support::portAnchor(localRect, visual.placement);
        visual.selected = context.selectedPort == ref;
        visual.style = Support::resolvePortStyle(port, visual.selected);
        node.ports.push_back(std::move(visual));
    }
    return node;
}

std::optional<VisualEdge> DiagramReconciler::buildEdge(const Connector& connector,
                                                       const QHash<BlockId, const Block*>& blocks,
                                                       const ReconcileContext& context,
                                                       ReconcileStats& stats) const
{
    const Block* source = blocks.value(connector.source, nullptr);
    const Block* target = blocks.value(connector.target, nullptr);
    if (!source || !target) {
        qCDebug(reconcilelog) << "Skipping connector" << connector.id.toString()
                              << "with a missing endpoint block";
        ++stats.skippedEdges;
        return std::nullopt;
    }

    VisualEdge edge;
    edge.id = connector.id;
    edge.source = connector.source;
    edge.target = connector.target;
    edge.kind = connector.kind;
    edge.label = connector.label;
    edge.style = Support::resolveConnectorStyle(connector);
    edge.selected = context.selectedConnector == connector.id;

    if (connector.sourcePortId) {
        if (source->ownsPort(*connector.sourcePortId)) {
            edge.sourceHandle = connector.sourcePortId;
        } else {
            qCDebug(reconcilelog) << "Dropping foreign source port on" << connector.id.toString();
            ++stats.droppedHandles;
        }
    }
    if (connector.targetPortId) {
        if (target->ownsPort(*connector.targetPortId)) {
            edge.targetHandle = connector.targetPortId;
        } else {
            qCDebug(reconcilelog) << "Dropping foreign target port on" << connector.id.toString();
            ++stats.droppedHandles;
        }
    }
    return edge;
}

VisualScene DiagramReconciler::withNodePosition(const VisualScene& scene,
                                                const BlockId& blockId,
                                                const QPointF& position)
{
    VisualScene out = scene;
    for (VisualNodePtr& node : out.nodes) {
        if (!node || node->id != blockId)
            continue;
        if (node->position == position && node->dragging)
            break;
        auto moved = std::make_shared<VisualNode>(*node);
        moved->position = position;
        moved->block.position = position;
        moved->dragging = true;
        node = std::move(moved);
        break;
    }
    return out;
}

} // namespace ArchDiagram::State
