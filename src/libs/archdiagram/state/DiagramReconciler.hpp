// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/EngineSettings.hpp"
#include "archdiagram/api/VisualTypes.hpp"
#include "archdiagram/model/DiagramSnapshot.hpp"
#include "archdiagram/utils/DiagramGeometry.hpp"

#include <QtCore/QSet>

#include <optional>

namespace ArchDiagram::State {

struct ARCHDIAGRAM_EXPORT InflightPortPlacement final {
    PortRef port;
    Support::PortPlacement placement;
};

// Interaction state layered over the snapshot for one pass.
struct ARCHDIAGRAM_EXPORT ReconcileContext final {
    QSet<BlockId> dragging;
    BlockId selectedBlock;
    ConnectorId selectedConnector;
    PortRef selectedPort;
    std::optional<InflightPortPlacement> inflightPort;
};

struct ARCHDIAGRAM_EXPORT ReconcileStats final {
    int reusedNodes = 0;
    int rebuiltNodes = 0;
    int removedNodes = 0;
    int reusedEdges = 0;
    int rebuiltEdges = 0;
    int removedEdges = 0;
    int skippedEdges = 0;
    int droppedHandles = 0;
};

// Turns a snapshot into the surface's node and edge lists. Entries whose
// visible content did not change are carried over from |previous| by pointer.
// A block being dragged keeps the position it already has on screen.
class ARCHDIAGRAM_EXPORT DiagramReconciler final
{
public:
    explicit DiagramReconciler(const EngineSettings& settings = engineSettingsDefaults());

    void setSettings(const EngineSettings& settings) { m_settings = settings; }
    const EngineSettings& settings() const noexcept { return m_settings; }

    Api::VisualScene reconcile(const DiagramSnapshot& snapshot,
                               const Api::VisualScene& previous,
                               const ReconcileContext& context,
                               ReconcileStats* stats = nullptr) const;

    // Moves one node without touching any other entry. Used while the
    // surface reports an unsettled drag.
    static Api::VisualScene withNodePosition(const Api::VisualScene& scene,
                                             const BlockId& blockId,
                                             const QPointF& position);

private:
    Api::VisualNode buildNode(const Block& block,
                              const Api::VisualNodePtr& previous,
                              const ReconcileContext& context) const;
    std::optional<Api::VisualEdge> buildEdge(const Connector& connector,
                                             const QHash<BlockId, const Block*>& blocks,
                                             const ReconcileContext& context,
                                             ReconcileStats& stats) const;

    EngineSettings m_settings;
};

} // namespace ArchDiagram::State
