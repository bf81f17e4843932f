// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"
#include "archdiagram/EngineSettings.hpp"
#include "archdiagram/model/DiagramModel.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSizeF>
#include <QtCore/QVector>

#include <optional>

class QRandomGenerator;

namespace ArchDiagram::Support {

struct ARCHDIAGRAM_EXPORT PortPlacement final {
    PortEdge edge = PortEdge::Left;
    double offset = 50.0;

    bool operator==(const PortPlacement&) const = default;
};

// Signed distances from a block-local point to each edge. Negative values mean
// the point lies outside on that side.
struct ARCHDIAGRAM_EXPORT EdgeDistances final {
    double left = 0.0;
    double right = 0.0;
    double top = 0.0;
    double bottom = 0.0;

    double to(PortEdge edge) const noexcept;
    // Ties resolve left, right, top, bottom.
    PortEdge nearest() const noexcept;
};

ARCHDIAGRAM_EXPORT EdgeDistances edgeDistances(const QPointF& local, const QSizeF& blockSize);

// Position for the |blockCount|-th new block: a diagonal cascade plus jitter.
// |rng| defaults to the global generator.
ARCHDIAGRAM_EXPORT QPointF computeBlockPlacement(int blockCount,
                                                 QRandomGenerator* rng = nullptr,
                                                 const EngineSettings& settings = engineSettingsDefaults());

ARCHDIAGRAM_EXPORT QPointF duplicatePlacement(const Block& block);

ARCHDIAGRAM_EXPORT QSizeF clampBlockSize(const QSizeF& size,
                                         const EngineSettings& settings = engineSettingsDefaults());

ARCHDIAGRAM_EXPORT double clampPortOffset(double offset,
                                          const EngineSettings& settings = engineSettingsDefaults());

ARCHDIAGRAM_EXPORT PortEdge defaultEdgeForDirection(PortDirection direction);

// Pointer projection along |edge| in percent, clamped.
ARCHDIAGRAM_EXPORT double projectOffset(const QPointF& local,
                                        const QSizeF& blockSize,
                                        PortEdge edge,
                                        const EngineSettings& settings = engineSettingsDefaults());

// Picks the edge a port should attach to for a block-local pointer position.
// Without |currentEdge| the nearest edge wins. While |dragging| with a current
// edge, the port only moves to another edge when that edge is closer by more
// than the hysteresis margin or the pointer has left the current edge's
// release distance.
ARCHDIAGRAM_EXPORT PortPlacement resolvePortPlacement(const QPointF& local,
                                                      const QSizeF& blockSize,
                                                      std::optional<PortEdge> currentEdge,
                                                      bool dragging,
                                                      const EngineSettings& settings = engineSettingsDefaults());

// Resolved edge and offset for each port of |block|, in port order. Ports
// without an explicit offset are spread evenly along their edge.
ARCHDIAGRAM_EXPORT QVector<PortPlacement> resolvePortLayout(const Block& block,
                                                            const EngineSettings& settings = engineSettingsDefaults());

// Point on the perimeter of |blockRect| for a placement.
ARCHDIAGRAM_EXPORT QPointF portAnchor(const QRectF& blockRect, const PortPlacement& placement);

} // namespace ArchDiagram::Support
