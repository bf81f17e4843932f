// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/utils/DiagramGeometry.hpp"

#include <QtCore/QRandomGenerator>

#include <algorithm>
#include <array>

namespace ArchDiagram::Support {

namespace {

int jitter(QRandomGenerator* rng, int bound)
{
    if (bound <= 0)
        return 0;
    return static_cast<int>(rng->bounded(bound));
}

} // namespace

double EdgeDistances::to(PortEdge edge) const noexcept
{
    switch (edge) {
        case PortEdge::Left: return left;
        case PortEdge::Right: return right;
        case PortEdge::Top: return top;
        case PortEdge::Bottom: return bottom;
    }
    return left;
}

PortEdge EdgeDistances::nearest() const noexcept
{
    constexpr std::array<PortEdge, 4> order{PortEdge::Left, PortEdge::Right, PortEdge::Top, PortEdge::Bottom};
    PortEdge best = order.front();
    double bestDistance = to(best);
    for (PortEdge edge : order) {
        const double d = to(edge);
        if (d < bestDistance) {
            best = edge;
            bestDistance = d;
        }
    }
    return best;
}

EdgeDistances edgeDistances(const QPointF& local, const QSizeF& blockSize)
{
    EdgeDistances d;
    d.left = local.x();
    d.right = blockSize.width() - local.x();
    d.top = local.y();
    d.bottom = blockSize.height() - local.y();
    return d;
}

QPointF computeBlockPlacement(int blockCount, QRandomGenerator* rng, const EngineSettings& settings)
{
    if (!rng)
        rng = QRandomGenerator::global();

    const int n = std::max(blockCount, 0);
    const double x = settings.placementOrigin + settings.placementStepX * n
                     + jitter(rng, settings.placementJitter);
    const double y = settings.placementOrigin + settings.placementStepY * n
                     + jitter(rng, settings.placementJitter);
    return QPointF(x, y);
}

QPointF duplicatePlacement(const Block& block)
{
    return QPointF(block.position.x() + block.size.width() + Constants::kDuplicateGap,
                   block.position.y() + Constants::kDuplicateDropY);
}

QSizeF clampBlockSize(const QSizeF& size, const EngineSettings& settings)
{
    return QSizeF(std::clamp(size.width(), settings.minBlockSize.width(), settings.maxBlockSize.width()),
                  std::clamp(size.height(), settings.minBlockSize.height(), settings.maxBlockSize.height()));
}

double clampPortOffset(double offset, const EngineSettings& settings)
{
    return std::clamp(offset, settings.minPortOffset, settings.maxPortOffset);
}

PortEdge defaultEdgeForDirection(PortDirection direction)
{
    return direction == PortDirection::Out ? PortEdge::Right : PortEdge::Left;
}

double projectOffset(const QPointF& local, const QSizeF& blockSize, PortEdge edge, const EngineSettings& settings)
{
    const bool vertical = edge == PortEdge::Left || edge == PortEdge::Right;
    const double extent = vertical ? blockSize.height() : blockSize.width();
    if (extent <= 1e-6)
        return clampPortOffset(50.0, settings);

    const double along = vertical ? local.y() : local.x();
    return clampPortOffset(along / extent * 100.0, settings);
}

PortPlacement resolvePortPlacement(const QPointF& local,
                                   const QSizeF& blockSize,
                                   std::optional<PortEdge> currentEdge,
                                   bool dragging,
                                   const EngineSettings& settings)
{
    const EdgeDistances d = edgeDistances(local, blockSize);
    const PortEdge nearest = d.nearest();

    PortEdge edge = nearest;
    if (currentEdge && dragging) {
        const double currentDistance = d.to(*currentEdge);
        const bool clearlyCloser = d.to(nearest) < currentDistance - settings.hysteresisMargin;
        const bool released = currentDistance > settings.edgeReleaseDistance;
        edge = (clearlyCloser || released) ? nearest : *currentEdge;
    } else if (currentEdge) {
        edge = *currentEdge;
    }

    return PortPlacement{edge, projectOffset(local, blockSize, edge, settings)};
}

QVector<PortPlacement> resolvePortLayout(const Block& block, const EngineSettings& settings)
{
    QVector<PortPlacement> placements;
    placements.reserve(block.ports.size());

    std::array<int, 4> unplacedPerEdge{};
    for (const Port& port : block.ports) {
        const PortEdge edge = port.edge.value_or(defaultEdgeForDirection(port.direction));
        placements.push_back(PortPlacement{edge, port.offset ? clampPortOffset(*port.offset, settings) : -1.0});
        if (!port.offset)
            ++unplacedPerEdge[static_cast<std::size_t>(edge)];
    }

    std::array<int, 4> seen{};
    for (PortPlacement& placement : placements) {
        if (placement.offset >= 0.0)
            continue;
        const auto slot = static_cast<std::size_t>(placement.edge);
        const int index = seen[slot]++;
        const double spread = (index + 1) * 100.0 / (unplacedPerEdge[slot] + 1);
        placement.offset = clampPortOffset(spread, settings);
    }
    return placements;
}

QPointF portAnchor(const QRectF& blockRect, const PortPlacement& placement)
{
    const double t = placement.offset / 100.0;
    switch (placement.edge) {
        case PortEdge::Left: return QPointF(blockRect.left(), blockRect.top() + blockRect.height() * t);
        case PortEdge::Right: return QPointF(blockRect.right(), blockRect.top() + blockRect.height() * t);
        case PortEdge::Top: return QPointF(blockRect.left() + blockRect.width() * t, blockRect.top());
        case PortEdge::Bottom: return QPointF(blockRect.left() + blockRect.width() * t, blockRect.bottom());
    }
    return blockRect.center();
}

} // namespace ArchDiagram::Support
