// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "archdiagram/utils/DiagramGeometry.hpp"
#include "archdiagram/utils/PortEdgeTracker.hpp"

#include <QtCore/QRandomGenerator>

using namespace ArchDiagram;
using namespace ArchDiagram::Support;

namespace {

const QSizeF kBlock(220, 140);

Port makePort(const char* id, PortDirection direction)
{
    Port port;
    port.id = PortId(QString::fromLatin1(id));
    port.name = QString::fromLatin1(id);
    port.direction = direction;
    return port;
}

} // namespace

TEST(DiagramGeometryTests, NearestEdgeWinsWithoutCurrentEdge)
{
    const PortPlacement placement = resolvePortPlacement(QPointF(5, 70), kBlock, std::nullopt, false);
    EXPECT_EQ(placement.edge, PortEdge::Left);
    EXPECT_DOUBLE_EQ(placement.offset, 50.0);

    EXPECT_EQ(resolvePortPlacement(QPointF(215, 20), kBlock, std::nullopt, false).edge, PortEdge::Right);
    EXPECT_EQ(resolvePortPlacement(QPointF(110, 138), kBlock, std::nullopt, false).edge, PortEdge::Bottom);
}

TEST(DiagramGeometryTests, EdgeTiesResolveInFixedOrder)
{
    EXPECT_EQ(edgeDistances(QPointF(70, 70), QSizeF(140, 140)).nearest(), PortEdge::Left);
    EXPECT_EQ(edgeDistances(QPointF(200, 10), QSizeF(210, 140)).nearest(), PortEdge::Right);
}

TEST(DiagramGeometryTests, HysteresisKeepsCurrentEdgeWithinMargin)
{
    // Top is closer by 15, less than the 20px margin.
    EXPECT_EQ(resolvePortPlacement(QPointF(40, 25), kBlock, PortEdge::Left, true).edge, PortEdge::Left);
    // Closer by 25: switch.
    EXPECT_EQ(resolvePortPlacement(QPointF(40, 15), kBlock, PortEdge::Left, true).edge, PortEdge::Top);
}

TEST(DiagramGeometryTests, ReleaseDistanceForcesSwitch)
{
    // Top is only 15px closer, but left is beyond the 100px release distance.
    const PortPlacement placement = resolvePortPlacement(QPointF(110, 95), QSizeF(400, 300), PortEdge::Left, true);
    EXPECT_EQ(placement.edge, PortEdge::Top);
}

TEST(DiagramGeometryTests, CurrentEdgeIsKeptWhenNotDragging)
{
    const PortPlacement placement = resolvePortPlacement(QPointF(200, 70), kBlock, PortEdge::Left, false);
    EXPECT_EQ(placement.edge, PortEdge::Left);
    EXPECT_DOUBLE_EQ(placement.offset, 50.0);
}

TEST(DiagramGeometryTests, OffsetsAreClampedToTheEdgeMargins)
{
    EXPECT_DOUBLE_EQ(projectOffset(QPointF(0, 0), kBlock, PortEdge::Left), 5.0);
    EXPECT_DOUBLE_EQ(projectOffset(QPointF(0, 140), kBlock, PortEdge::Right), 95.0);
    EXPECT_DOUBLE_EQ(projectOffset(QPointF(55, 0), kBlock, PortEdge::Top), 25.0);
    EXPECT_DOUBLE_EQ(projectOffset(QPointF(10, 10), QSizeF(0, 0), PortEdge::Top), 50.0);
    EXPECT_DOUBLE_EQ(clampPortOffset(-10.0), 5.0);
    EXPECT_DOUBLE_EQ(clampPortOffset(120.0), 95.0);
}

TEST(DiagramGeometryTests, TrackerSwitchesAtMostOnceNearACorner)
{
    PortEdgeTracker tracker;
    tracker.begin(PortRef{BlockId(QStringLiteral("b")), PortId(QStringLiteral("p"))}, PortPlacement{PortEdge::Left, 50});

    // Left and top distances stay within 19px of each other.
    const QList<QPointF> path = {QPointF(30, 25), QPointF(25, 30), QPointF(28, 22), QPointF(22, 28),
                                 QPointF(31, 20), QPointF(20, 31), QPointF(26, 26), QPointF(35, 18)};
    for (const QPointF& point : path)
        ASSERT_TRUE(tracker.update(point, kBlock).has_value());

    EXPECT_LE(tracker.edgeSwitchCount(), 1);

    const auto final = tracker.finish();
    ASSERT_TRUE(final.has_value());
    EXPECT_FALSE(tracker.isActive());
    EXPECT_FALSE(tracker.update(QPointF(1, 1), kBlock).has_value());
}

TEST(DiagramGeometryTests, TrackerIgnoresUpdatesWhenIdle)
{
    PortEdgeTracker tracker;
    EXPECT_FALSE(tracker.update(QPointF(5, 5), kBlock).has_value());
    EXPECT_FALSE(tracker.finish().has_value());

    tracker.begin(PortRef{}, PortPlacement{});
    EXPECT_FALSE(tracker.isActive());
}

TEST(DiagramGeometryTests, PlacementCascadesFromOrigin)
{
    EngineSettings settings = engineSettingsDefaults();
    settings.placementJitter = 0;

    EXPECT_EQ(computeBlockPlacement(0, nullptr, settings), QPointF(160, 160));
    EXPECT_EQ(computeBlockPlacement(2, nullptr, settings), QPointF(280, 240));

    QRandomGenerator rng(7);
    const QPointF jittered = computeBlockPlacement(1, &rng);
    EXPECT_GE(jittered.x(), 220.0);
    EXPECT_LT(jittered.x(), 260.0);
    EXPECT_GE(jittered.y(), 200.0);
    EXPECT_LT(jittered.y(), 240.0);
}

TEST(DiagramGeometryTests, DuplicatesLandBesideTheOriginal)
{
    Block block;
    block.position = QPointF(100, 50);
    block.size = QSizeF(220, 140);
    EXPECT_EQ(duplicatePlacement(block), QPointF(360, 90));
}

TEST(DiagramGeometryTests, BlockSizeIsClamped)
{
    EXPECT_EQ(clampBlockSize(QSizeF(10, 10)), QSizeF(220, 140));
    EXPECT_EQ(clampBlockSize(QSizeF(900, 900)), QSizeF(500, 400));
    EXPECT_EQ(clampBlockSize(QSizeF(300, 200)), QSizeF(300, 200));
}

TEST(DiagramGeometryTests, LayoutSpreadsUnplacedPortsPerEdge)
{
    Block block;
    block.ports = {makePort("a", PortDirection::In), makePort("b", PortDirection::In),
                   makePort("c", PortDirection::In), makePort("d", PortDirection::Out)};
    Port pinned = makePort("e", PortDirection::InOut);
    pinned.edge = PortEdge::Top;
    pinned.offset = 99.0;
    block.ports.push_back(pinned);

    const QVector<PortPlacement> layout = resolvePortLayout(block);
    ASSERT_EQ(layout.size(), 5);
    EXPECT_EQ(layout[0], (PortPlacement{PortEdge::Left, 25.0}));
    EXPECT_EQ(layout[1], (PortPlacement{PortEdge::Left, 50.0}));
    EXPECT_EQ(layout[2], (PortPlacement{PortEdge::Left, 75.0}));
    EXPECT_EQ(layout[3], (PortPlacement{PortEdge::Right, 50.0}));
    EXPECT_EQ(layout[4], (PortPlacement{PortEdge::Top, 95.0}));
}

TEST(DiagramGeometryTests, AnchorsSitOnThePerimeter)
{
    const QRectF rect(0, 0, 200, 100);
    EXPECT_EQ(portAnchor(rect, PortPlacement{PortEdge::Left, 50}), QPointF(0, 50));
    EXPECT_EQ(portAnchor(rect, PortPlacement{PortEdge::Bottom, 25}), QPointF(50, 100));
}
