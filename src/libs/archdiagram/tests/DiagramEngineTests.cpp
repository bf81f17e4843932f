// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "archdiagram/DiagramEngine.hpp"
#include "archdiagram/state/DiagramSelectionModel.hpp"
#include "archdiagram/store/InMemoryDiagramStore.hpp"

#include "ArchDiagramTestSupport.hpp"

#include <QtTest/QSignalSpy>

#include <memory>

using namespace ArchDiagram;
using ArchDiagram::Store::InMemoryDiagramStore;
using ArchDiagram::Tests::drainEvents;
using ArchDiagram::Tests::ensureCoreApp;
using ArchDiagram::Tests::RecordingSurface;
using ArchDiagram::Tests::waitUntil;

namespace {

const BlockId kA(QStringLiteral("a"));
const BlockId kB(QStringLiteral("b"));

Block makeBlock(const BlockId& id, QPointF position)
{
    Block block;
    block.id = id;
    block.name = id.toString();
    block.position = position;
    block.size = QSizeF(220, 140);
    return block;
}

class DiagramEngineTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ensureCoreApp();
        diagram = store.createDiagram(QStringLiteral("acme"), QStringLiteral("PRJ"), QStringLiteral("Context"));
        scope = store.scopeFor(diagram);
        ASSERT_TRUE(store.seedBlock(scope, makeBlock(kA, QPointF(0, 0))).ok);
        ASSERT_TRUE(store.seedBlock(scope, makeBlock(kB, QPointF(400, 0))).ok);

        EngineSettings settings = engineSettingsDefaults();
        settings.debounceMs = 30;
        settings.placementJitter = 0;

        engine = std::make_unique<DiagramEngine>(&store);
        engine->setSettings(settings);
        engine->setSurface(&surface);
        engine->setActiveDiagram(scope, diagram);
        ASSERT_TRUE(waitUntil([this]() { return engine->snapshot().blocks.size() == 2; }));
        drainEvents(50);
        store.clearWriteLog();
    }

    void settle(int ms = 120) { drainEvents(ms); }

    const Block* block(const BlockId& id) const { return engine->snapshot().findBlock(id); }

    void switchToOtherDiagram()
    {
        other = store.createDiagram(QStringLiteral("acme"), QStringLiteral("PRJ"), QStringLiteral("Other"));
        engine->setActiveDiagram(store.scopeFor(other), other);
    }

    InMemoryDiagramStore store;
    RecordingSurface surface;
    Diagram diagram;
    Api::DiagramScope scope;
    Diagram other;
    std::unique_ptr<DiagramEngine> engine;
};

} // namespace

TEST_F(DiagramEngineTests, LoadedContentReachesTheSurface)
{
    EXPECT_TRUE(engine->hasActiveDiagram());
    EXPECT_EQ(surface.lastScene.nodes.size(), 2);
    EXPECT_TRUE(surface.lastScene.node(kA));
    EXPECT_GT(surface.renderCount, 0);
}

TEST_F(DiagramEngineTests, SettledDragsCollapseIntoOneWrite)
{
    for (int i = 1; i <= 10; ++i)
        engine->onNodeDrag(kA, QPointF(i * 10, i), true);

    EXPECT_EQ(block(kA)->position, QPointF(100, 10));
    EXPECT_EQ(engine->pendingMutationCount(), 1);

    ASSERT_TRUE(waitUntil([this]() { return store.writeCount(QStringLiteral("updateBlock")) == 1; }));
    settle();
    EXPECT_EQ(store.writeCount(QStringLiteral("updateBlock")), 1);
    EXPECT_EQ(store.block(scope, kA)->position, QPointF(100, 10));
    EXPECT_EQ(block(kA)->position, QPointF(100, 10));
}

TEST_F(DiagramEngineTests, UnsettledDragOnlyMovesTheVisualNode)
{
    const Api::VisualNodePtr before = engine->scene().node(kB);
    engine->onNodeDrag(kA, QPointF(70, 70), false);

    EXPECT_TRUE(engine->isDragging(kA));
    EXPECT_EQ(engine->scene().node(kA)->position, QPointF(70, 70));
    EXPECT_EQ(engine->scene().node(kB), before);
    EXPECT_EQ(block(kA)->position, QPointF(0, 0));

    settle();
    EXPECT_TRUE(store.writes().isEmpty());
}

TEST_F(DiagramEngineTests, SurfaceSelectionMarksTheRenderedNode)
{
    engine->onSelectionChange({kB}, {});
    EXPECT_EQ(engine->selection()->selectedBlock(), kB);
    EXPECT_TRUE(surface.lastScene.node(kB)->selected);
    EXPECT_FALSE(surface.lastScene.node(kA)->selected);

    engine->onSelectionChange({}, {});
    EXPECT_FALSE(engine->selection()->hasSelection());
    EXPECT_FALSE(surface.lastScene.node(kB)->selected);
}

TEST_F(DiagramEngineTests, ResizeIsClampedAndPersisted)
{
    engine->onNodeResize(kA, QSizeF(1000, 10));
    EXPECT_EQ(block(kA)->size, QSizeF(500, 140));

    ASSERT_TRUE(waitUntil([this]() { return store.block(scope, kA)->size == QSizeF(500, 140); }));
}

TEST_F(DiagramEngineTests, SwitchingDiagramsCancelsPendingWrites)
{
    engine->onNodeDrag(kA, QPointF(300, 300), true);
    ASSERT_EQ(engine->pendingMutationCount(), 1);

    QSignalSpy switched(engine.get(), &DiagramEngine::activeDiagramChanged);
    switchToOtherDiagram();
    EXPECT_EQ(switched.count(), 1);
    EXPECT_EQ(engine->pendingMutationCount(), 0);
    EXPECT_TRUE(engine->snapshot().blocks.isEmpty());

    settle(150);
    EXPECT_EQ(store.writeCount(QStringLiteral("updateBlock")), 0);
    EXPECT_EQ(store.block(scope, kA)->position, QPointF(0, 0));
    EXPECT_EQ(engine->snapshot().diagram->id, other.id);
}

TEST_F(DiagramEngineTests, CompletionsFromThePreviousDiagramAreIgnored)
{
    QSignalSpy failures(engine.get(), &DiagramEngine::persistenceFailed);
    store.failNextWrites(1, QStringLiteral("offline"));
    ASSERT_TRUE(engine->removeBlock(kA).ok);

    switchToOtherDiagram();
    settle();
    EXPECT_EQ(failures.count(), 0);
    EXPECT_TRUE(engine->snapshot().blocks.isEmpty());
}

TEST_F(DiagramEngineTests, EmptyUpdatesAreRejectedWithoutWrites)
{
    EXPECT_FALSE(engine->updateBlock(kA, BlockUpdate{}).ok);
    EXPECT_FALSE(engine->updateConnector(ConnectorId(QStringLiteral("missing")), ConnectorUpdate{}).ok);
    EXPECT_FALSE(engine->updatePort(PortRef{kA, PortId(QStringLiteral("p"))}, PortUpdate{}).ok);
    settle(60);
    EXPECT_TRUE(store.writes().isEmpty());
}

TEST_F(DiagramEngineTests, CommandsNeedAnActiveDiagram)
{
    engine->clearActiveDiagram();
    EXPECT_FALSE(engine->hasActiveDiagram());
    EXPECT_TRUE(engine->scene().isEmpty());

    EXPECT_FALSE(engine->addBlock(blockPresets().front()).ok);
    EXPECT_FALSE(engine->onConnect(kA, kB).ok);
    settle(60);
    EXPECT_TRUE(store.writes().isEmpty());
}

TEST_F(DiagramEngineTests, FailedWriteIsReportedAndStoreStateReturns)
{
    QSignalSpy failures(engine.get(), &DiagramEngine::persistenceFailed);
    store.failNextWrites(1, QStringLiteral("offline"));

    ASSERT_TRUE(engine->removeBlock(kB).ok);
    EXPECT_EQ(block(kB), nullptr);

    ASSERT_TRUE(waitUntil([&failures]() { return failures.count() == 1; }));
    EXPECT_EQ(failures.front().at(0).toString(), kB.toString());
    EXPECT_EQ(failures.front().at(1).toString(), QStringLiteral("offline"));

    ASSERT_TRUE(waitUntil([this]() { return block(kB) != nullptr; }));
}

TEST_F(DiagramEngineTests, ConnectCreatesAFlowConnectorAndSelectsIt)
{
    ASSERT_TRUE(engine->selection());
    engine->selection()->selectBlock(kA);

    ASSERT_TRUE(engine->onConnect(kA, kB).ok);
    ASSERT_EQ(engine->snapshot().connectors.size(), 1);
    const Connector created = engine->snapshot().connectors.front();
    EXPECT_EQ(created.kind, ConnectorKind::Flow);
    EXPECT_EQ(engine->selection()->selectedConnector(), created.id);
    EXPECT_TRUE(engine->selection()->selectedBlock().isNull());
    EXPECT_TRUE(engine->scene().edge(created.id)->selected);

    ASSERT_TRUE(waitUntil([this]() { return store.connectors(scope).size() == 1; }));
    EXPECT_EQ(store.connectors(scope).front().id, created.id);
}

TEST_F(DiagramEngineTests, ConnectRejectsUnknownBlocksAndForeignPorts)
{
    PortId portOfA;
    ASSERT_TRUE(engine->addPort(kA, QStringLiteral("out1"), PortDirection::Out, &portOfA).ok);

    EXPECT_FALSE(engine->onConnect(kA, BlockId(QStringLiteral("zzz"))).ok);
    EXPECT_FALSE(engine->onConnect(kA, kB, std::nullopt, portOfA).ok);
    EXPECT_TRUE(engine->onConnect(kA, kB, portOfA, std::nullopt).ok);
    EXPECT_EQ(engine->snapshot().connectors.size(), 1);
}

TEST_F(DiagramEngineTests, RemovingABlockCascadesLocallyAndInTheStore)
{
    ASSERT_TRUE(engine->onConnect(kA, kB).ok);
    ASSERT_TRUE(waitUntil([this]() { return store.connectors(scope).size() == 1; }));

    ASSERT_TRUE(engine->removeBlock(kA).ok);
    EXPECT_TRUE(engine->snapshot().connectors.isEmpty());
    EXPECT_TRUE(engine->scene().edges.isEmpty());

    ASSERT_TRUE(waitUntil([this]() { return store.blocks(scope).size() == 1; }));
    EXPECT_TRUE(store.connectors(scope).isEmpty());
}

TEST_F(DiagramEngineTests, AddedBlocksArePlacedAndSelected)
{
    BlockId created;
    ASSERT_TRUE(engine->addBlock(blockPresets().front(), std::nullopt, &created).ok);

    const Block* added = block(created);
    ASSERT_TRUE(added);
    EXPECT_EQ(added->kind, BlockKind::System);
    EXPECT_EQ(added->stereotype, QStringLiteral("<<system>>"));
    EXPECT_EQ(added->position, QPointF(280, 240));
    EXPECT_EQ(added->size, QSizeF(220, 140));
    EXPECT_EQ(engine->selection()->selectedBlock(), created);

    ASSERT_TRUE(waitUntil([this]() { return store.blocks(scope).size() == 3; }));
}

TEST_F(DiagramEngineTests, DuplicatesAreOffsetAndRenamed)
{
    BlockId copy;
    ASSERT_TRUE(engine->duplicateBlock(kA, &copy).ok);

    const Block* duplicated = block(copy);
    ASSERT_TRUE(duplicated);
    EXPECT_EQ(duplicated->name, QStringLiteral("a copy"));
    EXPECT_EQ(duplicated->position, QPointF(260, 40));
    EXPECT_EQ(duplicated->stereotype, QStringLiteral("block"));
    EXPECT_FALSE(engine->duplicateBlock(BlockId(QStringLiteral("zzz"))).ok);
}

TEST_F(DiagramEngineTests, PortDragSwitchesEdgeAndPersistsOnRelease)
{
    PortId portId;
    ASSERT_TRUE(engine->addPort(kA, QStringLiteral("in1"), PortDirection::In, &portId).ok);
    const PortRef ref{kA, portId};

    engine->onPortDragStart(ref);
    ASSERT_TRUE(engine->portTracker().isActive());
    EXPECT_EQ(engine->selection()->selectedPort(), ref);

    engine->onPortDragMove(QPointF(110, 135));
    const Api::VisualPort* visual = engine->scene().node(kA)->findPort(portId);
    ASSERT_TRUE(visual);
    EXPECT_TRUE(visual->dragging);
    EXPECT_EQ(visual->placement.edge, PortEdge::Bottom);

    engine->onPortDragEnd();
    const Port* port = block(kA)->findPort(portId);
    ASSERT_TRUE(port);
    EXPECT_EQ(port->edge, PortEdge::Bottom);
    ASSERT_TRUE(port->offset.has_value());
    EXPECT_DOUBLE_EQ(*port->offset, 50.0);

    ASSERT_TRUE(waitUntil([this, portId]() {
        const auto stored = store.block(scope, kA);
        const Port* p = stored ? stored->findPort(portId) : nullptr;
        return p && p->edge == PortEdge::Bottom;
    }));
}

TEST_F(DiagramEngineTests, EscapeCancelsAPortDrag)
{
    PortId portId;
    ASSERT_TRUE(engine->addPort(kA, QStringLiteral("in1"), PortDirection::In, &portId).ok);
    ASSERT_TRUE(waitUntil([this]() { return store.writeCount(QStringLiteral("addPort")) == 1; }));
    settle(60);

    engine->onPortDragStart(PortRef{kA, portId});
    engine->onPortDragMove(QPointF(110, 135));
    engine->onEscape();

    EXPECT_FALSE(engine->portTracker().isActive());
    const Api::VisualPort* visual = engine->scene().node(kA)->findPort(portId);
    ASSERT_TRUE(visual);
    EXPECT_FALSE(visual->dragging);
    EXPECT_EQ(visual->placement.edge, PortEdge::Left);

    settle();
    EXPECT_EQ(store.writeCount(QStringLiteral("updatePort")), 0);
}

TEST_F(DiagramEngineTests, ExternalChangesAreMergedWithPendingEdits)
{
    EngineSettings slow = engine->settings();
    slow.debounceMs = 400;
    engine->setSettings(slow);

    engine->onNodeDrag(kA, QPointF(300, 300), true);
    ASSERT_TRUE(store.seedBlock(scope, makeBlock(BlockId(QStringLiteral("c")), QPointF(0, 500))).ok);

    ASSERT_TRUE(waitUntil([this]() { return engine->snapshot().blocks.size() == 3; }));
    EXPECT_EQ(block(kA)->position, QPointF(300, 300));
    EXPECT_EQ(store.block(scope, kA)->position, QPointF(0, 0));

    ASSERT_TRUE(waitUntil([this]() { return store.block(scope, kA)->position == QPointF(300, 300); }));
}

TEST_F(DiagramEngineTests, StylingPopoverClosesWithItsTarget)
{
    ASSERT_TRUE(engine->onConnect(kA, kB).ok);
    const ConnectorId connector = engine->snapshot().connectors.front().id;

    QSignalSpy popoverChanges(engine.get(), &DiagramEngine::stylingPopoverChanged);
    engine->openConnectorStyling(connector, QPointF(20, 30));
    ASSERT_TRUE(engine->stylingPopover().has_value());
    EXPECT_EQ(engine->stylingPopover()->target, StylingTarget::Connector);

    ASSERT_TRUE(engine->removeConnector(connector).ok);
    EXPECT_FALSE(engine->stylingPopover().has_value());
    EXPECT_EQ(popoverChanges.count(), 2);

    engine->openBlockStyling(BlockId(QStringLiteral("zzz")), QPointF());
    EXPECT_FALSE(engine->stylingPopover().has_value());
}

TEST_F(DiagramEngineTests, ClicksOnTheCanvasCloseTheStylingPopover)
{
    engine->openBlockStyling(kA, QPointF(10, 10));
    ASSERT_TRUE(engine->stylingPopover().has_value());
    engine->onPaneClick();
    EXPECT_FALSE(engine->stylingPopover().has_value());

    engine->openBlockStyling(kA, QPointF(10, 10));
    ASSERT_TRUE(engine->stylingPopover().has_value());
    engine->onSelectionChange({kB}, {});
    EXPECT_FALSE(engine->stylingPopover().has_value());

    ASSERT_TRUE(engine->onConnect(kA, kB).ok);
    const ConnectorId connector = engine->snapshot().connectors.front().id;
    engine->openConnectorStyling(connector, QPointF(20, 30));
    ASSERT_TRUE(engine->stylingPopover().has_value());
    engine->onSelectionChange({}, {connector});
    EXPECT_FALSE(engine->stylingPopover().has_value());
}

TEST_F(DiagramEngineTests, ConnectorPresetsRestyleTheConnector)
{
    ASSERT_TRUE(engine->onConnect(kA, kB).ok);
    const ConnectorId connector = engine->snapshot().connectors.front().id;

    const auto& presets = Support::connectorStylePresets();
    ASSERT_TRUE(engine->applyConnectorPreset(connector, presets.at(3)).ok);

    const Api::VisualEdgePtr edge = engine->scene().edge(connector);
    ASSERT_TRUE(edge);
    EXPECT_EQ(edge->style.startMarker, MarkerType::ArrowClosed);
    EXPECT_EQ(edge->style.strokeColor, QColor(QStringLiteral("#dc2626")));

    ASSERT_TRUE(waitUntil([this]() { return store.writeCount(QStringLiteral("updateConnector")) == 1; }));
}
