// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "archdiagram/store/InMemoryDiagramStore.hpp"

#include "ArchDiagramTestSupport.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>

using namespace ArchDiagram;
using ArchDiagram::Store::InMemoryDiagramStore;
using ArchDiagram::Tests::ensureCoreApp;
using ArchDiagram::Tests::waitUntil;

namespace {

Block makeBlock(const char* id)
{
    Block block;
    block.id = BlockId(QString::fromLatin1(id));
    block.name = QString::fromLatin1(id);
    block.size = QSizeF(220, 140);
    return block;
}

struct Outcome {
    bool done = false;
    Utils::Result result;
};

Api::StoreCompletion record(Outcome& outcome)
{
    return [&outcome](const Utils::Result& result) {
        outcome.done = true;
        outcome.result = result;
    };
}

class InMemoryDiagramStoreTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ensureCoreApp();
        diagram = store.createDiagram(QStringLiteral("acme"), QStringLiteral("PRJ"), QStringLiteral("Context"));
        scope = store.scopeFor(diagram);
    }

    InMemoryDiagramStore store;
    Diagram diagram;
    Api::DiagramScope scope;
};

} // namespace

TEST_F(InMemoryDiagramStoreTests, CompletionsAreDeliveredLater)
{
    Outcome outcome;
    store.createBlock(scope, makeBlock("a"), record(outcome));
    EXPECT_FALSE(outcome.done);

    ASSERT_TRUE(waitUntil([&]() { return outcome.done; }));
    EXPECT_TRUE(outcome.result.ok);
    EXPECT_EQ(store.blocks(scope).size(), 1);
}

TEST_F(InMemoryDiagramStoreTests, ScopeMustMatchTenantAndProject)
{
    Api::DiagramScope other = scope;
    other.project = QStringLiteral("OTHER");
    EXPECT_FALSE(store.hasDiagram(other));

    Outcome outcome;
    store.createBlock(other, makeBlock("a"), record(outcome));
    ASSERT_TRUE(waitUntil([&]() { return outcome.done; }));
    EXPECT_FALSE(outcome.result.ok);
}

TEST_F(InMemoryDiagramStoreTests, DeletingABlockCascadesToConnectors)
{
    ASSERT_TRUE(store.seedBlock(scope, makeBlock("a")).ok);
    ASSERT_TRUE(store.seedBlock(scope, makeBlock("b")).ok);
    Connector connector;
    connector.id = ConnectorId(QStringLiteral("ab"));
    connector.source = BlockId(QStringLiteral("a"));
    connector.target = BlockId(QStringLiteral("b"));
    ASSERT_TRUE(store.seedConnector(scope, connector).ok);

    Outcome outcome;
    store.deleteBlock(scope, BlockId(QStringLiteral("b")), record(outcome));
    ASSERT_TRUE(waitUntil([&]() { return outcome.done; }));
    EXPECT_TRUE(outcome.result.ok);
    EXPECT_TRUE(store.connectors(scope).isEmpty());
    EXPECT_EQ(store.blocks(scope).size(), 1);
}

TEST_F(InMemoryDiagramStoreTests, ConnectorsValidateEndpointsAndPorts)
{
    Block a = makeBlock("a");
    Port port;
    port.id = PortId(QStringLiteral("pa"));
    a.ports.push_back(port);
    ASSERT_TRUE(store.seedBlock(scope, a).ok);
    ASSERT_TRUE(store.seedBlock(scope, makeBlock("b")).ok);

    Connector missingTarget;
    missingTarget.id = ConnectorId(QStringLiteral("k1"));
    missingTarget.source = BlockId(QStringLiteral("a"));
    missingTarget.target = BlockId(QStringLiteral("zzz"));
    EXPECT_FALSE(store.seedConnector(scope, missingTarget).ok);

    Connector foreignPort;
    foreignPort.id = ConnectorId(QStringLiteral("k2"));
    foreignPort.source = BlockId(QStringLiteral("b"));
    foreignPort.target = BlockId(QStringLiteral("a"));
    foreignPort.sourcePortId = PortId(QStringLiteral("pa"));

    Outcome outcome;
    store.createConnector(scope, foreignPort, record(outcome));
    ASSERT_TRUE(waitUntil([&]() { return outcome.done; }));
    EXPECT_FALSE(outcome.result.ok);
    EXPECT_TRUE(store.connectors(scope).isEmpty());
}

TEST_F(InMemoryDiagramStoreTests, InjectedFailuresLeaveDataUntouched)
{
    ASSERT_TRUE(store.seedBlock(scope, makeBlock("a")).ok);
    store.failNextWrites(1, QStringLiteral("offline"));

    Outcome failed;
    store.updateBlock(scope, BlockId(QStringLiteral("a")), BlockUpdate::moveTo(QPointF(50, 50)), record(failed));
    ASSERT_TRUE(waitUntil([&]() { return failed.done; }));
    EXPECT_FALSE(failed.result.ok);
    EXPECT_EQ(failed.result.message(), QStringLiteral("offline"));
    EXPECT_EQ(store.block(scope, BlockId(QStringLiteral("a")))->position, QPointF());

    Outcome succeeded;
    store.updateBlock(scope, BlockId(QStringLiteral("a")), BlockUpdate::moveTo(QPointF(50, 50)), record(succeeded));
    ASSERT_TRUE(waitUntil([&]() { return succeeded.done; }));
    EXPECT_TRUE(succeeded.result.ok);
    EXPECT_EQ(store.block(scope, BlockId(QStringLiteral("a")))->position, QPointF(50, 50));
    EXPECT_EQ(store.writeCount(QStringLiteral("updateBlock")), 2);
}

TEST_F(InMemoryDiagramStoreTests, RemovingAPortDetachesConnectors)
{
    Block a = makeBlock("a");
    Port port;
    port.id = PortId(QStringLiteral("pa"));
    a.ports.push_back(port);
    ASSERT_TRUE(store.seedBlock(scope, a).ok);
    ASSERT_TRUE(store.seedBlock(scope, makeBlock("b")).ok);

    Connector connector;
    connector.id = ConnectorId(QStringLiteral("ab"));
    connector.source = BlockId(QStringLiteral("a"));
    connector.target = BlockId(QStringLiteral("b"));
    connector.sourcePortId = port.id;
    ASSERT_TRUE(store.seedConnector(scope, connector).ok);

    Outcome outcome;
    store.removePort(scope, BlockId(QStringLiteral("a")), port.id, record(outcome));
    ASSERT_TRUE(waitUntil([&]() { return outcome.done; }));
    EXPECT_TRUE(outcome.result.ok);
    EXPECT_FALSE(store.connectors(scope).front().sourcePortId.has_value());
}

TEST_F(InMemoryDiagramStoreTests, ListsDiagramsOfOneProjectByName)
{
    store.createDiagram(QStringLiteral("acme"), QStringLiteral("PRJ"), QStringLiteral("Actors"));
    store.createDiagram(QStringLiteral("acme"), QStringLiteral("ELSE"), QStringLiteral("Hidden"));

    QStringList names;
    bool done = false;
    store.listDiagrams(QStringLiteral("acme"), QStringLiteral("PRJ"),
                       [&](const Utils::Result& result, const QVector<Diagram>& diagrams) {
                           EXPECT_TRUE(result.ok);
                           for (const Diagram& d : diagrams)
                               names.push_back(d.name);
                           done = true;
                       });
    ASSERT_TRUE(waitUntil([&]() { return done; }));
    EXPECT_EQ(names, (QStringList{QStringLiteral("Actors"), QStringLiteral("Context")}));
}

TEST_F(InMemoryDiagramStoreTests, DocumentsSaveAndLoad)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("architecture.json"));

    ASSERT_TRUE(store.seedBlock(scope, makeBlock("a")).ok);
    ASSERT_TRUE(store.seedBlock(scope, makeBlock("b")).ok);
    ASSERT_TRUE(store.saveDocument(scope, path).ok);

    const Diagram copy = store.createDiagram(QStringLiteral("acme"), QStringLiteral("PRJ"), QStringLiteral("Copy"));
    const Api::DiagramScope copyScope = store.scopeFor(copy);
    ASSERT_TRUE(store.loadDocument(copyScope, path).ok);
    EXPECT_EQ(store.blocks(copyScope), store.blocks(scope));

    EXPECT_FALSE(store.loadDocument(copyScope, QDir(dir.path()).filePath(QStringLiteral("missing.json"))).ok);
}

TEST_F(InMemoryDiagramStoreTests, LegacyDocumentDropsDanglingConnections)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("legacy.json"));

    QJsonObject web{{QStringLiteral("id"), QStringLiteral("web")}, {QStringLiteral("name"), QStringLiteral("Web")}};
    QJsonObject link{{QStringLiteral("id"), QStringLiteral("k1")},
                     {QStringLiteral("from"), QStringLiteral("web")},
                     {QStringLiteral("to"), QStringLiteral("nowhere")}};
    QJsonObject root{{QStringLiteral("components"), QJsonArray{web}}, {QStringLiteral("connections"), QJsonArray{link}}};
    ASSERT_TRUE(Utils::JsonFileUtils::writeObjectAtomic(path, root).ok);

    ASSERT_TRUE(store.loadDocument(scope, path).ok);
    EXPECT_EQ(store.blocks(scope).size(), 1);
    EXPECT_TRUE(store.connectors(scope).isEmpty());
}
