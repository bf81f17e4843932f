// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "archdiagram/model/DiagramUpdates.hpp"
#include "archdiagram/state/MutationQueue.hpp"

#include "ArchDiagramTestSupport.hpp"

using namespace ArchDiagram;
using ArchDiagram::State::MutationQueue;
using ArchDiagram::Tests::drainEvents;
using ArchDiagram::Tests::ensureCoreApp;

namespace {

struct Delivery {
    QString id;
    BlockUpdate update;
};

} // namespace

TEST(MutationQueueTests, BurstCollapsesToLastPayload)
{
    ensureCoreApp();

    QList<Delivery> delivered;
    MutationQueue<BlockUpdate> queue([&delivered](const QString& id, const BlockUpdate& update) {
        delivered.push_back({id, update});
    }, 30);

    for (int i = 1; i <= 10; ++i)
        queue.schedule(QStringLiteral("b1"), BlockUpdate::moveTo(QPointF(i * 10, i)));

    EXPECT_TRUE(queue.isPending(QStringLiteral("b1")));
    drainEvents(200);

    ASSERT_EQ(delivered.size(), 1);
    EXPECT_EQ(delivered.front().id, QStringLiteral("b1"));
    EXPECT_EQ(delivered.front().update.position, QPointF(100, 10));
    EXPECT_EQ(queue.pendingCount(), 0);
}

TEST(MutationQueueTests, MergePolicyCombinesFields)
{
    ensureCoreApp();

    QList<Delivery> delivered;
    MutationQueue<BlockUpdate> queue([&delivered](const QString& id, const BlockUpdate& update) {
        delivered.push_back({id, update});
    }, 30);
    queue.setMergePolicy([](BlockUpdate& pending, const BlockUpdate& incoming) { pending.mergeFrom(incoming); });

    queue.schedule(QStringLiteral("b1"), BlockUpdate::moveTo(QPointF(1, 1)));
    queue.schedule(QStringLiteral("b1"), BlockUpdate::resizeTo(QSizeF(300, 200)));
    queue.schedule(QStringLiteral("b1"), BlockUpdate::moveTo(QPointF(2, 2)));

    const auto pending = queue.pendingPayload(QStringLiteral("b1"));
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->position, QPointF(2, 2));
    EXPECT_EQ(pending->size, QSizeF(300, 200));

    drainEvents(200);
    ASSERT_EQ(delivered.size(), 1);
    EXPECT_EQ(delivered.front().update.position, QPointF(2, 2));
    EXPECT_EQ(delivered.front().update.size, QSizeF(300, 200));
}

TEST(MutationQueueTests, EntitiesAreDebouncedIndependently)
{
    ensureCoreApp();

    QStringList delivered;
    MutationQueue<BlockUpdate> queue([&delivered](const QString& id, const BlockUpdate&) {
        delivered.push_back(id);
    }, 30);

    queue.schedule(QStringLiteral("a"), BlockUpdate::moveTo(QPointF(1, 1)));
    queue.schedule(QStringLiteral("b"), BlockUpdate::moveTo(QPointF(2, 2)));
    queue.schedule(QStringLiteral("a"), BlockUpdate::moveTo(QPointF(3, 3)));
    EXPECT_EQ(queue.pendingIds(), (QStringList{QStringLiteral("a"), QStringLiteral("b")}));

    drainEvents(200);
    delivered.sort();
    EXPECT_EQ(delivered, (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
}

TEST(MutationQueueTests, CancelAllDropsEverything)
{
    ensureCoreApp();

    int calls = 0;
    MutationQueue<BlockUpdate> queue([&calls](const QString&, const BlockUpdate&) { ++calls; }, 30);

    queue.schedule(QStringLiteral("a"), BlockUpdate::moveTo(QPointF(1, 1)));
    queue.schedule(QStringLiteral("b"), BlockUpdate::moveTo(QPointF(2, 2)));
    EXPECT_TRUE(queue.cancel(QStringLiteral("a")));
    EXPECT_FALSE(queue.cancel(QStringLiteral("a")));
    queue.cancelAll();

    drainEvents(150);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(queue.pendingCount(), 0);
}

TEST(MutationQueueTests, FlushDeliversWithoutWaiting)
{
    ensureCoreApp();

    QStringList delivered;
    MutationQueue<BlockUpdate> queue([&delivered](const QString& id, const BlockUpdate&) {
        delivered.push_back(id);
    }, 10000);

    queue.schedule(QStringLiteral("a"), BlockUpdate::moveTo(QPointF(1, 1)));
    queue.schedule(QStringLiteral("b"), BlockUpdate::moveTo(QPointF(2, 2)));
    EXPECT_TRUE(queue.flush(QStringLiteral("b")));
    EXPECT_EQ(delivered, QStringList{QStringLiteral("b")});

    queue.flushAll();
    EXPECT_EQ(delivered.size(), 2);
    EXPECT_FALSE(queue.flush(QStringLiteral("a")));
}

TEST(MutationQueueTests, SinkMayRescheduleItsOwnEntity)
{
    ensureCoreApp();

    int calls = 0;
    MutationQueue<BlockUpdate>* self = nullptr;
    MutationQueue<BlockUpdate> queue([&](const QString& id, const BlockUpdate&) {
        if (++calls == 1)
            self->schedule(id, BlockUpdate::moveTo(QPointF(9, 9)));
    }, 20);
    self = &queue;

    queue.schedule(QStringLiteral("a"), BlockUpdate::moveTo(QPointF(1, 1)));
    drainEvents(250);
    EXPECT_EQ(calls, 2);
}
