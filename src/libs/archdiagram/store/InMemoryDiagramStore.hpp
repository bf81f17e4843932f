// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/api/IDiagramStore.hpp"

#include <utils/Result.hpp>

#include <QtCore/QHash>
#include <QtCore/QVector>

#include <optional>

namespace ArchDiagram::Store {

struct ARCHDIAGRAM_EXPORT StoreWrite final {
    QString operation;
    QString entityId;

    bool operator==(const StoreWrite&) const = default;
};

// Process-local store. Writes apply immediately; completions and change
// notifications are delivered through the event loop.
class ARCHDIAGRAM_EXPORT InMemoryDiagramStore final : public Api::IDiagramStore
{
    Q_OBJECT

public:
    explicit InMemoryDiagramStore(QObject* parent = nullptr);
    ~InMemoryDiagramStore() override;

    Diagram createDiagram(const QString& tenant,
                          const QString& project,
                          const QString& name,
                          DiagramView view = DiagramView::Block);
    bool hasDiagram(const Api::DiagramScope& scope) const;
    Api::DiagramScope scopeFor(const Diagram& diagram) const;

    // Synchronous inspection and seeding. Seeding emits changed() like an
    // edit made by another client.
    QVector<Block> blocks(const Api::DiagramScope& scope) const;
    QVector<Connector> connectors(const Api::DiagramScope& scope) const;
    std::optional<Block> block(const Api::DiagramScope& scope, const BlockId& blockId) const;
    Utils::Result seedBlock(const Api::DiagramScope& scope, const Block& block);
    Utils::Result seedConnector(const Api::DiagramScope& scope, const Connector& connector);

    // The next |count| writes fail with |message| and change nothing.
    void failNextWrites(int count, const QString& message = QStringLiteral("Store write rejected."));
    const QVector<StoreWrite>& writes() const noexcept { return m_writes; }
    int writeCount(const QString& operation) const;
    void clearWriteLog() { m_writes.clear(); }

    // Offline document exchange.
    Utils::Result loadDocument(const Api::DiagramScope& scope, const QString& path);
    Utils::Result saveDocument(const Api::DiagramScope& scope, const QString& path) const;

    void listDiagrams(const QString& tenant,
                      const QString& project,
                      Api::StoreListCompletion<Diagram> done) override;

    void listBlocks(const Api::DiagramScope& scope, Api::StoreListCompletion<Block> done) override;
    void createBlock(const Api::DiagramScope& scope, const Block& block, Api::StoreCompletion done) override;
    void updateBlock(const Api::DiagramScope& scope,
                     const BlockId& blockId,
                     const BlockUpdate& update,
                     Api::StoreCompletion done) override;
    void deleteBlock(const Api::DiagramScope& scope, const BlockId& blockId, Api::StoreCompletion done) override;

    void listConnectors(const Api::DiagramScope& scope, Api::StoreListCompletion<Connector> done) override;
    void createConnector(const Api::DiagramScope& scope,
                         const Connector& connector,
                         Api::StoreCompletion done) override;
    void updateConnector(const Api::DiagramScope& scope,
                         const ConnectorId& connectorId,
                         const ConnectorUpdate& update,
                         Api::StoreCompletion done) override;
    void deleteConnector(const Api::DiagramScope& scope,
                         const ConnectorId& connectorId,
                         Api::StoreCompletion done) override;

    void addPort(const Api::DiagramScope& scope,
                 const BlockId& blockId,
                 const Port& port,
                 Api::StoreCompletion done) override;
    void updatePort(const Api::DiagramScope& scope,
                    const BlockId& blockId,
                    const PortId& portId,
                    const PortUpdate& update,
                    Api::StoreCompletion done) override;
    void removePort(const Api::DiagramScope& scope,
                    const BlockId& blockId,
                    const PortId& portId,
                    Api::StoreCompletion done) override;

private:
    struct DiagramContent {
        QString tenant;
        QString project;
        Diagram diagram;
        QVector<Block> blocks;
        QVector<Connector> connectors;
    };

    DiagramContent* contentFor(const Api::DiagramScope& scope);
    const DiagramContent* contentFor(const Api::DiagramScope& scope) const;
    Utils::Result validateEndpoints(const DiagramContent& content, const Connector& connector) const;

    template <typename Mutation>
    void write(const Api::DiagramScope& scope,
               const QString& operation,
               const QString& entityId,
               Api::StoreCompletion done,
               Mutation&& mutation);
    void complete(Api::StoreCompletion done, const Utils::Result& result);
    void notifyChanged(const Api::DiagramScope& scope);

    QHash<DiagramId, DiagramContent> m_diagrams;
    QVector<StoreWrite> m_writes;
    int m_failuresPending = 0;
    QString m_failureMessage;
};

} // namespace ArchDiagram::Store
