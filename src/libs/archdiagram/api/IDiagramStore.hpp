// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/api/DiagramStoreTypes.hpp"
#include "archdiagram/model/DiagramModel.hpp"
#include "archdiagram/model/DiagramUpdates.hpp"

#include <QtCore/QObject>

namespace ArchDiagram::Api {

// Persistence boundary for diagram content. Every call is asynchronous:
// completions arrive later on the caller's thread and never re-enter the
// caller synchronously. Deleting a block also deletes its connectors.
class ARCHDIAGRAM_EXPORT IDiagramStore : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~IDiagramStore() override = default;

    virtual void listDiagrams(const QString& tenant,
                              const QString& project,
                              StoreListCompletion<Diagram> done) = 0;

    virtual void listBlocks(const DiagramScope& scope, StoreListCompletion<Block> done) = 0;
    virtual void createBlock(const DiagramScope& scope, const Block& block, StoreCompletion done) = 0;
    virtual void updateBlock(const DiagramScope& scope,
                             const BlockId& blockId,
                             const BlockUpdate& update,
                             StoreCompletion done) = 0;
    virtual void deleteBlock(const DiagramScope& scope, const BlockId& blockId, StoreCompletion done) = 0;

    virtual void listConnectors(const DiagramScope& scope, StoreListCompletion<Connector> done) = 0;
    virtual void createConnector(const DiagramScope& scope, const Connector& connector, StoreCompletion done) = 0;
    virtual void updateConnector(const DiagramScope& scope,
                                 const ConnectorId& connectorId,
                                 const ConnectorUpdate& update,
                                 StoreCompletion done) = 0;
    virtual void deleteConnector(const DiagramScope& scope,
                                 const ConnectorId& connectorId,
                                 StoreCompletion done) = 0;

    virtual void addPort(const DiagramScope& scope,
                         const BlockId& blockId,
                         const Port& port,
                         StoreCompletion done) = 0;
    virtual void updatePort(const DiagramScope& scope,
                            const BlockId& blockId,
                            const PortId& portId,
                            const PortUpdate& update,
                            StoreCompletion done) = 0;
    virtual void removePort(const DiagramScope& scope,
                            const BlockId& blockId,
                            const PortId& portId,
                            StoreCompletion done) = 0;

signals:
    void changed(const ArchDiagram::Api::DiagramScope& scope);
};

} // namespace ArchDiagram::Api
