// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/model/DiagramModel.hpp"
#include "archdiagram/model/DiagramUpdates.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>

#include <optional>

// Mapping between model values and the store's record shape
// (positionX/positionY, sizeWidth/sizeHeight, flat style fields).
namespace ArchDiagram::Json {

ARCHDIAGRAM_EXPORT QJsonObject portToRecord(const Port& port);
ARCHDIAGRAM_EXPORT std::optional<Port> portFromRecord(const QJsonObject& record, QString* error = nullptr);

ARCHDIAGRAM_EXPORT QJsonObject blockToRecord(const Block& block);
// Accepts both the flat record shape and the nested {position, size} shape
// written by older offline documents.
ARCHDIAGRAM_EXPORT std::optional<Block> blockFromRecord(const QJsonObject& record, QString* error = nullptr);

ARCHDIAGRAM_EXPORT QJsonObject connectorToRecord(const Connector& connector);
ARCHDIAGRAM_EXPORT std::optional<Connector> connectorFromRecord(const QJsonObject& record,
                                                                QString* error = nullptr);

ARCHDIAGRAM_EXPORT QJsonObject diagramToRecord(const Diagram& diagram);
ARCHDIAGRAM_EXPORT std::optional<Diagram> diagramFromRecord(const QJsonObject& record,
                                                            QString* error = nullptr);

// Partial records contain only the keys the update sets.
ARCHDIAGRAM_EXPORT QJsonObject blockUpdateToRecord(const BlockUpdate& update);
ARCHDIAGRAM_EXPORT QJsonObject portUpdateToRecord(const PortUpdate& update);
ARCHDIAGRAM_EXPORT QJsonObject connectorUpdateToRecord(const ConnectorUpdate& update);

struct ARCHDIAGRAM_EXPORT ArchitectureDocument final {
    QVector<Block> blocks;
    QVector<Connector> connectors;
    QString lastModified;
};

// Reads the offline document. A {components, connections} document from the
// first editor generation is migrated; anything unrecognised yields an empty
// document. Entries that fail to parse are skipped.
ARCHDIAGRAM_EXPORT ArchitectureDocument parseArchitectureDocument(const QJsonObject& root);
ARCHDIAGRAM_EXPORT QJsonObject architectureDocumentToJson(const ArchitectureDocument& document);

} // namespace ArchDiagram::Json
