// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/model/DiagramModel.hpp"

#include <optional>

namespace ArchDiagram {

// Partial updates carry only the fields that change. An update with nothing
// set is empty and never reaches the store.

struct ARCHDIAGRAM_EXPORT BlockUpdate final {
    std::optional<QString> name;
    std::optional<BlockKind> kind;
    std::optional<QString> stereotype;
    std::optional<QString> description;
    std::optional<QPointF> position;
    std::optional<QSizeF> size;
    std::optional<QVector<Port>> ports;
    std::optional<QStringList> documentRefs;
    BlockStyleOverrides style;

    bool isEmpty() const;
    // Last write wins per field.
    void mergeFrom(const BlockUpdate& newer);
    void applyTo(Block& block) const;

    static BlockUpdate moveTo(const QPointF& position);
    static BlockUpdate resizeTo(const QSizeF& size);

    bool operator==(const BlockUpdate&) const = default;
};

struct ARCHDIAGRAM_EXPORT PortUpdate final {
    std::optional<QString> name;
    std::optional<PortDirection> direction;
    std::optional<PortEdge> edge;
    std::optional<double> offset;
    PortStyleOverrides style;

    bool isEmpty() const;
    void mergeFrom(const PortUpdate& newer);
    void applyTo(Port& port) const;

    bool operator==(const PortUpdate&) const = default;
};

struct ARCHDIAGRAM_EXPORT ConnectorUpdate final {
    std::optional<ConnectorKind> kind;
    std::optional<QString> label;
    std::optional<PortId> sourcePortId;
    std::optional<PortId> targetPortId;
    std::optional<LineStyle> lineStyle;
    std::optional<LinePattern> linePattern;
    std::optional<MarkerType> markerStart;
    std::optional<MarkerType> markerEnd;
    std::optional<QColor> color;
    std::optional<double> strokeWidth;
    std::optional<QStringList> documentRefs;

    bool isEmpty() const;
    void mergeFrom(const ConnectorUpdate& newer);
    void applyTo(Connector& connector) const;

    bool operator==(const ConnectorUpdate&) const = default;
};

} // namespace ArchDiagram
