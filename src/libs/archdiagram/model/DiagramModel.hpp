// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QSizeF>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>
#include <QtGui/QColor>

#include <optional>

namespace ArchDiagram {

struct ARCHDIAGRAM_EXPORT BlockStyleOverrides final {
    std::optional<QColor> background;
    std::optional<QColor> borderColor;
    std::optional<double> borderWidth;
    std::optional<LinePattern> borderStyle;
    std::optional<QColor> textColor;
    std::optional<double> fontSize;
    std::optional<QString> fontWeight;
    std::optional<double> borderRadius;

    bool isEmpty() const;
    // Fields set in |newer| replace ours.
    void overlay(const BlockStyleOverrides& newer);

    bool operator==(const BlockStyleOverrides&) const = default;
};

struct ARCHDIAGRAM_EXPORT PortStyleOverrides final {
    std::optional<PortShape> shape;
    std::optional<double> size;
    std::optional<QColor> background;
    std::optional<QColor> borderColor;

    bool isEmpty() const;
    void overlay(const PortStyleOverrides& newer);

    bool operator==(const PortStyleOverrides&) const = default;
};

struct ARCHDIAGRAM_EXPORT Port final {
    PortId id;
    QString name;
    PortDirection direction = PortDirection::In;
    std::optional<PortEdge> edge;
    std::optional<double> offset;
    PortStyleOverrides style;

    bool operator==(const Port&) const = default;
};

struct ARCHDIAGRAM_EXPORT Block final {
    BlockId id;
    QString name;
    BlockKind kind = BlockKind::Component;
    std::optional<QString> stereotype;
    std::optional<QString> description;
    QPointF position;
    QSizeF size;
    QVector<Port> ports;
    QStringList documentRefs;
    BlockStyleOverrides style;

    const Port* findPort(const PortId& portId) const;
    Port* findPort(const PortId& portId);
    bool ownsPort(const PortId& portId) const { return findPort(portId) != nullptr; }

    bool operator==(const Block&) const = default;
};

struct ARCHDIAGRAM_EXPORT Connector final {
    ConnectorId id;
    BlockId source;
    BlockId target;
    std::optional<PortId> sourcePortId;
    std::optional<PortId> targetPortId;
    ConnectorKind kind = ConnectorKind::Flow;
    std::optional<QString> label;
    std::optional<LineStyle> lineStyle;
    std::optional<LinePattern> linePattern;
    std::optional<MarkerType> markerStart;
    std::optional<MarkerType> markerEnd;
    std::optional<QColor> color;
    std::optional<double> strokeWidth;
    QStringList documentRefs;

    bool attachesTo(const BlockId& blockId) const noexcept
    {
        return source == blockId || target == blockId;
    }

    bool operator==(const Connector&) const = default;
};

struct ARCHDIAGRAM_EXPORT Diagram final {
    DiagramId id;
    QString name;
    std::optional<QString> description;
    DiagramView view = DiagramView::Block;

    bool operator==(const Diagram&) const = default;
};

// Block templates offered on the empty canvas.
struct ARCHDIAGRAM_EXPORT BlockPreset final {
    QString label;
    BlockKind kind = BlockKind::Component;
    QString stereotype;
    QString description;
};

ARCHDIAGRAM_EXPORT const QVector<BlockPreset>& blockPresets();

// Strips one trailing " copy" before appending it again, so copies of copies
// do not grow.
ARCHDIAGRAM_EXPORT QString duplicateBlockName(const QString& name);

} // namespace ArchDiagram
