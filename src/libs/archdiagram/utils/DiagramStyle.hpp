// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"
#include "archdiagram/model/DiagramModel.hpp"
#include "archdiagram/model/DiagramUpdates.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>
#include <QtGui/QColor>

#include <optional>

namespace ArchDiagram::Support {

struct ARCHDIAGRAM_EXPORT ResolvedConnectorStyle final {
    LineStyle routing = LineStyle::Straight;
    QColor strokeColor;
    double strokeWidth = 2.0;
    QVector<double> dashPattern;
    MarkerType startMarker = MarkerType::None;
    MarkerType endMarker = MarkerType::None;
    bool animated = false;

    bool operator==(const ResolvedConnectorStyle&) const = default;
};

struct ARCHDIAGRAM_EXPORT ResolvedBlockStyle final {
    QColor background;
    QColor borderColor;
    double borderWidth = 1.0;
    LinePattern borderStyle = LinePattern::Solid;
    QColor textColor;
    double fontSize = 14.0;
    QString fontWeight;
    double borderRadius = 8.0;

    bool operator==(const ResolvedBlockStyle&) const = default;
};

struct ARCHDIAGRAM_EXPORT ResolvedPortStyle final {
    PortShape shape = PortShape::Square;
    double size = 24.0;
    QColor background;
    QColor borderColor;

    bool operator==(const ResolvedPortStyle&) const = default;
};

// Style values a connector of |kind| gets when nothing is overridden.
ARCHDIAGRAM_EXPORT ResolvedConnectorStyle connectorKindDefaults(ConnectorKind kind);
ARCHDIAGRAM_EXPORT QVector<double> dashPatternFor(LinePattern pattern);

// Per field: explicit override, else the kind default. Never fails.
ARCHDIAGRAM_EXPORT ResolvedConnectorStyle resolveConnectorStyle(const Connector& connector);
// Copy of |connector| with every optional style field filled from its resolved
// style; resolving it again yields the same values.
ARCHDIAGRAM_EXPORT Connector resolveFullySpecified(const Connector& connector);

ARCHDIAGRAM_EXPORT ResolvedBlockStyle resolveBlockStyle(const Block& block, bool selected);
ARCHDIAGRAM_EXPORT ResolvedPortStyle resolvePortStyle(const Port& port, bool selected);

struct ARCHDIAGRAM_EXPORT ConnectorStylePreset final {
    QString label;
    LineStyle lineStyle = LineStyle::Straight;
    LinePattern linePattern = LinePattern::Solid;
    MarkerType markerStart = MarkerType::None;
    MarkerType markerEnd = MarkerType::ArrowClosed;
    std::optional<QColor> color;

    ConnectorUpdate toUpdate() const;
};

ARCHDIAGRAM_EXPORT const QVector<ConnectorStylePreset>& connectorStylePresets();

} // namespace ArchDiagram::Support
