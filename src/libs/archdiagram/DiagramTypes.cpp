// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/DiagramTypes.hpp"

#include <array>
#include <utility>

namespace ArchDiagram {

namespace {

template <typename Enum, std::size_t N>
QString lookupName(const std::array<std::pair<Enum, const char16_t*>, N>& table, Enum value)
{
    for (const auto& [key, name] : table) {
        if (key == value)
            return QString::fromUtf16(name);
    }
    return {};
}

template <typename Enum, std::size_t N>
std::optional<Enum> lookupValue(const std::array<std::pair<Enum, const char16_t*>, N>& table,
                                QStringView text)
{
    const QStringView trimmed = text.trimmed();
    for (const auto& [key, name] : table) {
        if (trimmed.compare(QStringView(name), Qt::CaseInsensitive) == 0)
            return key;
    }
    return std::nullopt;
}

constexpr std::array<std::pair<BlockKind, const char16_t*>, 6> kBlockKinds{{
    {BlockKind::System, u"system"},
    {BlockKind::Subsystem, u"subsystem"},
    {BlockKind::Component, u"component"},
    {BlockKind::Actor, u"actor"},
    {BlockKind::External, u"external"},
    {BlockKind::Interface, u"interface"},
}};

constexpr std::array<std::pair<PortDirection, const char16_t*>, 3> kDirections{{
    {PortDirection::In, u"in"},
    {PortDirection::Out, u"out"},
    {PortDirection::InOut, u"inout"},
}};

constexpr std::array<std::pair<PortEdge, const char16_t*>, 4> kEdges{{
    {PortEdge::Top, u"top"},
    {PortEdge::Right, u"right"},
    {PortEdge::Bottom, u"bottom"},
    {PortEdge::Left, u"left"},
}};

constexpr std::array<std::pair<PortShape, const char16_t*>, 3> kShapes{{
    {PortShape::Circle, u"circle"},
    {PortShape::Square, u"square"},
    {PortShape::Diamond, u"diamond"},
}};

constexpr std::array<std::pair<ConnectorKind, const char16_t*>, 4> kConnectorKinds{{
    {ConnectorKind::Association, u"association"},
    {ConnectorKind::Flow, u"flow"},
    {ConnectorKind::Dependency, u"dependency"},
    {ConnectorKind::Composition, u"composition"},
}};

constexpr std::array<std::pair<LineStyle, const char16_t*>, 4> kLineStyles{{
    {LineStyle::Straight, u"straight"},
    {LineStyle::SmoothStep, u"smoothstep"},
    {LineStyle::Step, u"step"},
    {LineStyle::Bezier, u"bezier"},
}};

constexpr std::array<std::pair<LinePattern, const char16_t*>, 3> kLinePatterns{{
    {LinePattern::Solid, u"solid"},
    {LinePattern::Dashed, u"dashed"},
    {LinePattern::Dotted, u"dotted"},
}};

constexpr std::array<std::pair<MarkerType, const char16_t*>, 3> kMarkers{{
    {MarkerType::None, u"none"},
    {MarkerType::Arrow, u"arrow"},
    {MarkerType::ArrowClosed, u"arrowclosed"},
}};

constexpr std::array<std::pair<DiagramView, const char16_t*>, 4> kViews{{
    {DiagramView::Block, u"block"},
    {DiagramView::Internal, u"internal"},
    {DiagramView::Deployment, u"deployment"},
    {DiagramView::RequirementsSchema, u"requirements_schema"},
}};

} // namespace

QString toString(BlockKind kind) { return lookupName(kBlockKinds, kind); }
QString toString(PortDirection direction) { return lookupName(kDirections, direction); }
QString toString(PortEdge edge) { return lookupName(kEdges, edge); }
QString toString(PortShape shape) { return lookupName(kShapes, shape); }
QString toString(ConnectorKind kind) { return lookupName(kConnectorKinds, kind); }
QString toString(LineStyle style) { return lookupName(kLineStyles, style); }
QString toString(LinePattern pattern) { return lookupName(kLinePatterns, pattern); }
QString toString(MarkerType marker) { return lookupName(kMarkers, marker); }
QString toString(DiagramView view) { return lookupName(kViews, view); }

std::optional<BlockKind> blockKindFromString(QStringView text)
{
    return lookupValue(kBlockKinds, text);
}

std::optional<PortDirection> portDirectionFromString(QStringView text)
{
    return lookupValue(kDirections, text);
}

std::optional<PortEdge> portEdgeFromString(QStringView text)
{
    return lookupValue(kEdges, text);
}

std::optional<PortShape> portShapeFromString(QStringView text)
{
    return lookupValue(kShapes, text);
}

std::optional<ConnectorKind> connectorKindFromString(QStringView text)
{
    return lookupValue(kConnectorKinds, text);
}

std::optional<LineStyle> lineStyleFromString(QStringView text)
{
    return lookupValue(kLineStyles, text);
}

std::optional<LinePattern> linePatternFromString(QStringView text)
{
    return lookupValue(kLinePatterns, text);
}

std::optional<MarkerType> markerTypeFromString(QStringView text)
{
    return lookupValue(kMarkers, text);
}

std::optional<DiagramView> diagramViewFromString(QStringView text)
{
    return lookupValue(kViews, text);
}

} // namespace ArchDiagram
