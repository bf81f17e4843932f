// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/utils/DiagramStyle.hpp"

#include "archdiagram/DiagramConstants.hpp"

namespace ArchDiagram::Support {

namespace {

LinePattern kindPattern(ConnectorKind kind)
{
    switch (kind) {
        case ConnectorKind::Dependency: return LinePattern::Dashed;
        case ConnectorKind::Association: return LinePattern::Dotted;
        case ConnectorKind::Flow:
        case ConnectorKind::Composition: return LinePattern::Solid;
    }
    return LinePattern::Solid;
}

} // namespace

QVector<double> dashPatternFor(LinePattern pattern)
{
    switch (pattern) {
        case LinePattern::Dashed: return {8.0, 4.0};
        case LinePattern::Dotted: return {2.0, 2.0};
        case LinePattern::Solid: return {};
    }
    return {};
}

ResolvedConnectorStyle connectorKindDefaults(ConnectorKind kind)
{
    ResolvedConnectorStyle style;
    style.strokeWidth = Constants::kConnectorStrokeWidth;
    style.dashPattern = dashPatternFor(kindPattern(kind));

    switch (kind) {
        case ConnectorKind::Flow:
            style.routing = LineStyle::SmoothStep;
            style.strokeColor = QColor(Constants::kFlowColor);
            style.endMarker = MarkerType::ArrowClosed;
            style.animated = true;
            break;
        case ConnectorKind::Dependency:
            style.strokeColor = QColor(Constants::kDependencyColor);
            style.endMarker = MarkerType::Arrow;
            break;
        case ConnectorKind::Composition:
            style.strokeColor = QColor(Constants::kCompositionColor);
            style.strokeWidth = Constants::kCompositionStrokeWidth;
            style.startMarker = MarkerType::ArrowClosed;
            style.endMarker = MarkerType::ArrowClosed;
            break;
        case ConnectorKind::Association:
            style.strokeColor = QColor(Constants::kAssociationColor);
            break;
    }
    return style;
}

ResolvedConnectorStyle resolveConnectorStyle(const Connector& connector)
{
    ResolvedConnectorStyle style = connectorKindDefaults(connector.kind);
    if (connector.lineStyle)
        style.routing = *connector.lineStyle;
    if (connector.color && connector.color->isValid())
        style.strokeColor = *connector.color;
    if (connector.strokeWidth && *connector.strokeWidth > 0.0)
        style.strokeWidth = *connector.strokeWidth;
    if (connector.linePattern)
        style.dashPattern = dashPatternFor(*connector.linePattern);
    if (connector.markerStart)
        style.startMarker = *connector.markerStart;
    if (connector.markerEnd)
        style.endMarker = *connector.markerEnd;
    return style;
}

Connector resolveFullySpecified(const Connector& connector)
{
    const ResolvedConnectorStyle style = resolveConnectorStyle(connector);

    Connector out = connector;
    out.lineStyle = style.routing;
    out.color = style.strokeColor;
    out.strokeWidth = style.strokeWidth;
    out.linePattern = connector.linePattern.value_or(kindPattern(connector.kind));
    out.markerStart = style.startMarker;
    out.markerEnd = style.endMarker;
    return out;
}

ResolvedBlockStyle resolveBlockStyle(const Block& block, bool selected)
{
    const BlockStyleOverrides& o = block.style;

    ResolvedBlockStyle style;
    style.background = o.background.value_or(QColor(Constants::kBlockBackgroundColor));
    style.borderColor = o.borderColor.value_or(QColor(Constants::kBlockBorderColor));
    style.borderWidth = o.borderWidth.value_or(Constants::kBlockBorderWidth);
    style.borderStyle = o.borderStyle.value_or(LinePattern::Solid);
    style.textColor = o.textColor.value_or(QColor(Constants::kBlockTextColor));
    style.fontSize = o.fontSize.value_or(Constants::kBlockFontSize);
    style.fontWeight = o.fontWeight.value_or(QStringLiteral("normal"));
    style.borderRadius = o.borderRadius.value_or(Constants::kBlockBorderRadius);

    if (selected) {
        style.borderColor = QColor(Constants::kSelectionColor);
        style.borderWidth = Constants::kBlockSelectedBorderWidth;
    }
    return style;
}

ResolvedPortStyle resolvePortStyle(const Port& port, bool selected)
{
    const PortStyleOverrides& o = port.style;

    ResolvedPortStyle style;
    style.shape = o.shape.value_or(PortShape::Square);
    style.size = o.size.value_or(Constants::kPortSize);
    style.background = o.background.value_or(QColor(Constants::kPortBackgroundColor));
    style.borderColor = selected ? QColor(Constants::kSelectionColor)
                                 : o.borderColor.value_or(QColor(Constants::kPortBorderColor));
    return style;
}

ConnectorUpdate ConnectorStylePreset::toUpdate() const
{
    ConnectorUpdate update;
    update.lineStyle = lineStyle;
    update.linePattern = linePattern;
    update.markerStart = markerStart;
    update.markerEnd = markerEnd;
    update.color = color;
    return update;
}

const QVector<ConnectorStylePreset>& connectorStylePresets()
{
    static const QVector<ConnectorStylePreset> presets = {
        {QStringLiteral("Default"), LineStyle::Straight, LinePattern::Solid,
         MarkerType::None, MarkerType::ArrowClosed, std::nullopt},
        {QStringLiteral("Flow"), LineStyle::SmoothStep, LinePattern::Solid,
         MarkerType::None, MarkerType::ArrowClosed, QColor(0x25, 0x63, 0xeb)},
        {QStringLiteral("Dependency"), LineStyle::Straight, LinePattern::Dashed,
         MarkerType::None, MarkerType::ArrowClosed, QColor(0x7c, 0x3a, 0xed)},
        {QStringLiteral("Composition"), LineStyle::Straight, LinePattern::Solid,
         MarkerType::ArrowClosed, MarkerType::ArrowClosed, QColor(0xdc, 0x26, 0x26)},
        {QStringLiteral("Association"), LineStyle::Straight, LinePattern::Dotted,
         MarkerType::None, MarkerType::None, QColor(0x33, 0x41, 0x55)},
    };
    return presets;
}

} // namespace ArchDiagram::Support
