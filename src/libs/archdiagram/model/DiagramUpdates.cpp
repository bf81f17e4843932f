// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/model/DiagramUpdates.hpp"

namespace ArchDiagram {

namespace {

template <typename T>
void take(std::optional<T>& target, const std::optional<T>& newer)
{
    if (newer.has_value())
        target = newer;
}

template <typename T>
void assign(T& target, const std::optional<T>& value)
{
    if (value.has_value())
        target = *value;
}

} // namespace

bool BlockUpdate::isEmpty() const
{
    return !name && !kind && !stereotype && !description && !position && !size && !ports
           && !documentRefs && style.isEmpty();
}

void BlockUpdate::mergeFrom(const BlockUpdate& newer)
{
    take(name, newer.name);
    take(kind, newer.kind);
    take(stereotype, newer.stereotype);
    take(description, newer.description);
    take(position, newer.position);
    take(size, newer.size);
    take(ports, newer.ports);
    take(documentRefs, newer.documentRefs);
    style.overlay(newer.style);
}

void BlockUpdate::applyTo(Block& block) const
{
    assign(block.name, name);
    assign(block.kind, kind);
    take(block.stereotype, stereotype);
    take(block.description, description);
    assign(block.position, position);
    assign(block.size, size);
    assign(block.ports, ports);
    assign(block.documentRefs, documentRefs);
    block.style.overlay(style);
}

BlockUpdate BlockUpdate::moveTo(const QPointF& position)
{
    BlockUpdate update;
    update.position = position;
    return update;
}

BlockUpdate BlockUpdate::resizeTo(const QSizeF& size)
{
    BlockUpdate update;
    update.size = size;
    return update;
}

bool PortUpdate::isEmpty() const
{
    return !name && !direction && !edge && !offset && style.isEmpty();
}

void PortUpdate::mergeFrom(const PortUpdate& newer)
{
    take(name, newer.name);
    take(direction, newer.direction);
    take(edge, newer.edge);
    take(offset, newer.offset);
    style.overlay(newer.style);
}

void PortUpdate::applyTo(Port& port) const
{
    assign(port.name, name);
    assign(port.direction, direction);
    take(port.edge, edge);
    take(port.offset, offset);
    port.style.overlay(style);
}

bool ConnectorUpdate::isEmpty() const
{
    return !kind && !label && !sourcePortId && !targetPortId && !lineStyle && !linePattern
           && !markerStart && !markerEnd && !color && !strokeWidth && !documentRefs;
}

void ConnectorUpdate::mergeFrom(const ConnectorUpdate& newer)
{
    take(kind, newer.kind);
    take(label, newer.label);
    take(sourcePortId, newer.sourcePortId);
    take(targetPortId, newer.targetPortId);
    take(lineStyle, newer.lineStyle);
    take(linePattern, newer.linePattern);
    take(markerStart, newer.markerStart);
    take(markerEnd, newer.markerEnd);
    take(color, newer.color);
    take(strokeWidth, newer.strokeWidth);
    take(documentRefs, newer.documentRefs);
}

void ConnectorUpdate::applyTo(Connector& connector) const
{
    assign(connector.kind, kind);
    take(connector.label, label);
    take(connector.sourcePortId, sourcePortId);
    take(connector.targetPortId, targetPortId);
    take(connector.lineStyle, lineStyle);
    take(connector.linePattern, linePattern);
    take(connector.markerStart, markerStart);
    take(connector.markerEnd, markerEnd);
    take(connector.color, color);
    take(connector.strokeWidth, strokeWidth);
    assign(connector.documentRefs, documentRefs);
}

} // namespace ArchDiagram
