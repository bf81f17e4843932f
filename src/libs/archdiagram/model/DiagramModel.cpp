// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/model/DiagramModel.hpp"

#include "archdiagram/DiagramConstants.hpp"

#include <QtCore/QRegularExpression>

#include <algorithm>

namespace ArchDiagram {

namespace {

template <typename T>
void overlayField(std::optional<T>& target, const std::optional<T>& newer)
{
    if (newer.has_value())
        target = newer;
}

} // namespace

bool BlockStyleOverrides::isEmpty() const
{
    return !background && !borderColor && !borderWidth && !borderStyle && !textColor
           && !fontSize && !fontWeight && !borderRadius;
}

void BlockStyleOverrides::overlay(const BlockStyleOverrides& newer)
{
    overlayField(background, newer.background);
    overlayField(borderColor, newer.borderColor);
    overlayField(borderWidth, newer.borderWidth);
    overlayField(borderStyle, newer.borderStyle);
    overlayField(textColor, newer.textColor);
    overlayField(fontSize, newer.fontSize);
    overlayField(fontWeight, newer.fontWeight);
    overlayField(borderRadius, newer.borderRadius);
}

bool PortStyleOverrides::isEmpty() const
{
    return !shape && !size && !background && !borderColor;
}

void PortStyleOverrides::overlay(const PortStyleOverrides& newer)
{
    overlayField(shape, newer.shape);
    overlayField(size, newer.size);
    overlayField(background, newer.background);
    overlayField(borderColor, newer.borderColor);
}

const Port* Block::findPort(const PortId& portId) const
{
    const auto it = std::find_if(ports.cbegin(), ports.cend(),
                                 [&portId](const Port& port) { return port.id == portId; });
    return it == ports.cend() ? nullptr : &*it;
}

Port* Block::findPort(const PortId& portId)
{
    const auto it = std::find_if(ports.begin(), ports.end(),
                                 [&portId](const Port& port) { return port.id == portId; });
    return it == ports.end() ? nullptr : &*it;
}

const QVector<BlockPreset>& blockPresets()
{
    static const QVector<BlockPreset> presets = {
        {QStringLiteral("System"), BlockKind::System, QStringLiteral("<<system>>"), {}},
        {QStringLiteral("Subsystem"), BlockKind::Subsystem, QStringLiteral("<<subsystem>>"), {}},
        {QStringLiteral("Component"), BlockKind::Component, QStringLiteral("<<component>>"), {}},
        {QStringLiteral("Actor"), BlockKind::Actor, QStringLiteral("<<actor>>"), {}},
        {QStringLiteral("External"), BlockKind::External, QStringLiteral("<<external>>"), {}},
    };
    return presets;
}

QString duplicateBlockName(const QString& name)
{
    static const QRegularExpression trailingCopy(QStringLiteral("\\s+copy$"),
                                                 QRegularExpression::CaseInsensitiveOption);
    QString base = name;
    base.remove(trailingCopy);
    return base + QString::fromLatin1(Constants::kCopySuffix);
}

} // namespace ArchDiagram
