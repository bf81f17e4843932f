// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"

#include <utils/StrongId.hpp>

#include <QtCore/QHashFunctions>
#include <QtCore/QString>
#include <QtCore/QStringView>

#include <cstdint>
#include <optional>

namespace ArchDiagram {

struct BlockIdTag final {};
struct PortIdTag final {};
struct ConnectorIdTag final {};
struct DiagramIdTag final {};

using BlockId = Utils::StrongId<BlockIdTag>;
using PortId = Utils::StrongId<PortIdTag>;
using ConnectorId = Utils::StrongId<ConnectorIdTag>;
using DiagramId = Utils::StrongId<DiagramIdTag>;

enum class ARCHDIAGRAM_EXPORT BlockKind : uint8_t {
    System,
    Subsystem,
    Component,
    Actor,
    External,
    Interface
};

enum class ARCHDIAGRAM_EXPORT PortDirection : uint8_t { In, Out, InOut };

enum class ARCHDIAGRAM_EXPORT PortEdge : uint8_t { Top, Right, Bottom, Left };

enum class ARCHDIAGRAM_EXPORT PortShape : uint8_t { Circle, Square, Diamond };

enum class ARCHDIAGRAM_EXPORT ConnectorKind : uint8_t {
    Association,
    Flow,
    Dependency,
    Composition
};

enum class ARCHDIAGRAM_EXPORT LineStyle : uint8_t { Straight, SmoothStep, Step, Bezier };

enum class ARCHDIAGRAM_EXPORT LinePattern : uint8_t { Solid, Dashed, Dotted };

enum class ARCHDIAGRAM_EXPORT MarkerType : uint8_t { None, Arrow, ArrowClosed };

enum class ARCHDIAGRAM_EXPORT DiagramView : uint8_t {
    Block,
    Internal,
    Deployment,
    RequirementsSchema
};

struct ARCHDIAGRAM_EXPORT PortRef final {
    BlockId blockId;
    PortId portId;

    bool isValid() const noexcept { return !blockId.isNull() && !portId.isNull(); }
    bool operator==(const PortRef&) const = default;
};

inline size_t qHash(const PortRef& ref, size_t seed = 0) noexcept
{
    return qHashMulti(seed, ref.blockId.toString(), ref.portId.toString());
}

// Wire names, matching the persisted records.
ARCHDIAGRAM_EXPORT QString toString(BlockKind kind);
ARCHDIAGRAM_EXPORT QString toString(PortDirection direction);
ARCHDIAGRAM_EXPORT QString toString(PortEdge edge);
ARCHDIAGRAM_EXPORT QString toString(PortShape shape);
ARCHDIAGRAM_EXPORT QString toString(ConnectorKind kind);
ARCHDIAGRAM_EXPORT QString toString(LineStyle style);
ARCHDIAGRAM_EXPORT QString toString(LinePattern pattern);
ARCHDIAGRAM_EXPORT QString toString(MarkerType marker);
ARCHDIAGRAM_EXPORT QString toString(DiagramView view);

ARCHDIAGRAM_EXPORT std::optional<BlockKind> blockKindFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<PortDirection> portDirectionFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<PortEdge> portEdgeFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<PortShape> portShapeFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<ConnectorKind> connectorKindFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<LineStyle> lineStyleFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<LinePattern> linePatternFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<MarkerType> markerTypeFromString(QStringView text);
ARCHDIAGRAM_EXPORT std::optional<DiagramView> diagramViewFromString(QStringView text);

} // namespace ArchDiagram
