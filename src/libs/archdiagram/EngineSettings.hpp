// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramConstants.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QSizeF>
#include <QtCore/QString>

namespace ArchDiagram {

struct ARCHDIAGRAM_EXPORT EngineSettings final {
    int debounceMs = Constants::kMutationDebounceMs;

    double hysteresisMargin = Constants::kPortHysteresisPx;
    double edgeReleaseDistance = Constants::kPortEdgeReleasePx;
    double minPortOffset = Constants::kPortOffsetMin;
    double maxPortOffset = Constants::kPortOffsetMax;

    QSizeF defaultBlockSize{Constants::kDefaultBlockWidth, Constants::kDefaultBlockHeight};
    QSizeF minBlockSize{Constants::kMinBlockWidth, Constants::kMinBlockHeight};
    QSizeF maxBlockSize{Constants::kMaxBlockWidth, Constants::kMaxBlockHeight};

    double placementOrigin = Constants::kPlacementOrigin;
    double placementStepX = Constants::kPlacementStepX;
    double placementStepY = Constants::kPlacementStepY;
    int placementJitter = Constants::kPlacementJitter;
};

ARCHDIAGRAM_EXPORT EngineSettings engineSettingsDefaults();
// Keys missing from |obj| keep the |fallback| value; the result is normalized.
ARCHDIAGRAM_EXPORT EngineSettings engineSettingsFromJson(const QJsonObject& obj, const EngineSettings& fallback);
ARCHDIAGRAM_EXPORT QJsonObject engineSettingsToJson(const EngineSettings& settings);
ARCHDIAGRAM_EXPORT EngineSettings normalizedEngineSettings(const EngineSettings& settings);
ARCHDIAGRAM_EXPORT bool engineSettingsEqual(const EngineSettings& a, const EngineSettings& b);

// Reads |path| on top of the defaults. A missing or unreadable file yields the
// defaults and a failed |status|.
ARCHDIAGRAM_EXPORT EngineSettings loadEngineSettings(const QString& path, Utils::Result* status = nullptr);
ARCHDIAGRAM_EXPORT Utils::Result saveEngineSettings(const QString& path, const EngineSettings& settings);

} // namespace ArchDiagram
