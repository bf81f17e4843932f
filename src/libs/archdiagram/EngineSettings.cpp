// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/EngineSettings.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QJsonValue>

#include <algorithm>
#include <cmath>
#include <utility>

namespace ArchDiagram {

namespace {

using namespace Qt::StringLiterals;

const QString kDebounceKey = u"debounceMs"_s;
const QString kHysteresisKey = u"hysteresisMargin"_s;
const QString kReleaseKey = u"edgeReleaseDistance"_s;
const QString kMinOffsetKey = u"minPortOffset"_s;
const QString kMaxOffsetKey = u"maxPortOffset"_s;
const QString kDefaultWidthKey = u"defaultBlockWidth"_s;
const QString kDefaultHeightKey = u"defaultBlockHeight"_s;
const QString kMinWidthKey = u"minBlockWidth"_s;
const QString kMinHeightKey = u"minBlockHeight"_s;
const QString kMaxWidthKey = u"maxBlockWidth"_s;
const QString kMaxHeightKey = u"maxBlockHeight"_s;
const QString kPlacementOriginKey = u"placementOrigin"_s;
const QString kPlacementStepXKey = u"placementStepX"_s;
const QString kPlacementStepYKey = u"placementStepY"_s;
const QString kPlacementJitterKey = u"placementJitter"_s;

bool nearlyEqual(double a, double b)
{
    return std::abs(a - b) <= 1e-6;
}

void readDouble(const QJsonObject& obj, const QString& key, double& target)
{
    if (obj.contains(key))
        target = obj.value(key).toDouble(target);
}

void readInt(const QJsonObject& obj, const QString& key, int& target)
{
    if (obj.contains(key))
        target = obj.value(key).toInt(target);
}

void readSize(const QJsonObject& obj, const QString& widthKey, const QString& heightKey, QSizeF& target)
{
    double width = target.width();
    double height = target.height();
    readDouble(obj, widthKey, width);
    readDouble(obj, heightKey, height);
    target = QSizeF(width, height);
}

} // namespace

EngineSettings engineSettingsDefaults()
{
    return EngineSettings{};
}

EngineSettings normalizedEngineSettings(const EngineSettings& settings)
{
    EngineSettings out = settings;
    out.debounceMs = std::max(out.debounceMs, 0);
    out.hysteresisMargin = std::max(out.hysteresisMargin, 0.0);
    out.edgeReleaseDistance = std::max(out.edgeReleaseDistance, 0.0);

    out.minPortOffset = std::clamp(out.minPortOffset, 0.0, 100.0);
    out.maxPortOffset = std::clamp(out.maxPortOffset, 0.0, 100.0);
    if (out.minPortOffset > out.maxPortOffset)
        std::swap(out.minPortOffset, out.maxPortOffset);

    const auto positive = [](double v, double fallback) { return v > 0.0 ? v : fallback; };
    out.minBlockSize = QSizeF(positive(out.minBlockSize.width(), Constants::kMinBlockWidth),
                              positive(out.minBlockSize.height(), Constants::kMinBlockHeight));
    out.maxBlockSize = QSizeF(std::max(out.maxBlockSize.width(), out.minBlockSize.width()),
                              std::max(out.maxBlockSize.height(), out.minBlockSize.height()));
    out.defaultBlockSize = QSizeF(std::clamp(out.defaultBlockSize.width(),
                                             out.minBlockSize.width(), out.maxBlockSize.width()),
                                  std::clamp(out.defaultBlockSize.height(),
                                             out.minBlockSize.height(), out.maxBlockSize.height()));

    out.placementJitter = std::max(out.placementJitter, 0);
    return out;
}

EngineSettings engineSettingsFromJson(const QJsonObject& obj, const EngineSettings& fallback)
{
    EngineSettings settings = fallback;

    readInt(obj, kDebounceKey, settings.debounceMs);
    readDouble(obj, kHysteresisKey, settings.hysteresisMargin);
    readDouble(obj, kReleaseKey, settings.edgeReleaseDistance);
    readDouble(obj, kMinOffsetKey, settings.minPortOffset);
    readDouble(obj, kMaxOffsetKey, settings.maxPortOffset);
    readSize(obj, kDefaultWidthKey, kDefaultHeightKey, settings.defaultBlockSize);
    readSize(obj, kMinWidthKey, kMinHeightKey, settings.minBlockSize);
    readSize(obj, kMaxWidthKey, kMaxHeightKey, settings.maxBlockSize);
    readDouble(obj, kPlacementOriginKey, settings.placementOrigin);
    readDouble(obj, kPlacementStepXKey, settings.placementStepX);
    readDouble(obj, kPlacementStepYKey, settings.placementStepY);
    readInt(obj, kPlacementJitterKey, settings.placementJitter);

    return normalizedEngineSettings(settings);
}

QJsonObject engineSettingsToJson(const EngineSettings& settings)
{
    QJsonObject obj;
    obj.insert(kDebounceKey, settings.debounceMs);
    obj.insert(kHysteresisKey, settings.hysteresisMargin);
    obj.insert(kReleaseKey, settings.edgeReleaseDistance);
    obj.insert(kMinOffsetKey, settings.minPortOffset);
    obj.insert(kMaxOffsetKey, settings.maxPortOffset);
    obj.insert(kDefaultWidthKey, settings.defaultBlockSize.width());
    obj.insert(kDefaultHeightKey, settings.defaultBlockSize.height());
    obj.insert(kMinWidthKey, settings.minBlockSize.width());
    obj.insert(kMinHeightKey, settings.minBlockSize.height());
    obj.insert(kMaxWidthKey, settings.maxBlockSize.width());
    obj.insert(kMaxHeightKey, settings.maxBlockSize.height());
    obj.insert(kPlacementOriginKey, settings.placementOrigin);
    obj.insert(kPlacementStepXKey, settings.placementStepX);
    obj.insert(kPlacementStepYKey, settings.placementStepY);
    obj.insert(kPlacementJitterKey, settings.placementJitter);
    return obj;
}

bool engineSettingsEqual(const EngineSettings& a, const EngineSettings& b)
{
    return a.debounceMs == b.debounceMs
        && nearlyEqual(a.hysteresisMargin, b.hysteresisMargin)
        && nearlyEqual(a.edgeReleaseDistance, b.edgeReleaseDistance)
        && nearlyEqual(a.minPortOffset, b.minPortOffset)
        && nearlyEqual(a.maxPortOffset, b.maxPortOffset)
        && a.defaultBlockSize == b.defaultBlockSize
        && a.minBlockSize == b.minBlockSize
        && a.maxBlockSize == b.maxBlockSize
        && nearlyEqual(a.placementOrigin, b.placementOrigin)
        && nearlyEqual(a.placementStepX, b.placementStepX)
        && nearlyEqual(a.placementStepY, b.placementStepY)
        && a.placementJitter == b.placementJitter;
}

EngineSettings loadEngineSettings(const QString& path, Utils::Result* status)
{
    const EngineSettings fallback = engineSettingsDefaults();

    QString error;
    const QJsonObject obj = Utils::JsonFileUtils::readObject(path, &error);
    if (!error.isEmpty()) {
        qCWarning(archdiagramlog).noquote() << "Using default engine settings:" << error;
        if (status)
            *status = Utils::Result::failure(error);
        return fallback;
    }

    if (status)
        *status = Utils::Result::success();
    return engineSettingsFromJson(obj, fallback);
}

Utils::Result saveEngineSettings(const QString& path, const EngineSettings& settings)
{
    return Utils::JsonFileUtils::writeObjectAtomic(path, engineSettingsToJson(settings));
}

} // namespace ArchDiagram
