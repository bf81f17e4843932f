// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"
#include "archdiagram/model/DiagramModel.hpp"

#include <utils/Result.hpp>

#include <QtCore/QString>
#include <QtCore/QVector>

#include <functional>

namespace ArchDiagram::Api {

// Addresses one diagram inside a tenant's project.
struct ARCHDIAGRAM_EXPORT DiagramScope final {
    QString tenant;
    QString project;
    DiagramId diagramId;

    bool isValid() const noexcept
    {
        return !tenant.isEmpty() && !project.isEmpty() && !diagramId.isNull();
    }

    bool sameProject(const DiagramScope& other) const noexcept
    {
        return tenant == other.tenant && project == other.project;
    }

    bool operator==(const DiagramScope&) const = default;
};

using StoreCompletion = std::function<void(const Utils::Result&)>;

template <typename T>
using StoreListCompletion = std::function<void(const Utils::Result&, const QVector<T>&)>;

} // namespace ArchDiagram::Api
