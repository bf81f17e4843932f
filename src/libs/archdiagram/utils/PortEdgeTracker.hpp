// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/DiagramTypes.hpp"
#include "archdiagram/EngineSettings.hpp"
#include "archdiagram/utils/DiagramGeometry.hpp"

#include <optional>

namespace ArchDiagram::Support {

// Hysteresis state for one port drag. The edge only changes when
// resolvePortPlacement() decides the pointer has clearly moved to another
// edge, so jitter near a corner does not make the port flicker.
class ARCHDIAGRAM_EXPORT PortEdgeTracker final
{
public:
    explicit PortEdgeTracker(const EngineSettings& settings = engineSettingsDefaults());

    void setSettings(const EngineSettings& settings) { m_settings = settings; }

    void begin(const PortRef& port, const PortPlacement& initial);
    // Returns the updated placement, or nothing when no drag is active.
    std::optional<PortPlacement> update(const QPointF& local, const QSizeF& blockSize);
    std::optional<PortPlacement> finish();
    void cancel();

    bool isActive() const noexcept { return m_active; }
    const PortRef& port() const noexcept { return m_port; }
    const PortPlacement& current() const noexcept { return m_current; }
    int edgeSwitchCount() const noexcept { return m_edgeSwitches; }

private:
    EngineSettings m_settings;
    PortRef m_port;
    PortPlacement m_current;
    bool m_active = false;
    int m_edgeSwitches = 0;
};

} // namespace ArchDiagram::Support
