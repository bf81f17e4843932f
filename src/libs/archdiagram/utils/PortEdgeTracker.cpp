// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/utils/PortEdgeTracker.hpp"

namespace ArchDiagram::Support {

PortEdgeTracker::PortEdgeTracker(const EngineSettings& settings)
    : m_settings(settings)
{}

void PortEdgeTracker::begin(const PortRef& port, const PortPlacement& initial)
{
    m_port = port;
    m_current = initial;
    m_active = port.isValid();
    m_edgeSwitches = 0;
}

std::optional<PortPlacement> PortEdgeTracker::update(const QPointF& local, const QSizeF& blockSize)
{
    if (!m_active)
        return std::nullopt;

    const PortPlacement next = resolvePortPlacement(local, blockSize, m_current.edge, true, m_settings);
    if (next.edge != m_current.edge)
        ++m_edgeSwitches;
    m_current = next;
    return m_current;
}

std::optional<PortPlacement> PortEdgeTracker::finish()
{
    if (!m_active)
        return std::nullopt;
    m_active = false;
    return m_current;
}

void PortEdgeTracker::cancel()
{
    m_active = false;
    m_port = PortRef{};
}

} // namespace ArchDiagram::Support
