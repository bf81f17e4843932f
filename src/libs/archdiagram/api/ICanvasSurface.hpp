// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/api/VisualTypes.hpp"

#include <utils/contextmenu/ContextMenuAction.hpp>

#include <QtCore/QList>
#include <QtCore/QPointF>

namespace ArchDiagram::Api {

// The rendering side. It draws what it is given and reports pointer and
// keyboard input back through the DiagramEngine callbacks
// (onNodeDrag, onNodeResize, onConnect, onSelectionChange, onContextMenu, ...).
class ARCHDIAGRAM_EXPORT ICanvasSurface
{
public:
    virtual ~ICanvasSurface() = default;

    virtual void render(const VisualScene& scene) = 0;

    // An empty action list means no menu is shown.
    virtual void showContextMenu(const QList<Utils::ContextMenuAction>& actions, const QPointF& screenPos) = 0;
    virtual void hideContextMenu() = 0;
};

} // namespace ArchDiagram::Api
