// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/api/VisualTypes.hpp"

#include <algorithm>

namespace ArchDiagram::Api {

const VisualPort* VisualNode::findPort(const PortId& portId) const
{
    const auto it = std::find_if(ports.cbegin(), ports.cend(),
                                 [&portId](const VisualPort& port) { return port.id == portId; });
    return it == ports.cend() ? nullptr : &*it;
}

VisualNodePtr VisualScene::node(const BlockId& id) const
{
    for (const VisualNodePtr& entry : nodes) {
        if (entry && entry->id == id)
            return entry;
    }
    return {};
}

VisualEdgePtr VisualScene::edge(const ConnectorId& id) const
{
    for (const VisualEdgePtr& entry : edges) {
        if (entry && entry->id == id)
            return entry;
    }
    return {};
}

} // namespace ArchDiagram::Api
