// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/model/DiagramSnapshot.hpp"

#include <algorithm>

namespace ArchDiagram {

namespace {

template <typename Container, typename Id>
auto findById(Container& items, const Id& id) -> decltype(&items.front())
{
    const auto it = std::find_if(items.begin(), items.end(),
                                 [&id](const auto& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

} // namespace

const Block* DiagramSnapshot::findBlock(const BlockId& id) const
{
    return findById(blocks, id);
}

Block* DiagramSnapshot::findBlock(const BlockId& id)
{
    return findById(blocks, id);
}

const Connector* DiagramSnapshot::findConnector(const ConnectorId& id) const
{
    return findById(connectors, id);
}

Connector* DiagramSnapshot::findConnector(const ConnectorId& id)
{
    return findById(connectors, id);
}

bool DiagramSnapshot::removeBlock(const BlockId& id)
{
    return blocks.removeIf([&id](const Block& block) { return block.id == id; }) > 0;
}

bool DiagramSnapshot::removeConnector(const ConnectorId& id)
{
    return connectors.removeIf([&id](const Connector& connector) { return connector.id == id; }) > 0;
}

int DiagramSnapshot::removeConnectorsOf(const BlockId& blockId)
{
    return static_cast<int>(connectors.removeIf(
        [&blockId](const Connector& connector) { return connector.attachesTo(blockId); }));
}

} // namespace ArchDiagram
