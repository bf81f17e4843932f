// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/controllers/DiagramContextMenuController.hpp"

#include "archdiagram/DiagramEngine.hpp"
#include "archdiagram/model/DiagramModel.hpp"
#include "archdiagram/utils/DiagramGeometry.hpp"
#include "archdiagram/utils/DiagramStyle.hpp"

#include <algorithm>

namespace ArchDiagram::Controllers {

namespace {

using Utils::ContextMenuAction;

const QString kActionAddBlockPrefix = QStringLiteral("diagram.context.create.block.");

const QString kActionAddInputPort = QStringLiteral("diagram.context.block.addInputPort");
const QString kActionAddOutputPort = QStringLiteral("diagram.context.block.addOutputPort");
const QString kActionDuplicateBlock = QStringLiteral("diagram.context.block.duplicate");
const QString kActionDeleteBlock = QStringLiteral("diagram.context.block.delete");

const QString kActionConnectorPresetPrefix = QStringLiteral("diagram.context.connector.preset.");
const QString kActionConnectorStyle = QStringLiteral("diagram.context.connector.style");
const QString kActionDeleteConnector = QStringLiteral("diagram.context.connector.delete");

QString presetActionId(const QString& prefix, const QString& label)
{
    return prefix + label.toLower();
}

int countPorts(const Block& block, PortDirection excluded)
{
    return static_cast<int>(std::count_if(block.ports.cbegin(), block.ports.cend(),
                                          [excluded](const Port& port) { return port.direction != excluded; }));
}

} // namespace

DiagramContextMenuController::DiagramContextMenuController(DiagramEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{}

QList<ContextMenuAction> DiagramContextMenuController::actionsFor(const State::ContextMenuState& state) const
{
    QList<ContextMenuAction> actions;
    if (!m_engine)
        return actions;

    switch (state.kind) {
        case State::ContextMenuKind::Closed:
            break;
        case State::ContextMenuKind::Canvas:
            appendCanvasActions(actions);
            break;
        case State::ContextMenuKind::Node:
            if (m_engine->snapshot().findBlock(state.blockId))
                appendBlockActions(actions);
            break;
        case State::ContextMenuKind::Edge:
            if (m_engine->snapshot().findConnector(state.connectorId))
                appendConnectorActions(actions);
            break;
    }
    return actions;
}

void DiagramContextMenuController::appendCanvasActions(QList<ContextMenuAction>& actions) const
{
    const bool enabled = m_engine->hasActiveDiagram();
    for (const BlockPreset& preset : blockPresets()) {
        actions.push_back(ContextMenuAction::item(presetActionId(kActionAddBlockPrefix, preset.label),
                                                  QStringLiteral("Add %1").arg(preset.label),
                                                  enabled));
    }
}

void DiagramContextMenuController::appendBlockActions(QList<ContextMenuAction>& actions) const
{
    actions.push_back(ContextMenuAction::item(kActionAddInputPort, QStringLiteral("Add input port")));
    actions.push_back(ContextMenuAction::item(kActionAddOutputPort, QStringLiteral("Add output port")));
    actions.push_back(ContextMenuAction::item(kActionDuplicateBlock, QStringLiteral("Duplicate block")));
    actions.push_back(ContextMenuAction::item(kActionDeleteBlock, QStringLiteral("Delete block")));
}

void DiagramContextMenuController::appendConnectorActions(QList<ContextMenuAction>& actions) const
{
    for (const Support::ConnectorStylePreset& preset : Support::connectorStylePresets()) {
        actions.push_back(ContextMenuAction::item(presetActionId(kActionConnectorPresetPrefix, preset.label),
                                                  QStringLiteral("Line: %1").arg(preset.label)));
    }
    actions.push_back(ContextMenuAction::separatorAction());
    actions.push_back(ContextMenuAction::item(kActionConnectorStyle, QStringLiteral("Style…")));
    actions.push_back(ContextMenuAction::item(kActionDeleteConnector, QStringLiteral("Delete connector")));
}

bool DiagramContextMenuController::handleMenuAction(const State::ContextMenuState& state, const QString& actionId)
{
    if (!m_engine || actionId.isEmpty())
        return false;

    // Disabled or stale entries are not executable.
    const QList<ContextMenuAction> actions = actionsFor(state);
    const ContextMenuAction* action = Utils::findAction(actions, actionId);
    if (!action || !action->enabled)
        return false;

    switch (state.kind) {
        case State::ContextMenuKind::Canvas:
            return executeCanvasAction(state, actionId);
        case State::ContextMenuKind::Node:
            return executeBlockAction(state, actionId);
        case State::ContextMenuKind::Edge:
            return executeConnectorAction(state, actionId);
        case State::ContextMenuKind::Closed:
            break;
    }
    return false;
}

bool DiagramContextMenuController::executeCanvasAction(const State::ContextMenuState& state, const QString& actionId)
{
    for (const BlockPreset& preset : blockPresets()) {
        if (actionId == presetActionId(kActionAddBlockPrefix, preset.label))
            return m_engine->addBlock(preset, state.worldPos).ok;
    }
    return false;
}

bool DiagramContextMenuController::executeBlockAction(const State::ContextMenuState& state, const QString& actionId)
{
    const Block* block = m_engine->snapshot().findBlock(state.blockId);
    if (!block)
        return false;

    if (actionId == kActionAddInputPort) {
        const QString name = QStringLiteral("in%1").arg(countPorts(*block, PortDirection::Out) + 1);
        return m_engine->addPort(block->id, name, PortDirection::In).ok;
    }
    if (actionId == kActionAddOutputPort) {
        const QString name = QStringLiteral("out%1").arg(countPorts(*block, PortDirection::In) + 1);
        return m_engine->addPort(block->id, name, PortDirection::Out).ok;
    }
    if (actionId == kActionDuplicateBlock)
        return m_engine->duplicateBlock(block->id).ok;
    if (actionId == kActionDeleteBlock)
        return m_engine->removeBlock(block->id).ok;
    return false;
}

bool DiagramContextMenuController::executeConnectorAction(const State::ContextMenuState& state,
                                                          const QString& actionId)
{
    const ConnectorId connectorId = state.connectorId;

    if (actionId == kActionConnectorStyle) {
        m_engine->openConnectorStyling(connectorId, state.screenPos);
        return true;
    }
    if (actionId == kActionDeleteConnector)
        return m_engine->removeConnector(connectorId).ok;

    for (const Support::ConnectorStylePreset& preset : Support::connectorStylePresets()) {
        if (actionId == presetActionId(kActionConnectorPresetPrefix, preset.label))
            return m_engine->applyConnectorPreset(connectorId, preset).ok;
    }
    return false;
}

} // namespace ArchDiagram::Controllers
