// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/DiagramEngine.hpp"

#include "archdiagram/api/ICanvasSurface.hpp"
#include "archdiagram/api/IDiagramStore.hpp"
#include "archdiagram/controllers/DiagramContextMenuController.hpp"
#include "archdiagram/state/DiagramSelectionModel.hpp"
#include "archdiagram/utils/DiagramGeometry.hpp"

#include <utils/Macros.hpp>

#include <QtCore/QLoggingCategory>

#include <algorithm>
#include <memory>

Q_LOGGING_CATEGORY(enginelog, "archdiagram.engine")

namespace ArchDiagram {

namespace {

using namespace Qt::StringLiterals;

Utils::Result rejected(const QString& message)
{
    qCWarning(enginelog).noquote() << "Rejected:" << message;
    return Utils::Result::failure(message);
}

bool sameIdentity(const Api::VisualScene& a, const Api::VisualScene& b)
{
    return a.nodes == b.nodes && a.edges == b.edges;
}

} // namespace

struct DiagramEngine::RefreshRequest {
    quint64 generation = 0;
    quint64 serial = 0;
    quint64 writeEpoch = 0;
    Utils::Result status;
    std::optional<QVector<Block>> blocks;
    std::optional<QVector<Connector>> connectors;
};

DiagramEngine::DiagramEngine(Api::IDiagramStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_settings(engineSettingsDefaults())
    , m_reconciler(m_settings)
    , m_selection(new State::DiagramSelectionModel(this))
    , m_menu(new State::ContextMenuStateMachine(this))
    , m_menuController(new Controllers::DiagramContextMenuController(this, this))
    , m_blockMutations([this](const QString& blockId, const BlockUpdate& update) { sendBlockUpdate(blockId, update); },
                       m_settings.debounceMs)
    , m_portTracker(m_settings)
    , m_refreshDebounce(this)
{
    m_blockMutations.setMergePolicy([](BlockUpdate& pending, const BlockUpdate& incoming) {
        pending.mergeFrom(incoming);
    });

    m_refreshDebounce.setDelayMs(0);
    m_refreshDebounce.setAction([this]() { refresh(); });

    connect(m_selection, &State::DiagramSelectionModel::selectionChanged, this, &DiagramEngine::rebuildScene);
    connect(m_selection, &State::DiagramSelectionModel::selectedPortChanged, this, &DiagramEngine::rebuildScene);
    connect(m_menu, &State::ContextMenuStateMachine::stateChanged, this, &DiagramEngine::contextMenuChanged);

    if (m_store)
        connect(m_store.data(), &Api::IDiagramStore::changed, this, &DiagramEngine::handleStoreChanged);
}

DiagramEngine::~DiagramEngine()
{
    // Unsent drags and resizes are dropped, not persisted.
    m_blockMutations.cancelAll();
    m_refreshDebounce.cancel();
}

void DiagramEngine::setSurface(Api::ICanvasSurface* surface)
{
    if (m_surface == surface)
        return;
    m_surface = surface;
    if (m_surface)
        m_surface->render(m_scene);
}

void DiagramEngine::setSettings(const EngineSettings& settings)
{
    m_settings = normalizedEngineSettings(settings);
    m_reconciler.setSettings(m_settings);
    m_portTracker.setSettings(m_settings);
    m_blockMutations.setDelayMs(m_settings.debounceMs);
    rebuildScene();
}

// Active diagram ------------------------------------------------------------

void DiagramEngine::setActiveDiagram(const Api::DiagramScope& scope, const Diagram& diagram)
{
    if (!scope.isValid() || scope.diagramId != diagram.id) {
        qCWarning(enginelog) << "Ignoring invalid diagram scope" << scope.tenant << scope.project
                             << scope.diagramId.toString();
        clearActiveDiagram();
        return;
    }

    if (hasActiveDiagram() && m_scope == scope) {
        m_snapshot.diagram = diagram;
        requestRefresh();
        return;
    }

    resetInteractionState();
    ++m_generation;
    m_scope = scope;
    m_snapshot = DiagramSnapshot{};
    m_snapshot.diagram = diagram;

    qCDebug(enginelog) << "Active diagram" << diagram.id.toString() << diagram.name;

    rebuildScene();
    emit activeDiagramChanged();
    emit snapshotChanged();
    refresh();
}

void DiagramEngine::clearActiveDiagram()
{
    const bool hadDiagram = hasActiveDiagram();
    resetInteractionState();
    ++m_generation;
    m_scope = Api::DiagramScope{};
    m_snapshot = DiagramSnapshot{};
    rebuildScene();
    if (hadDiagram) {
        emit activeDiagramChanged();
        emit snapshotChanged();
    }
}

void DiagramEngine::resetInteractionState()
{
    m_blockMutations.cancelAll();
    m_refreshDebounce.cancel();
    m_portTracker.cancel();
    m_inflightPort.reset();
    m_dragging.clear();
    m_inflightWrites = 0;
    closeContextMenu(State::ContextMenuCloseReason::DiagramSwitch);
    closeStyling();
    m_selection->clear();
}

Utils::Result DiagramEngine::requireActiveDiagram() const
{
    if (!hasActiveDiagram())
        return rejected(u"No active diagram."_s);
    return Utils::Result::success();
}

bool DiagramEngine::canPersist() const
{
    return m_store && m_scope.isValid();
}

// Refresh -------------------------------------------------------------------

void DiagramEngine::requestRefresh()
{
    UTILS_GUARD(canPersist() && hasActiveDiagram());
    m_refreshDebounce.trigger();
}

void DiagramEngine::refresh()
{
    UTILS_GUARD(canPersist() && hasActiveDiagram());
    m_refreshDebounce.cancel();

    auto request = std::make_shared<RefreshRequest>();
    request->generation = m_generation;
    request->serial = ++m_refreshSerial;
    request->writeEpoch = m_writeEpoch;

    QPointer<DiagramEngine> self(this);
    const auto finish = [self, request]() {
        if (self && request->blocks && request->connectors)
            self->finishRefresh(*request);
    };

    m_store->listBlocks(m_scope, [request, finish](const Utils::Result& result, const QVector<Block>& blocks) {
        request->status.merge(result);
        request->blocks = blocks;
        finish();
    });
    m_store->listConnectors(m_scope,
                            [request, finish](const Utils::Result& result, const QVector<Connector>& connectors) {
                                request->status.merge(result);
                                request->connectors = connectors;
                                finish();
                            });
}

void DiagramEngine::finishRefresh(const RefreshRequest& request)
{
    if (request.generation != m_generation || request.serial < m_appliedRefreshSerial)
        return;

    if (!request.status) {
        const QString message = request.status.message();
        qCWarning(enginelog).noquote() << "Loading diagram" << m_scope.diagramId.toString() << "failed:" << message;
        emit persistenceFailed(m_scope.diagramId.toString(), message);
        return;
    }

    // Our own writes are not in this snapshot yet; a later refresh will be.
    if (m_inflightWrites > 0) {
        qCDebug(enginelog) << "Deferring snapshot while" << m_inflightWrites << "writes are outstanding";
        return;
    }
    if (request.writeEpoch != m_writeEpoch) {
        requestRefresh();
        return;
    }

    m_appliedRefreshSerial = request.serial;
    acceptStoreContent(*request.blocks, *request.connectors);
}

void DiagramEngine::acceptStoreContent(const QVector<Block>& blocks, const QVector<Connector>& connectors)
{
    m_snapshot.blocks = blocks;
    m_snapshot.connectors = connectors;
    overlayPendingMutations();

    m_dragging.removeIf([this](const BlockId& id) { return m_snapshot.findBlock(id) == nullptr; });
    if (m_inflightPort) {
        const Block* owner = m_snapshot.findBlock(m_inflightPort->port.blockId);
        if (!owner || !owner->ownsPort(m_inflightPort->port.portId))
            onPortDragCancel();
    }

    afterLocalChange();
}

void DiagramEngine::overlayPendingMutations()
{
    for (const QString& id : m_blockMutations.pendingIds()) {
        const auto pending = m_blockMutations.pendingPayload(id);
        Block* block = m_snapshot.findBlock(BlockId(id));
        if (pending && block)
            pending->applyTo(*block);
    }
}

void DiagramEngine::handleStoreChanged(const Api::DiagramScope& scope)
{
    if (hasActiveDiagram() && scope == m_scope)
        requestRefresh();
}

// Scene ---------------------------------------------------------------------

State::ReconcileContext DiagramEngine::reconcileContext() const
{
    State::ReconcileContext context;
    context.dragging = m_dragging;
    context.selectedBlock = m_selection->selectedBlock();
    context.selectedConnector = m_selection->selectedConnector();
    context.selectedPort = m_selection->selectedPort();
    context.inflightPort = m_inflightPort;
    return context;
}

void DiagramEngine::rebuildScene()
{
    renderScene(m_reconciler.reconcile(m_snapshot, m_scene, reconcileContext()));
}

void DiagramEngine::renderScene(const Api::VisualScene& next)
{
    if (sameIdentity(m_scene, next))
        return;
    m_scene = next;
    if (m_surface)
        m_surface->render(m_scene);
    emit sceneChanged();
}

void DiagramEngine::afterLocalChange()
{
    m_selection->pruneMissing(m_snapshot);
    validateStylingPopover();
    emit snapshotChanged();
    rebuildScene();

    if (m_menu->isOpen() && contextMenuActions().isEmpty() && m_surface)
        m_surface->hideContextMenu();
}

// Context menu --------------------------------------------------------------

const State::ContextMenuState& DiagramEngine::contextMenu() const noexcept
{
    return m_menu->state();
}

QList<Utils::ContextMenuAction> DiagramEngine::contextMenuActions() const
{
    return m_menuController->actionsFor(m_menu->state());
}

void DiagramEngine::presentContextMenu()
{
    UTILS_GUARD(m_surface);

    const QList<Utils::ContextMenuAction> actions = contextMenuActions();
    if (!m_menu->isOpen() || actions.isEmpty()) {
        m_surface->hideContextMenu();
        return;
    }
    m_surface->showContextMenu(actions, m_menu->state().screenPos);
}

void DiagramEngine::closeContextMenu(State::ContextMenuCloseReason reason)
{
    if (m_menu->close(reason) && m_surface)
        m_surface->hideContextMenu();
}

bool DiagramEngine::triggerMenuAction(const QString& actionId)
{
    const State::ContextMenuState state = m_menu->state();
    if (!state.isOpen())
        return false;

    closeContextMenu(State::ContextMenuCloseReason::ActionTriggered);
    const bool handled = m_menuController->handleMenuAction(state, actionId);
    if (!handled)
        qCDebug(enginelog) << "Menu action not handled:" << actionId;
    return handled;
}

// Styling popovers ----------------------------------------------------------

void DiagramEngine::openBlockStyling(const BlockId& blockId, const QPointF& position)
{
    UTILS_GUARD(hasActiveDiagram() && m_snapshot.findBlock(blockId));
    const StylingPopover next{StylingTarget::Block, blockId.toString(), position};
    if (m_stylingPopover == next)
        return;
    m_stylingPopover = next;
    emit stylingPopoverChanged();
}

void DiagramEngine::openConnectorStyling(const ConnectorId& connectorId, const QPointF& position)
{
    UTILS_GUARD(hasActiveDiagram() && m_snapshot.findConnector(connectorId));
    const StylingPopover next{StylingTarget::Connector, connectorId.toString(), position};
    if (m_stylingPopover == next)
        return;
    m_stylingPopover = next;
    emit stylingPopoverChanged();
}

void DiagramEngine::closeStyling()
{
    UTILS_GUARD(m_stylingPopover.has_value());
    m_stylingPopover.reset();
    emit stylingPopoverChanged();
}

void DiagramEngine::validateStylingPopover()
{
    UTILS_GUARD(m_stylingPopover.has_value());

    bool valid = hasActiveDiagram();
    if (valid && m_stylingPopover->target == StylingTarget::Block)
        valid = m_snapshot.findBlock(BlockId(m_stylingPopover->entityId)) != nullptr;
    else if (valid)
        valid = m_snapshot.findConnector(ConnectorId(m_stylingPopover->entityId)) != nullptr;

    if (!valid)
        closeStyling();
}

// Surface input -------------------------------------------------------------

void DiagramEngine::onNodeDrag(const BlockId& blockId, const QPointF& position, bool settled)
{
    UTILS_GUARD(hasActiveDiagram());
    Block* block = m_snapshot.findBlock(blockId);
    if (!block) {
        qCDebug(enginelog) << "Drag for unknown block" << blockId.toString();
        return;
    }

    if (!settled) {
        m_dragging.insert(blockId);
        renderScene(State::DiagramReconciler::withNodePosition(m_scene, blockId, position));
        return;
    }

    m_dragging.remove(blockId);
    block->position = position;
    m_blockMutations.schedule(blockId.toString(), BlockUpdate::moveTo(position));
    afterLocalChange();
}

void DiagramEngine::onNodeResize(const BlockId& blockId, const QSizeF& size)
{
    UTILS_GUARD(hasActiveDiagram());
    Block* block = m_snapshot.findBlock(blockId);
    if (!block) {
        qCDebug(enginelog) << "Resize for unknown block" << blockId.toString();
        return;
    }

    const QSizeF clamped = Support::clampBlockSize(size, m_settings);
    block->size = clamped;
    m_blockMutations.schedule(blockId.toString(), BlockUpdate::resizeTo(clamped));
    afterLocalChange();
}

Utils::Result DiagramEngine::onConnect(const BlockId& source,
                                       const BlockId& target,
                                       const std::optional<PortId>& sourceHandle,
                                       const std::optional<PortId>& targetHandle)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    if (source.isNull() || target.isNull())
        return rejected(u"A connector needs a source and a target block."_s);

    const Block* sourceBlock = m_snapshot.findBlock(source);
    const Block* targetBlock = m_snapshot.findBlock(target);
    if (!sourceBlock || !targetBlock)
        return rejected(u"Cannot connect blocks that are not on this diagram."_s);
    if (sourceHandle && !sourceBlock->ownsPort(*sourceHandle))
        return rejected(u"Port %1 does not belong to block %2."_s.arg(sourceHandle->toString(), source.toString()));
    if (targetHandle && !targetBlock->ownsPort(*targetHandle))
        return rejected(u"Port %1 does not belong to block %2."_s.arg(targetHandle->toString(), target.toString()));

    Connector connector;
    connector.id = ConnectorId::create(u"connector");
    connector.source = source;
    connector.target = target;
    connector.sourcePortId = sourceHandle;
    connector.targetPortId = targetHandle;
    connector.kind = ConnectorKind::Flow;

    m_snapshot.connectors.push_back(connector);
    if (canPersist())
        m_store->createConnector(m_scope, connector, trackWrite(connector.id.toString(), u"connector create"_s));

    m_selection->selectConnector(connector.id);
    afterLocalChange();
    return Utils::Result::success();
}

void DiagramEngine::onSelectionChange(const QList<BlockId>& nodes, const QList<ConnectorId>& edges)
{
    closeContextMenu(State::ContextMenuCloseReason::PrimaryClick);
    closeStyling();
    m_selection->applySurfaceSelection(nodes, edges);
}

void DiagramEngine::onContextMenu(const State::ContextMenuTarget& target,
                                  const QPointF& screenPos,
                                  const QPointF& worldPos)
{
    switch (target.kind) {
        case State::ContextMenuKind::Canvas:
            m_selection->clear();
            m_menu->openCanvas(screenPos, worldPos);
            break;
        case State::ContextMenuKind::Node:
            m_menu->openNode(target.blockId, screenPos);
            break;
        case State::ContextMenuKind::Edge:
            m_menu->openEdge(target.connectorId, screenPos);
            break;
        case State::ContextMenuKind::Closed:
            closeContextMenu(State::ContextMenuCloseReason::PrimaryClick);
            return;
    }
    presentContextMenu();
}

void DiagramEngine::onPaneClick()
{
    closeContextMenu(State::ContextMenuCloseReason::PrimaryClick);
    closeStyling();
    m_selection->clear();
}

void DiagramEngine::onEscape()
{
    closeContextMenu(State::ContextMenuCloseReason::Escape);
    if (m_portTracker.isActive())
        onPortDragCancel();
}

void DiagramEngine::onScroll()
{
    closeContextMenu(State::ContextMenuCloseReason::Scroll);
}

void DiagramEngine::onEdgesRemoved(const QList<ConnectorId>& connectorIds)
{
    for (const ConnectorId& id : connectorIds) {
        const Utils::Result result = removeConnector(id);
        if (!result)
            qCDebug(enginelog).noquote() << "Edge removal skipped:" << result.message();
    }
}

void DiagramEngine::onPortClick(const PortRef& port)
{
    const Block* block = m_snapshot.findBlock(port.blockId);
    UTILS_GUARD(block && block->ownsPort(port.portId));
    closeContextMenu(State::ContextMenuCloseReason::PrimaryClick);
    closeStyling();
    m_selection->selectPort(port);
}

void DiagramEngine::onPortDragStart(const PortRef& port)
{
    UTILS_GUARD(hasActiveDiagram());
    const Block* block = m_snapshot.findBlock(port.blockId);
    UTILS_GUARD(block && block->ownsPort(port.portId));

    const QVector<Support::PortPlacement> layout = Support::resolvePortLayout(*block, m_settings);
    Support::PortPlacement initial;
    for (qsizetype i = 0; i < block->ports.size(); ++i) {
        if (block->ports.at(i).id == port.portId) {
            initial = layout.at(i);
            break;
        }
    }

    m_portTracker.begin(port, initial);
    m_inflightPort = State::InflightPortPlacement{port, initial};
    m_selection->selectPort(port);
    rebuildScene();
}

void DiagramEngine::onPortDragMove(const QPointF& local)
{
    UTILS_GUARD(m_portTracker.isActive() && m_inflightPort.has_value());

    const Block* block = m_snapshot.findBlock(m_portTracker.port().blockId);
    if (!block) {
        onPortDragCancel();
        return;
    }

    const auto placement = m_portTracker.update(local, Support::clampBlockSize(block->size, m_settings));
    if (!placement || m_inflightPort->placement == *placement)
        return;

    m_inflightPort->placement = *placement;
    rebuildScene();
}

void DiagramEngine::onPortDragEnd()
{
    const PortRef port = m_portTracker.port();
    const auto placement = m_portTracker.finish();
    m_inflightPort.reset();
    if (!placement) {
        rebuildScene();
        return;
    }

    PortUpdate update;
    update.edge = placement->edge;
    update.offset = placement->offset;
    const Utils::Result result = updatePort(port, update);
    if (!result)
        rebuildScene();
}

void DiagramEngine::onPortDragCancel()
{
    m_portTracker.cancel();
    if (!m_inflightPort)
        return;
    m_inflightPort.reset();
    rebuildScene();
}

// Commands ------------------------------------------------------------------

Utils::Result DiagramEngine::addBlock(const BlockPreset& preset,
                                      const std::optional<QPointF>& position,
                                      BlockId* createdId)
{
    UTILS_PROPAGATE(requireActiveDiagram());

    Block block;
    block.id = BlockId::create(u"block");
    block.name = preset.label;
    block.kind = preset.kind;
    if (!preset.stereotype.isEmpty())
        block.stereotype = preset.stereotype;
    if (!preset.description.isEmpty())
        block.description = preset.description;
    block.position = position ? *position
                              : Support::computeBlockPlacement(static_cast<int>(m_snapshot.blocks.size()),
                                                               m_rng, m_settings);
    block.size = m_settings.defaultBlockSize;

    m_snapshot.blocks.push_back(block);
    if (canPersist())
        m_store->createBlock(m_scope, block, trackWrite(block.id.toString(), u"block create"_s));

    if (createdId)
        *createdId = block.id;
    m_selection->selectBlock(block.id);
    afterLocalChange();
    return Utils::Result::success();
}

Utils::Result DiagramEngine::duplicateBlock(const BlockId& blockId, BlockId* createdId)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    const Block* block = m_snapshot.findBlock(blockId);
    if (!block)
        return rejected(u"Unknown block %1."_s.arg(blockId.toString()));

    BlockPreset copy;
    copy.label = duplicateBlockName(block->name);
    copy.kind = block->kind;
    copy.stereotype = block->stereotype.value_or(u"block"_s);
    copy.description = block->description.value_or(QString());
    const QPointF position = Support::duplicatePlacement(*block);
    return addBlock(copy, position, createdId);
}

Utils::Result DiagramEngine::updateBlock(const BlockId& blockId, const BlockUpdate& update)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    if (update.isEmpty())
        return rejected(u"Block update for %1 has no fields."_s.arg(blockId.toString()));
    Block* block = m_snapshot.findBlock(blockId);
    if (!block)
        return rejected(u"Unknown block %1."_s.arg(blockId.toString()));

    BlockUpdate effective = update;
    if (effective.size)
        effective.size = Support::clampBlockSize(*effective.size, m_settings);
    effective.applyTo(*block);

    if (canPersist())
        m_store->updateBlock(m_scope, blockId, effective, trackWrite(blockId.toString(), u"block update"_s));
    afterLocalChange();
    return Utils::Result::success();
}

Utils::Result DiagramEngine::removeBlock(const BlockId& blockId)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    if (!m_snapshot.findBlock(blockId))
        return rejected(u"Unknown block %1."_s.arg(blockId.toString()));

    m_blockMutations.cancel(blockId.toString());
    m_dragging.remove(blockId);
    if (m_inflightPort && m_inflightPort->port.blockId == blockId) {
        m_portTracker.cancel();
        m_inflightPort.reset();
    }

    m_snapshot.removeBlock(blockId);
    const int cascaded = m_snapshot.removeConnectorsOf(blockId);
    qCDebug(enginelog) << "Removed block" << blockId.toString() << "and" << cascaded << "connectors";

    if (canPersist())
        m_store->deleteBlock(m_scope, blockId, trackWrite(blockId.toString(), u"block delete"_s));
    afterLocalChange();
    return Utils::Result::success();
}

Utils::Result DiagramEngine::addPort(const BlockId& blockId,
                                     const QString& name,
                                     PortDirection direction,
                                     PortId* createdId)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    Block* block = m_snapshot.findBlock(blockId);
    if (!block)
        return rejected(u"Unknown block %1."_s.arg(blockId.toString()));
    if (name.trimmed().isEmpty())
        return rejected(u"Port name is empty."_s);

    Port port;
    port.id = PortId::create(u"port");
    port.name = name.trimmed();
    port.direction = direction;
    block->ports.push_back(port);

    if (canPersist())
        m_store->addPort(m_scope, blockId, port, trackWrite(port.id.toString(), u"port create"_s));
    if (createdId)
        *createdId = port.id;
    afterLocalChange();
    return Utils::Result::success();
}

Utils::Result DiagramEngine::updatePort(const PortRef& port, const PortUpdate& update)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    if (update.isEmpty())
        return rejected(u"Port update for %1 has no fields."_s.arg(port.portId.toString()));
    Block* block = m_snapshot.findBlock(port.blockId);
    Port* target = block ? block->findPort(port.portId) : nullptr;
    if (!target)
        return rejected(u"Unknown port %1."_s.arg(port.portId.toString()));

    PortUpdate effective = update;
    if (effective.offset)
        effective.offset = Support::clampPortOffset(*effective.offset, m_settings);
    effective.applyTo(*target);

    if (canPersist()) {
        m_store->updatePort(m_scope, port.blockId, port.portId, effective,
                            trackWrite(port.portId.toString(), u"port update"_s));
    }
    afterLocalChange();
    return Utils::Result::success();
}

Utils::Result DiagramEngine::removePort(const PortRef& port)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    Block* block = m_snapshot.findBlock(port.blockId);
    if (!block || !block->ownsPort(port.portId))
        return rejected(u"Unknown port %1."_s.arg(port.portId.toString()));

    if (m_inflightPort && m_inflightPort->port == port) {
        m_portTracker.cancel();
        m_inflightPort.reset();
    }
    block->ports.removeIf([&port](const Port& p) { return p.id == port.portId; });

    if (canPersist())
        m_store->removePort(m_scope, port.blockId, port.portId, trackWrite(port.portId.toString(), u"port delete"_s));
    afterLocalChange();
    return Utils::Result::success();
}

Utils::Result DiagramEngine::updateConnector(const ConnectorId& connectorId, const ConnectorUpdate& update)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    if (update.isEmpty())
        return rejected(u"Connector update for %1 has no fields."_s.arg(connectorId.toString()));
    Connector* connector = m_snapshot.findConnector(connectorId);
    if (!connector)
        return rejected(u"Unknown connector %1."_s.arg(connectorId.toString()));

    const Block* source = m_snapshot.findBlock(connector->source);
    const Block* target = m_snapshot.findBlock(connector->target);
    if (update.sourcePortId && !(source && source->ownsPort(*update.sourcePortId)))
        return rejected(u"Port %1 does not belong to the source block."_s.arg(update.sourcePortId->toString()));
    if (update.targetPortId && !(target && target->ownsPort(*update.targetPortId)))
        return rejected(u"Port %1 does not belong to the target block."_s.arg(update.targetPortId->toString()));

    update.applyTo(*connector);
    if (canPersist()) {
        m_store->updateConnector(m_scope, connectorId, update,
                                 trackWrite(connectorId.toString(), u"connector update"_s));
    }
    afterLocalChange();
    return Utils::Result::success();
}

Utils::Result DiagramEngine::applyConnectorPreset(const ConnectorId& connectorId,
                                                  const Support::ConnectorStylePreset& preset)
{
    return updateConnector(connectorId, preset.toUpdate());
}

Utils::Result DiagramEngine::removeConnector(const ConnectorId& connectorId)
{
    UTILS_PROPAGATE(requireActiveDiagram());
    if (!m_snapshot.removeConnector(connectorId))
        return rejected(u"Unknown connector %1."_s.arg(connectorId.toString()));

    if (canPersist())
        m_store->deleteConnector(m_scope, connectorId, trackWrite(connectorId.toString(), u"connector delete"_s));
    afterLocalChange();
    return Utils::Result::success();
}

// Persistence ---------------------------------------------------------------

void DiagramEngine::sendBlockUpdate(const QString& blockId, const BlockUpdate& update)
{
    UTILS_GUARD(canPersist() && hasActiveDiagram());
    m_store->updateBlock(m_scope, BlockId(blockId), update, trackWrite(blockId, u"block update"_s));
}

Api::StoreCompletion DiagramEngine::trackWrite(const QString& entityId, const QString& operation)
{
    ++m_inflightWrites;
    ++m_writeEpoch;

    QPointer<DiagramEngine> self(this);
    const quint64 generation = m_generation;
    return [self, generation, entityId, operation](const Utils::Result& result) {
        if (self)
            self->onWriteFinished(generation, entityId, operation, result);
    };
}

void DiagramEngine::onWriteFinished(quint64 generation,
                                    const QString& entityId,
                                    const QString& operation,
                                    const Utils::Result& result)
{
    if (generation != m_generation)
        return;

    m_inflightWrites = std::max(m_inflightWrites - 1, 0);
    ++m_writeEpoch;

    if (!result) {
        const QString message = result.message();
        qCWarning(enginelog).noquote() << "Persisting" << operation << "for" << entityId << "failed:" << message;
        emit persistenceFailed(entityId, message);
    }

    requestRefresh();
}

} // namespace ArchDiagram
