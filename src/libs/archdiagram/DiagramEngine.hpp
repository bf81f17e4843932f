// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/ArchDiagramGlobal.hpp"
#include "archdiagram/EngineSettings.hpp"
#include "archdiagram/api/DiagramStoreTypes.hpp"
#include "archdiagram/api/VisualTypes.hpp"
#include "archdiagram/model/DiagramSnapshot.hpp"
#include "archdiagram/model/DiagramUpdates.hpp"
#include "archdiagram/state/ContextMenuState.hpp"
#include "archdiagram/state/DiagramReconciler.hpp"
#include "archdiagram/state/MutationQueue.hpp"
#include "archdiagram/utils/DiagramStyle.hpp"
#include "archdiagram/utils/PortEdgeTracker.hpp"

#include <utils/Result.hpp>
#include <utils/async/DebouncedInvoker.hpp>
#include <utils/contextmenu/ContextMenuAction.hpp>

#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>

#include <optional>

class QRandomGenerator;

namespace ArchDiagram::Api {
class ICanvasSurface;
class IDiagramStore;
} // namespace ArchDiagram::Api

namespace ArchDiagram::Controllers {
class DiagramContextMenuController;
} // namespace ArchDiagram::Controllers

namespace ArchDiagram::State {
class DiagramSelectionModel;
} // namespace ArchDiagram::State

namespace ArchDiagram {

enum class ARCHDIAGRAM_EXPORT StylingTarget : uint8_t { Block, Connector };

struct ARCHDIAGRAM_EXPORT StylingPopover final {
    StylingTarget target = StylingTarget::Block;
    QString entityId;
    QPointF position;

    bool operator==(const StylingPopover&) const = default;
};

// Keeps one diagram's canvas in step with the store. Local edits are applied
// to the snapshot at once and persisted behind them; drags and resizes are
// coalesced per block before they reach the store. Snapshots from the store
// are only taken while none of our own writes are outstanding.
class ARCHDIAGRAM_EXPORT DiagramEngine final : public QObject
{
    Q_OBJECT

public:
    explicit DiagramEngine(Api::IDiagramStore* store, QObject* parent = nullptr);
    ~DiagramEngine() override;

    void setSurface(Api::ICanvasSurface* surface);
    Api::ICanvasSurface* surface() const noexcept { return m_surface; }

    void setSettings(const EngineSettings& settings);
    const EngineSettings& settings() const noexcept { return m_settings; }

    // Placement jitter source; the global generator when unset.
    void setRandomGenerator(QRandomGenerator* rng) { m_rng = rng; }

    // Active diagram.
    void setActiveDiagram(const Api::DiagramScope& scope, const Diagram& diagram);
    void clearActiveDiagram();
    bool hasActiveDiagram() const noexcept { return m_snapshot.hasDiagram(); }
    const Api::DiagramScope& scope() const noexcept { return m_scope; }
    void refresh();

    const DiagramSnapshot& snapshot() const noexcept { return m_snapshot; }
    const Api::VisualScene& scene() const noexcept { return m_scene; }
    State::DiagramSelectionModel* selection() const noexcept { return m_selection; }

    // Context menu.
    const State::ContextMenuState& contextMenu() const noexcept;
    QList<Utils::ContextMenuAction> contextMenuActions() const;
    bool triggerMenuAction(const QString& actionId);

    // Styling popovers.
    const std::optional<StylingPopover>& stylingPopover() const noexcept { return m_stylingPopover; }
    void openBlockStyling(const BlockId& blockId, const QPointF& position);
    void openConnectorStyling(const ConnectorId& connectorId, const QPointF& position);
    void closeStyling();

    // Surface input.
    void onNodeDrag(const BlockId& blockId, const QPointF& position, bool settled);
    void onNodeResize(const BlockId& blockId, const QSizeF& size);
    Utils::Result onConnect(const BlockId& source,
                            const BlockId& target,
                            const std::optional<PortId>& sourceHandle = std::nullopt,
                            const std::optional<PortId>& targetHandle = std::nullopt);
    void onSelectionChange(const QList<BlockId>& nodes, const QList<ConnectorId>& edges);
    void onContextMenu(const State::ContextMenuTarget& target, const QPointF& screenPos, const QPointF& worldPos);
    void onPaneClick();
    void onEscape();
    void onScroll();
    void onEdgesRemoved(const QList<ConnectorId>& connectorIds);
    void onPortClick(const PortRef& port);
    void onPortDragStart(const PortRef& port);
    // |local| is relative to the owning block's top-left corner.
    void onPortDragMove(const QPointF& local);
    void onPortDragEnd();
    void onPortDragCancel();

    // Commands. Each applies locally first, then persists.
    Utils::Result addBlock(const BlockPreset& preset,
                           const std::optional<QPointF>& position = std::nullopt,
                           BlockId* createdId = nullptr);
    Utils::Result duplicateBlock(const BlockId& blockId, BlockId* createdId = nullptr);
    Utils::Result updateBlock(const BlockId& blockId, const BlockUpdate& update);
    Utils::Result removeBlock(const BlockId& blockId);
    Utils::Result addPort(const BlockId& blockId, const QString& name, PortDirection direction,
                          PortId* createdId = nullptr);
    Utils::Result updatePort(const PortRef& port, const PortUpdate& update);
    Utils::Result removePort(const PortRef& port);
    Utils::Result updateConnector(const ConnectorId& connectorId, const ConnectorUpdate& update);
    Utils::Result applyConnectorPreset(const ConnectorId& connectorId, const Support::ConnectorStylePreset& preset);
    Utils::Result removeConnector(const ConnectorId& connectorId);

    // Debounced block writes.
    int pendingMutationCount() const { return m_blockMutations.pendingCount(); }
    void flushPendingMutations() { m_blockMutations.flushAll(); }
    bool isDragging(const BlockId& blockId) const { return m_dragging.contains(blockId); }
    const Support::PortEdgeTracker& portTracker() const noexcept { return m_portTracker; }

signals:
    void activeDiagramChanged();
    void snapshotChanged();
    void sceneChanged();
    void contextMenuChanged();
    void stylingPopoverChanged();
    void persistenceFailed(const QString& entityId, const QString& message);

private:
    struct RefreshRequest;

    Utils::Result requireActiveDiagram() const;
    bool canPersist() const;
    void resetInteractionState();
    void requestRefresh();
    void finishRefresh(const RefreshRequest& request);
    void acceptStoreContent(const QVector<Block>& blocks, const QVector<Connector>& connectors);
    void overlayPendingMutations();

    void rebuildScene();
    void renderScene(const Api::VisualScene& next);
    State::ReconcileContext reconcileContext() const;
    void afterLocalChange();
    void validateStylingPopover();
    void presentContextMenu();
    void closeContextMenu(State::ContextMenuCloseReason reason);

    void sendBlockUpdate(const QString& blockId, const BlockUpdate& update);
    Api::StoreCompletion trackWrite(const QString& entityId, const QString& operation);
    void onWriteFinished(quint64 generation, const QString& entityId, const QString& operation,
                         const Utils::Result& result);
    void handleStoreChanged(const Api::DiagramScope& scope);

    QPointer<Api::IDiagramStore> m_store;
    Api::ICanvasSurface* m_surface = nullptr;
    QRandomGenerator* m_rng = nullptr;
    EngineSettings m_settings;

    Api::DiagramScope m_scope;
    quint64 m_generation = 0;
    DiagramSnapshot m_snapshot;
    Api::VisualScene m_scene;

    State::DiagramReconciler m_reconciler;
    State::DiagramSelectionModel* m_selection = nullptr;
    State::ContextMenuStateMachine* m_menu = nullptr;
    Controllers::DiagramContextMenuController* m_menuController = nullptr;
    State::MutationQueue<BlockUpdate> m_blockMutations;
    Support::PortEdgeTracker m_portTracker;
    std::optional<State::InflightPortPlacement> m_inflightPort;
    QSet<BlockId> m_dragging;
    std::optional<StylingPopover> m_stylingPopover;

    Utils::Async::DebouncedInvoker m_refreshDebounce;
    int m_inflightWrites = 0;
    quint64 m_writeEpoch = 0;
    quint64 m_refreshSerial = 0;
    quint64 m_appliedRefreshSerial = 0;
};

} // namespace ArchDiagram
