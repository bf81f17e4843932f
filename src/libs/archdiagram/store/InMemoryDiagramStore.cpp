// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/store/InMemoryDiagramStore.hpp"

#include "archdiagram/model/DiagramJson.hpp"

#include <utils/Macros.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDateTime>
#include <QtCore/QLoggingCategory>
#include <QtCore/QMetaObject>

#include <algorithm>

Q_LOGGING_CATEGORY(storelog, "archdiagram.store")

namespace ArchDiagram::Store {

namespace {

using namespace Qt::StringLiterals;

Utils::Result notFound(const QString& what, const QString& id)
{
    return Utils::Result::failure(u"%1 %2 not found."_s.arg(what, id));
}

Block* findBlock(QVector<Block>& blocks, const BlockId& id)
{
    const auto it = std::find_if(blocks.begin(), blocks.end(), [&id](const Block& b) { return b.id == id; });
    return it == blocks.end() ? nullptr : &*it;
}

const Block* findBlock(const QVector<Block>& blocks, const BlockId& id)
{
    const auto it = std::find_if(blocks.cbegin(), blocks.cend(), [&id](const Block& b) { return b.id == id; });
    return it == blocks.cend() ? nullptr : &*it;
}

Connector* findConnector(QVector<Connector>& connectors, const ConnectorId& id)
{
    const auto it = std::find_if(connectors.begin(), connectors.end(),
                                 [&id](const Connector& c) { return c.id == id; });
    return it == connectors.end() ? nullptr : &*it;
}

} // namespace

InMemoryDiagramStore::InMemoryDiagramStore(QObject* parent)
    : Api::IDiagramStore(parent)
{}

InMemoryDiagramStore::~InMemoryDiagramStore() = default;

Diagram InMemoryDiagramStore::createDiagram(const QString& tenant,
                                            const QString& project,
                                            const QString& name,
                                            DiagramView view)
{
    DiagramContent content;
    content.tenant = tenant;
    content.project = project;
    content.diagram.id = DiagramId::create(u"diagram");
    content.diagram.name = name;
    content.diagram.view = view;
    m_diagrams.insert(content.diagram.id, content);
    return content.diagram;
}

bool InMemoryDiagramStore::hasDiagram(const Api::DiagramScope& scope) const
{
    return contentFor(scope) != nullptr;
}

Api::DiagramScope InMemoryDiagramStore::scopeFor(const Diagram& diagram) const
{
    const auto it = m_diagrams.constFind(diagram.id);
    if (it == m_diagrams.cend())
        return {};
    return Api::DiagramScope{it->tenant, it->project, diagram.id};
}

InMemoryDiagramStore::DiagramContent* InMemoryDiagramStore::contentFor(const Api::DiagramScope& scope)
{
    auto it = m_diagrams.find(scope.diagramId);
    if (it == m_diagrams.end() || it->tenant != scope.tenant || it->project != scope.project)
        return nullptr;
    return &*it;
}

const InMemoryDiagramStore::DiagramContent* InMemoryDiagramStore::contentFor(const Api::DiagramScope& scope) const
{
    const auto it = m_diagrams.constFind(scope.diagramId);
    if (it == m_diagrams.cend() || it->tenant != scope.tenant || it->project != scope.project)
        return nullptr;
    return &*it;
}

QVector<Block> InMemoryDiagramStore::blocks(const Api::DiagramScope& scope) const
{
    const DiagramContent* content = contentFor(scope);
    return content ? content->blocks : QVector<Block>{};
}

QVector<Connector> InMemoryDiagramStore::connectors(const Api::DiagramScope& scope) const
{
    const DiagramContent* content = contentFor(scope);
    return content ? content->connectors : QVector<Connector>{};
}

std::optional<Block> InMemoryDiagramStore::block(const Api::DiagramScope& scope, const BlockId& blockId) const
{
    const DiagramContent* content = contentFor(scope);
    if (!content)
        return std::nullopt;
    const Block* found = findBlock(content->blocks, blockId);
    if (!found)
        return std::nullopt;
    return *found;
}

Utils::Result InMemoryDiagramStore::seedBlock(const Api::DiagramScope& scope, const Block& block)
{
    DiagramContent* content = contentFor(scope);
    UTILS_GUARD_OK(content, u"Unknown diagram."_s);
    UTILS_GUARD_OK(!block.id.isNull(), u"Block id is empty."_s);

    if (Block* existing = findBlock(content->blocks, block.id))
        *existing = block;
    else
        content->blocks.push_back(block);
    notifyChanged(scope);
    return Utils::Result::success();
}

Utils::Result InMemoryDiagramStore::seedConnector(const Api::DiagramScope& scope, const Connector& connector)
{
    DiagramContent* content = contentFor(scope);
    UTILS_GUARD_OK(content, u"Unknown diagram."_s);
    UTILS_PROPAGATE(validateEndpoints(*content, connector));

    if (Connector* existing = findConnector(content->connectors, connector.id))
        *existing = connector;
    else
        content->connectors.push_back(connector);
    notifyChanged(scope);
    return Utils::Result::success();
}

void InMemoryDiagramStore::failNextWrites(int count, const QString& message)
{
    m_failuresPending = std::max(count, 0);
    m_failureMessage = message;
}

int InMemoryDiagramStore::writeCount(const QString& operation) const
{
    return static_cast<int>(std::count_if(m_writes.cbegin(), m_writes.cend(),
                                          [&operation](const StoreWrite& w) { return w.operation == operation; }));
}

Utils::Result InMemoryDiagramStore::validateEndpoints(const DiagramContent& content, const Connector& connector) const
{
    UTILS_GUARD_OK(!connector.id.isNull(), u"Connector id is empty."_s);

    const Block* source = findBlock(content.blocks, connector.source);
    const Block* target = findBlock(content.blocks, connector.target);
    if (!source)
        return notFound(u"Source block"_s, connector.source.toString());
    if (!target)
        return notFound(u"Target block"_s, connector.target.toString());
    if (connector.sourcePortId && !source->ownsPort(*connector.sourcePortId))
        return Utils::Result::failure(u"Source port does not belong to the source block."_s);
    if (connector.targetPortId && !target->ownsPort(*connector.targetPortId))
        return Utils::Result::failure(u"Target port does not belong to the target block."_s);
    return Utils::Result::success();
}

template <typename Mutation>
void InMemoryDiagramStore::write(const Api::DiagramScope& scope,
                                 const QString& operation,
                                 const QString& entityId,
                                 Api::StoreCompletion done,
                                 Mutation&& mutation)
{
    m_writes.push_back(StoreWrite{operation, entityId});

    if (m_failuresPending > 0) {
        --m_failuresPending;
        qCDebug(storelog) << "Failing" << operation << entityId;
        complete(std::move(done), Utils::Result::failure(m_failureMessage));
        return;
    }

    DiagramContent* content = contentFor(scope);
    if (!content) {
        complete(std::move(done), Utils::Result::failure(u"Unknown diagram."_s));
        return;
    }

    const Utils::Result result = mutation(*content);
    complete(std::move(done), result);
    if (result)
        notifyChanged(scope);
}

void InMemoryDiagramStore::complete(Api::StoreCompletion done, const Utils::Result& result)
{
    UTILS_GUARD(done);
    QMetaObject::invokeMethod(
        this, [done = std::move(done), result]() { done(result); }, Qt::QueuedConnection);
}

void InMemoryDiagramStore::notifyChanged(const Api::DiagramScope& scope)
{
    QMetaObject::invokeMethod(
        this, [this, scope]() { emit changed(scope); }, Qt::QueuedConnection);
}

// Reads ---------------------------------------------------------------------

void InMemoryDiagramStore::listDiagrams(const QString& tenant,
                                        const QString& project,
                                        Api::StoreListCompletion<Diagram> done)
{
    UTILS_GUARD(done);

    QVector<Diagram> diagrams;
    for (const DiagramContent& content : std::as_const(m_diagrams)) {
        if (content.tenant == tenant && content.project == project)
            diagrams.push_back(content.diagram);
    }
    std::sort(diagrams.begin(), diagrams.end(), [](const Diagram& a, const Diagram& b) {
        const int byName = QString::compare(a.name, b.name, Qt::CaseInsensitive);
        return byName != 0 ? byName < 0 : a.id < b.id;
    });

    QMetaObject::invokeMethod(
        this, [done = std::move(done), diagrams]() { done(Utils::Result::success(), diagrams); },
        Qt::QueuedConnection);
}

void InMemoryDiagramStore::listBlocks(const Api::DiagramScope& scope, Api::StoreListCompletion<Block> done)
{
    UTILS_GUARD(done);

    const DiagramContent* content = contentFor(scope);
    const Utils::Result result = content ? Utils::Result::success() : Utils::Result::failure(u"Unknown diagram."_s);
    const QVector<Block> blocks = content ? content->blocks : QVector<Block>{};
    QMetaObject::invokeMethod(
        this, [done = std::move(done), result, blocks]() { done(result, blocks); }, Qt::QueuedConnection);
}

void InMemoryDiagramStore::listConnectors(const Api::DiagramScope& scope, Api::StoreListCompletion<Connector> done)
{
    UTILS_GUARD(done);

    const DiagramContent* content = contentFor(scope);
    const Utils::Result result = content ? Utils::Result::success() : Utils::Result::failure(u"Unknown diagram."_s);
    const QVector<Connector> connectors = content ? content->connectors : QVector<Connector>{};
    QMetaObject::invokeMethod(
        this, [done = std::move(done), result, connectors]() { done(result, connectors); }, Qt::QueuedConnection);
}

// Blocks --------------------------------------------------------------------

void InMemoryDiagramStore::createBlock(const Api::DiagramScope& scope, const Block& block, Api::StoreCompletion done)
{
    write(scope, u"createBlock"_s, block.id.toString(), std::move(done), [&block](DiagramContent& content) {
        Block created = block;
        if (created.id.isNull())
            created.id = BlockId::create(u"block");
        if (findBlock(content.blocks, created.id))
            return Utils::Result::failure(u"Block %1 already exists."_s.arg(created.id.toString()));
        content.blocks.push_back(created);
        return Utils::Result::success();
    });
}

void InMemoryDiagramStore::updateBlock(const Api::DiagramScope& scope,
                                       const BlockId& blockId,
                                       const BlockUpdate& update,
                                       Api::StoreCompletion done)
{
    write(scope, u"updateBlock"_s, blockId.toString(), std::move(done), [&](DiagramContent& content) {
        Block* block = findBlock(content.blocks, blockId);
        if (!block)
            return notFound(u"Block"_s, blockId.toString());
        if (update.isEmpty())
            return Utils::Result::failure(u"Empty block update."_s);
        update.applyTo(*block);
        return Utils::Result::success();
    });
}

void InMemoryDiagramStore::deleteBlock(const Api::DiagramScope& scope, const BlockId& blockId, Api::StoreCompletion done)
{
    write(scope, u"deleteBlock"_s, blockId.toString(), std::move(done), [&blockId](DiagramContent& content) {
        const auto removed = content.blocks.removeIf([&blockId](const Block& b) { return b.id == blockId; });
        if (removed == 0)
            return notFound(u"Block"_s, blockId.toString());
        content.connectors.removeIf([&blockId](const Connector& c) { return c.attachesTo(blockId); });
        return Utils::Result::success();
    });
}

// Connectors ----------------------------------------------------------------

void InMemoryDiagramStore::createConnector(const Api::DiagramScope& scope,
                                           const Connector& connector,
                                           Api::StoreCompletion done)
{
    write(scope, u"createConnector"_s, connector.id.toString(), std::move(done), [&](DiagramContent& content) {
        UTILS_PROPAGATE(validateEndpoints(content, connector));
        if (findConnector(content.connectors, connector.id))
            return Utils::Result::failure(u"Connector %1 already exists."_s.arg(connector.id.toString()));
        content.connectors.push_back(connector);
        return Utils::Result::success();
    });
}

void InMemoryDiagramStore::updateConnector(const Api::DiagramScope& scope,
                                           const ConnectorId& connectorId,
                                           const ConnectorUpdate& update,
                                           Api::StoreCompletion done)
{
    write(scope, u"updateConnector"_s, connectorId.toString(), std::move(done), [&](DiagramContent& content) {
        Connector* connector = findConnector(content.connectors, connectorId);
        if (!connector)
            return notFound(u"Connector"_s, connectorId.toString());
        if (update.isEmpty())
            return Utils::Result::failure(u"Empty connector update."_s);

        Connector updated = *connector;
        update.applyTo(updated);
        UTILS_PROPAGATE(validateEndpoints(content, updated));
        *connector = updated;
        return Utils::Result::success();
    });
}

void InMemoryDiagramStore::deleteConnector(const Api::DiagramScope& scope,
                                           const ConnectorId& connectorId,
                                           Api::StoreCompletion done)
{
    write(scope, u"deleteConnector"_s, connectorId.toString(), std::move(done), [&connectorId](DiagramContent& content) {
        const auto removed = content.connectors.removeIf([&connectorId](const Connector& c) {
            return c.id == connectorId;
        });
        if (removed == 0)
            return notFound(u"Connector"_s, connectorId.toString());
        return Utils::Result::success();
    });
}

// Ports ---------------------------------------------------------------------

void InMemoryDiagramStore::addPort(const Api::DiagramScope& scope,
                                   const BlockId& blockId,
                                   const Port& port,
                                   Api::StoreCompletion done)
{
    write(scope, u"addPort"_s, port.id.toString(), std::move(done), [&](DiagramContent& content) {
        Block* block = findBlock(content.blocks, blockId);
        if (!block)
            return notFound(u"Block"_s, blockId.toString());
        if (port.id.isNull() || block->ownsPort(port.id))
            return Utils::Result::failure(u"Port id is empty or already used."_s);
        block->ports.push_back(port);
        return Utils::Result::success();
    });
}

void InMemoryDiagramStore::updatePort(const Api::DiagramScope& scope,
                                      const BlockId& blockId,
                                      const PortId& portId,
                                      const PortUpdate& update,
                                      Api::StoreCompletion done)
{
    write(scope, u"updatePort"_s, portId.toString(), std::move(done), [&](DiagramContent& content) {
        Block* block = findBlock(content.blocks, blockId);
        Port* port = block ? block->findPort(portId) : nullptr;
        if (!port)
            return notFound(u"Port"_s, portId.toString());
        update.applyTo(*port);
        return Utils::Result::success();
    });
}

void InMemoryDiagramStore::removePort(const Api::DiagramScope& scope,
                                      const BlockId& blockId,
                                      const PortId& portId,
                                      Api::StoreCompletion done)
{
    write(scope, u"removePort"_s, portId.toString(), std::move(done), [&](DiagramContent& content) {
        Block* block = findBlock(content.blocks, blockId);
        if (!block || !block->ownsPort(portId))
            return notFound(u"Port"_s, portId.toString());
        block->ports.removeIf([&portId](const Port& p) { return p.id == portId; });

        // Connectors fall back to the block itself.
        for (Connector& connector : content.connectors) {
            if (connector.source == blockId && connector.sourcePortId == portId)
                connector.sourcePortId.reset();
            if (connector.target == blockId && connector.targetPortId == portId)
                connector.targetPortId.reset();
        }
        return Utils::Result::success();
    });
}

// Documents -----------------------------------------------------------------

Utils::Result InMemoryDiagramStore::loadDocument(const Api::DiagramScope& scope, const QString& path)
{
    DiagramContent* content = contentFor(scope);
    UTILS_GUARD_OK(content, u"Unknown diagram."_s);

    QString error;
    const QJsonObject root = Utils::JsonFileUtils::readObject(path, &error);
    if (!error.isEmpty()) {
        qCWarning(storelog).noquote() << "Loading" << path << "failed:" << error;
        return Utils::Result::failure(error);
    }

    const Json::ArchitectureDocument document = Json::parseArchitectureDocument(root);
    content->blocks = document.blocks;
    content->connectors.clear();
    for (const Connector& connector : document.connectors) {
        const Utils::Result valid = validateEndpoints(*content, connector);
        if (!valid) {
            qCWarning(storelog).noquote() << "Skipping connector" << connector.id.toString() << ":" << valid.message();
            continue;
        }
        content->connectors.push_back(connector);
    }

    qCDebug(storelog) << "Loaded" << content->blocks.size() << "blocks and" << content->connectors.size()
                      << "connectors from" << path;
    notifyChanged(scope);
    return Utils::Result::success();
}

Utils::Result InMemoryDiagramStore::saveDocument(const Api::DiagramScope& scope, const QString& path) const
{
    const DiagramContent* content = contentFor(scope);
    UTILS_GUARD_OK(content, u"Unknown diagram."_s);

    Json::ArchitectureDocument document;
    document.blocks = content->blocks;
    document.connectors = content->connectors;
    document.lastModified = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);

    const Utils::Result result = Utils::JsonFileUtils::writeObjectAtomic(path, Json::architectureDocumentToJson(document));
    if (!result)
        qCWarning(storelog).noquote() << "Saving" << path << "failed:" << result.message();
    return result;
}

} // namespace ArchDiagram::Store
