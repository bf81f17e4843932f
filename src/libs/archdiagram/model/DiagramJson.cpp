// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/model/DiagramJson.hpp"

#include "archdiagram/DiagramConstants.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>

namespace ArchDiagram::Json {

namespace {

using namespace Qt::StringLiterals;

const QString kIdKey = u"id"_s;
const QString kNameKey = u"name"_s;
const QString kKindKey = u"kind"_s;
const QString kStereotypeKey = u"stereotype"_s;
const QString kDescriptionKey = u"description"_s;
const QString kPositionXKey = u"positionX"_s;
const QString kPositionYKey = u"positionY"_s;
const QString kSizeWidthKey = u"sizeWidth"_s;
const QString kSizeHeightKey = u"sizeHeight"_s;
const QString kPositionKey = u"position"_s;
const QString kSizeKey = u"size"_s;
const QString kPortsKey = u"ports"_s;
const QString kDocumentIdsKey = u"documentIds"_s;
const QString kBackgroundColorKey = u"backgroundColor"_s;
const QString kBorderColorKey = u"borderColor"_s;
const QString kBorderWidthKey = u"borderWidth"_s;
const QString kBorderStyleKey = u"borderStyle"_s;
const QString kTextColorKey = u"textColor"_s;
const QString kFontSizeKey = u"fontSize"_s;
const QString kFontWeightKey = u"fontWeight"_s;
const QString kBorderRadiusKey = u"borderRadius"_s;

const QString kDirectionKey = u"direction"_s;
const QString kEdgeKey = u"edge"_s;
const QString kOffsetKey = u"offset"_s;
const QString kShapeKey = u"shape"_s;

const QString kSourceKey = u"source"_s;
const QString kTargetKey = u"target"_s;
const QString kSourcePortKey = u"sourcePortId"_s;
const QString kTargetPortKey = u"targetPortId"_s;
const QString kLabelKey = u"label"_s;
const QString kLineStyleKey = u"lineStyle"_s;
const QString kLinePatternKey = u"linePattern"_s;
const QString kMarkerStartKey = u"markerStart"_s;
const QString kMarkerEndKey = u"markerEnd"_s;
const QString kColorKey = u"color"_s;
const QString kStrokeWidthKey = u"strokeWidth"_s;

const QString kViewKey = u"view"_s;

const QString kBlocksKey = u"blocks"_s;
const QString kConnectorsKey = u"connectors"_s;
const QString kLastModifiedKey = u"lastModified"_s;
const QString kComponentsKey = u"components"_s;
const QString kConnectionsKey = u"connections"_s;

void setError(QString* error, const QString& message)
{
    if (error)
        *error = message;
}

std::optional<QString> optionalString(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (!value.isString())
        return std::nullopt;
    return value.toString();
}

std::optional<double> optionalDouble(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (!value.isDouble())
        return std::nullopt;
    return value.toDouble();
}

std::optional<QColor> optionalColor(const QJsonObject& obj, const QString& key)
{
    const auto text = optionalString(obj, key);
    if (!text)
        return std::nullopt;
    const QColor color = QColor::fromString(*text);
    if (!color.isValid())
        return std::nullopt;
    return color;
}

template <typename Enum, typename Parser>
std::optional<Enum> optionalEnum(const QJsonObject& obj, const QString& key, Parser parse)
{
    const auto text = optionalString(obj, key);
    if (!text)
        return std::nullopt;
    return parse(*text);
}

QString colorName(const QColor& color)
{
    return color.alpha() == 255 ? color.name(QColor::HexRgb) : color.name(QColor::HexArgb);
}

template <typename T, typename Fn>
void insertIf(QJsonObject& obj, const QString& key, const std::optional<T>& value, Fn convert)
{
    if (value.has_value())
        obj.insert(key, convert(*value));
}

void insertIf(QJsonObject& obj, const QString& key, const std::optional<QString>& value)
{
    if (value.has_value())
        obj.insert(key, *value);
}

void insertIf(QJsonObject& obj, const QString& key, const std::optional<double>& value)
{
    if (value.has_value())
        obj.insert(key, *value);
}

void insertIf(QJsonObject& obj, const QString& key, const std::optional<QColor>& value)
{
    if (value.has_value())
        obj.insert(key, colorName(*value));
}

template <typename Enum>
void insertEnumIf(QJsonObject& obj, const QString& key, const std::optional<Enum>& value)
{
    if (value.has_value())
        obj.insert(key, toString(*value));
}

QStringList stringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& entry : array) {
        if (entry.isString())
            out.push_back(entry.toString());
    }
    return out;
}

void writeBlockStyle(QJsonObject& obj, const BlockStyleOverrides& style)
{
    insertIf(obj, kBackgroundColorKey, style.background);
    insertIf(obj, kBorderColorKey, style.borderColor);
    insertIf(obj, kBorderWidthKey, style.borderWidth);
    insertEnumIf(obj, kBorderStyleKey, style.borderStyle);
    insertIf(obj, kTextColorKey, style.textColor);
    insertIf(obj, kFontSizeKey, style.fontSize);
    insertIf(obj, kFontWeightKey, style.fontWeight);
    insertIf(obj, kBorderRadiusKey, style.borderRadius);
}

BlockStyleOverrides readBlockStyle(const QJsonObject& obj)
{
    BlockStyleOverrides style;
    style.background = optionalColor(obj, kBackgroundColorKey);
    style.borderColor = optionalColor(obj, kBorderColorKey);
    style.borderWidth = optionalDouble(obj, kBorderWidthKey);
    style.borderStyle = optionalEnum<LinePattern>(obj, kBorderStyleKey, linePatternFromString);
    style.textColor = optionalColor(obj, kTextColorKey);
    style.fontSize = optionalDouble(obj, kFontSizeKey);
    style.fontWeight = optionalString(obj, kFontWeightKey);
    style.borderRadius = optionalDouble(obj, kBorderRadiusKey);
    return style;
}

void writePortStyle(QJsonObject& obj, const PortStyleOverrides& style)
{
    insertEnumIf(obj, kShapeKey, style.shape);
    insertIf(obj, kSizeKey, style.size);
    insertIf(obj, kBackgroundColorKey, style.background);
    insertIf(obj, kBorderColorKey, style.borderColor);
}

QJsonArray portsToArray(const QVector<Port>& ports)
{
    QJsonArray array;
    for (const Port& port : ports)
        array.push_back(portToRecord(port));
    return array;
}

QPointF readPosition(const QJsonObject& record)
{
    if (record.value(kPositionKey).isObject()) {
        const QJsonObject nested = record.value(kPositionKey).toObject();
        return QPointF(nested.value(u"x"_s).toDouble(), nested.value(u"y"_s).toDouble());
    }
    return QPointF(record.value(kPositionXKey).toDouble(), record.value(kPositionYKey).toDouble());
}

QSizeF readSize(const QJsonObject& record)
{
    QSizeF size(Constants::kDefaultBlockWidth, Constants::kDefaultBlockHeight);
    if (record.value(kSizeKey).isObject()) {
        const QJsonObject nested = record.value(kSizeKey).toObject();
        size.setWidth(nested.value(u"width"_s).toDouble(size.width()));
        size.setHeight(nested.value(u"height"_s).toDouble(size.height()));
        return size;
    }
    size.setWidth(record.value(kSizeWidthKey).toDouble(size.width()));
    size.setHeight(record.value(kSizeHeightKey).toDouble(size.height()));
    return size;
}

std::optional<PortId> optionalPortId(const QJsonObject& obj, const QString& key)
{
    const auto text = optionalString(obj, key);
    if (!text)
        return std::nullopt;
    auto id = PortId::fromString(*text);
    if (!id)
        return std::nullopt;
    return *id;
}

Block migrateLegacyComponent(const QJsonObject& component)
{
    const QString type = component.value(u"type"_s).toString();
    const bool external = type == u"external"_s;

    Block block;
    block.id = BlockId(component.value(kIdKey).toString());
    block.name = component.value(kNameKey).toString();
    block.kind = external ? BlockKind::External : BlockKind::Component;
    block.stereotype = external ? u"external"_s : u"block"_s;
    block.description = optionalString(component, kDescriptionKey);
    block.position = QPointF(component.value(u"x"_s).toDouble(120.0),
                             component.value(u"y"_s).toDouble(120.0));
    block.size = QSizeF(Constants::kDefaultBlockWidth, Constants::kDefaultBlockHeight);
    return block;
}

Connector migrateLegacyConnection(const QJsonObject& connection)
{
    const QString type = connection.value(u"type"_s).toString();

    Connector connector;
    connector.id = ConnectorId(connection.value(kIdKey).toString());
    connector.source = BlockId(connection.value(u"from"_s).toString());
    connector.target = BlockId(connection.value(u"to"_s).toString());
    connector.label = optionalString(connection, kLabelKey);
    if (type == u"dependency"_s)
        connector.kind = ConnectorKind::Dependency;
    else if (type == u"api"_s)
        connector.kind = ConnectorKind::Flow;
    else
        connector.kind = ConnectorKind::Association;
    return connector;
}

QString nowIso()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

} // namespace

QJsonObject portToRecord(const Port& port)
{
    QJsonObject obj;
    obj.insert(kIdKey, port.id.toString());
    obj.insert(kNameKey, port.name);
    obj.insert(kDirectionKey, toString(port.direction));
    insertEnumIf(obj, kEdgeKey, port.edge);
    insertIf(obj, kOffsetKey, port.offset);
    writePortStyle(obj, port.style);
    return obj;
}

std::optional<Port> portFromRecord(const QJsonObject& record, QString* error)
{
    const auto id = PortId::fromString(record.value(kIdKey).toString());
    if (!id) {
        setError(error, u"Port record has no id."_s);
        return std::nullopt;
    }

    Port port;
    port.id = *id;
    port.name = record.value(kNameKey).toString();
    port.direction = optionalEnum<PortDirection>(record, kDirectionKey, portDirectionFromString)
                         .value_or(PortDirection::In);
    port.edge = optionalEnum<PortEdge>(record, kEdgeKey, portEdgeFromString);
    port.offset = optionalDouble(record, kOffsetKey);
    port.style.shape = optionalEnum<PortShape>(record, kShapeKey, portShapeFromString);
    port.style.size = optionalDouble(record, kSizeKey);
    port.style.background = optionalColor(record, kBackgroundColorKey);
    port.style.borderColor = optionalColor(record, kBorderColorKey);
    return port;
}

QJsonObject blockToRecord(const Block& block)
{
    QJsonObject obj;
    obj.insert(kIdKey, block.id.toString());
    obj.insert(kNameKey, block.name);
    obj.insert(kKindKey, toString(block.kind));
    insertIf(obj, kStereotypeKey, block.stereotype);
    insertIf(obj, kDescriptionKey, block.description);
    obj.insert(kPositionXKey, block.position.x());
    obj.insert(kPositionYKey, block.position.y());
    obj.insert(kSizeWidthKey, block.size.width());
    obj.insert(kSizeHeightKey, block.size.height());
    obj.insert(kPortsKey, portsToArray(block.ports));
    obj.insert(kDocumentIdsKey, QJsonArray::fromStringList(block.documentRefs));
    writeBlockStyle(obj, block.style);
    return obj;
}

std::optional<Block> blockFromRecord(const QJsonObject& record, QString* error)
{
    const auto id = BlockId::fromString(record.value(kIdKey).toString());
    if (!id) {
        setError(error, u"Block record has no id."_s);
        return std::nullopt;
    }

    Block block;
    block.id = *id;
    block.name = record.value(kNameKey).toString();
    block.kind = optionalEnum<BlockKind>(record, kKindKey, blockKindFromString).value_or(BlockKind::Component);
    block.stereotype = optionalString(record, kStereotypeKey);
    block.description = optionalString(record, kDescriptionKey);
    block.position = readPosition(record);
    block.size = readSize(record);
    block.documentRefs = stringList(record.value(kDocumentIdsKey));
    block.style = readBlockStyle(record);

    const QJsonArray ports = record.value(kPortsKey).toArray();
    for (const QJsonValue& entry : ports) {
        QString portError;
        auto port = portFromRecord(entry.toObject(), &portError);
        if (!port) {
            setError(error, u"Block %1: %2"_s.arg(block.id.toString(), portError));
            return std::nullopt;
        }
        block.ports.push_back(std::move(*port));
    }
    return block;
}

QJsonObject connectorToRecord(const Connector& connector)
{
    QJsonObject obj;
    obj.insert(kIdKey, connector.id.toString());
    obj.insert(kSourceKey, connector.source.toString());
    obj.insert(kTargetKey, connector.target.toString());
    obj.insert(kKindKey, toString(connector.kind));
    insertIf(obj, kSourcePortKey, connector.sourcePortId,
             [](const PortId& id) { return id.toString(); });
    insertIf(obj, kTargetPortKey, connector.targetPortId,
             [](const PortId& id) { return id.toString(); });
    insertIf(obj, kLabelKey, connector.label);
    insertEnumIf(obj, kLineStyleKey, connector.lineStyle);
    insertEnumIf(obj, kLinePatternKey, connector.linePattern);
    insertEnumIf(obj, kMarkerStartKey, connector.markerStart);
    insertEnumIf(obj, kMarkerEndKey, connector.markerEnd);
    insertIf(obj, kColorKey, connector.color);
    insertIf(obj, kStrokeWidthKey, connector.strokeWidth);
    obj.insert(kDocumentIdsKey, QJsonArray::fromStringList(connector.documentRefs));
    return obj;
}

std::optional<Connector> connectorFromRecord(const QJsonObject& record, QString* error)
{
    const auto id = ConnectorId::fromString(record.value(kIdKey).toString());
    const auto source = BlockId::fromString(record.value(kSourceKey).toString());
    const auto target = BlockId::fromString(record.value(kTargetKey).toString());
    if (!id || !source || !target) {
        setError(error, u"Connector record needs id, source and target."_s);
        return std::nullopt;
    }

    Connector connector;
    connector.id = *id;
    connector.source = *source;
    connector.target = *target;
    connector.kind = optionalEnum<ConnectorKind>(record, kKindKey, connectorKindFromString)
                         .value_or(ConnectorKind::Association);
    connector.sourcePortId = optionalPortId(record, kSourcePortKey);
    connector.targetPortId = optionalPortId(record, kTargetPortKey);
    connector.label = optionalString(record, kLabelKey);
    connector.lineStyle = optionalEnum<LineStyle>(record, kLineStyleKey, lineStyleFromString);
    connector.linePattern = optionalEnum<LinePattern>(record, kLinePatternKey, linePatternFromString);
    connector.markerStart = optionalEnum<MarkerType>(record, kMarkerStartKey, markerTypeFromString);
    connector.markerEnd = optionalEnum<MarkerType>(record, kMarkerEndKey, markerTypeFromString);
    connector.color = optionalColor(record, kColorKey);
    connector.strokeWidth = optionalDouble(record, kStrokeWidthKey);
    connector.documentRefs = stringList(record.value(kDocumentIdsKey));
    return connector;
}

QJsonObject diagramToRecord(const Diagram& diagram)
{
    QJsonObject obj;
    obj.insert(kIdKey, diagram.id.toString());
    obj.insert(kNameKey, diagram.name);
    insertIf(obj, kDescriptionKey, diagram.description);
    obj.insert(kViewKey, toString(diagram.view));
    return obj;
}

std::optional<Diagram> diagramFromRecord(const QJsonObject& record, QString* error)
{
    const auto id = DiagramId::fromString(record.value(kIdKey).toString());
    if (!id) {
        setError(error, u"Diagram record has no id."_s);
        return std::nullopt;
    }

    Diagram diagram;
    diagram.id = *id;
    diagram.name = record.value(kNameKey).toString();
    diagram.description = optionalString(record, kDescriptionKey);
    diagram.view = optionalEnum<DiagramView>(record, kViewKey, diagramViewFromString)
                       .value_or(DiagramView::Block);
    return diagram;
}

QJsonObject blockUpdateToRecord(const BlockUpdate& update)
{
    QJsonObject obj;
    insertIf(obj, kNameKey, update.name);
    insertEnumIf(obj, kKindKey, update.kind);
    insertIf(obj, kStereotypeKey, update.stereotype);
    insertIf(obj, kDescriptionKey, update.description);
    if (update.position) {
        obj.insert(kPositionXKey, update.position->x());
        obj.insert(kPositionYKey, update.position->y());
    }
    if (update.size) {
        obj.insert(kSizeWidthKey, update.size->width());
        obj.insert(kSizeHeightKey, update.size->height());
    }
    insertIf(obj, kPortsKey, update.ports, portsToArray);
    insertIf(obj, kDocumentIdsKey, update.documentRefs,
             [](const QStringList& refs) { return QJsonArray::fromStringList(refs); });
    writeBlockStyle(obj, update.style);
    return obj;
}

QJsonObject portUpdateToRecord(const PortUpdate& update)
{
    QJsonObject obj;
    insertIf(obj, kNameKey, update.name);
    insertEnumIf(obj, kDirectionKey, update.direction);
    insertEnumIf(obj, kEdgeKey, update.edge);
    insertIf(obj, kOffsetKey, update.offset);
    writePortStyle(obj, update.style);
    return obj;
}

QJsonObject connectorUpdateToRecord(const ConnectorUpdate& update)
{
    QJsonObject obj;
    insertEnumIf(obj, kKindKey, update.kind);
    insertIf(obj, kLabelKey, update.label);
    insertIf(obj, kSourcePortKey, update.sourcePortId,
             [](const PortId& id) { return id.toString(); });
    insertIf(obj, kTargetPortKey, update.targetPortId,
             [](const PortId& id) { return id.toString(); });
    insertEnumIf(obj, kLineStyleKey, update.lineStyle);
    insertEnumIf(obj, kLinePatternKey, update.linePattern);
    insertEnumIf(obj, kMarkerStartKey, update.markerStart);
    insertEnumIf(obj, kMarkerEndKey, update.markerEnd);
    insertIf(obj, kColorKey, update.color);
    insertIf(obj, kStrokeWidthKey, update.strokeWidth);
    insertIf(obj, kDocumentIdsKey, update.documentRefs,
             [](const QStringList& refs) { return QJsonArray::fromStringList(refs); });
    return obj;
}

ArchitectureDocument parseArchitectureDocument(const QJsonObject& root)
{
    ArchitectureDocument document;
    document.lastModified = root.value(kLastModifiedKey).toString();
    if (document.lastModified.isEmpty())
        document.lastModified = nowIso();

    const bool legacy = root.value(kComponentsKey).isArray() && !root.value(kBlocksKey).isArray();
    if (legacy) {
        for (const QJsonValue& entry : root.value(kComponentsKey).toArray())
            document.blocks.push_back(migrateLegacyComponent(entry.toObject()));
        for (const QJsonValue& entry : root.value(kConnectionsKey).toArray())
            document.connectors.push_back(migrateLegacyConnection(entry.toObject()));
        return document;
    }

    if (!root.value(kBlocksKey).isArray() || !root.value(kConnectorsKey).isArray())
        return document;

    for (const QJsonValue& entry : root.value(kBlocksKey).toArray()) {
        if (auto block = blockFromRecord(entry.toObject()))
            document.blocks.push_back(std::move(*block));
    }
    for (const QJsonValue& entry : root.value(kConnectorsKey).toArray()) {
        if (auto connector = connectorFromRecord(entry.toObject()))
            document.connectors.push_back(std::move(*connector));
    }
    return document;
}

QJsonObject architectureDocumentToJson(const ArchitectureDocument& document)
{
    QJsonArray blocks;
    for (const Block& block : document.blocks)
        blocks.push_back(blockToRecord(block));

    QJsonArray connectors;
    for (const Connector& connector : document.connectors)
        connectors.push_back(connectorToRecord(connector));

    QJsonObject root;
    root.insert(kBlocksKey, blocks);
    root.insert(kConnectorsKey, connectors);
    root.insert(kLastModifiedKey, document.lastModified.isEmpty() ? nowIso() : document.lastModified);
    return root;
}

} // namespace ArchDiagram::Json
