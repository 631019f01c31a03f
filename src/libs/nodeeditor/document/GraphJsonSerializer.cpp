// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/document/GraphJsonSerializer.hpp"

#include "nodeeditor/ViewportTransform.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>
#include <QtCore/QStringList>

#include <cmath>
#include <optional>

namespace NodeEditor {

namespace {

using namespace Qt::StringLiterals;

QJsonObject socketObject(const SocketRecord& socket)
{
    QJsonObject obj;
    obj.insert(u"id"_s, static_cast<qint64>(socket.id.value()));
    obj.insert(u"type"_s, socket.typeTag);
    if (!socket.label.isEmpty())
        obj.insert(u"label"_s, socket.label);
    return obj;
}

std::optional<quint64> parseId(const QJsonValue& value)
{
    if (!value.isDouble())
        return std::nullopt;
    const double v = value.toDouble();
    if (v < 1.0 || std::floor(v) != v)
        return std::nullopt;
    return static_cast<quint64>(v);
}

bool parseNumber(const QJsonObject& object, const QString& key, double& out)
{
    const QJsonValue v = object.value(key);
    if (!v.isDouble())
        return false;
    out = v.toDouble();
    return std::isfinite(out);
}

void parseSockets(const QJsonValue& value,
                  SocketDirection direction,
                  const QString& where,
                  std::vector<SocketRecord>& out,
                  QStringList& errors)
{
    if (value.isUndefined())
        return;
    if (!value.isArray()) {
        errors.push_back(u"%1 must be an array."_s.arg(where));
        return;
    }

    const QJsonArray list = value.toArray();
    for (int i = 0; i < list.size(); ++i) {
        const QJsonObject obj = list.at(i).toObject();
        const auto id = parseId(obj.value(u"id"_s));
        if (!id) {
            errors.push_back(u"%1[%2]: socket id is missing or invalid."_s.arg(where).arg(i));
            continue;
        }
        const QJsonValue type = obj.value(u"type"_s);
        if (!type.isString()) {
            errors.push_back(u"%1[%2]: socket type must be a string."_s.arg(where).arg(i));
            continue;
        }
        out.push_back(SocketRecord{SocketId(*id), direction, type.toString(), obj.value(u"label"_s).toString()});
    }
}

} // namespace

QJsonObject GraphJsonSerializer::serialize(const GraphSnapshot& snapshot, const ViewportTransform* view)
{
    QJsonObject root;
    root.insert(u"schemaVersion"_s, kSchemaVersion);

    if (view) {
        QJsonObject viewObject;
        viewObject.insert(u"zoom"_s, view->zoom());
        viewObject.insert(u"panX"_s, view->pan().x());
        viewObject.insert(u"panY"_s, view->pan().y());
        root.insert(u"view"_s, viewObject);
    }

    QJsonArray nodes;
    for (const NodeRecord& node : snapshot.nodes) {
        QJsonObject obj;
        obj.insert(u"id"_s, static_cast<qint64>(node.id.value()));
        obj.insert(u"x"_s, node.position.x());
        obj.insert(u"y"_s, node.position.y());
        obj.insert(u"width"_s, node.size.width());
        obj.insert(u"height"_s, node.size.height());
        obj.insert(u"title"_s, node.payload.title);
        obj.insert(u"typeTag"_s, node.payload.typeTag);
        obj.insert(u"category"_s, node.payload.category);
        if (!node.payload.properties.isEmpty())
            obj.insert(u"properties"_s, QJsonObject::fromVariantMap(node.payload.properties));

        QJsonArray inputs;
        for (const SocketRecord& s : node.inputs)
            inputs.append(socketObject(s));
        QJsonArray outputs;
        for (const SocketRecord& s : node.outputs)
            outputs.append(socketObject(s));
        obj.insert(u"inputs"_s, inputs);
        obj.insert(u"outputs"_s, outputs);
        nodes.append(obj);
    }
    root.insert(u"nodes"_s, nodes);

    QJsonArray connections;
    for (const ConnectionRecord& conn : snapshot.connections) {
        QJsonObject obj;
        obj.insert(u"id"_s, static_cast<qint64>(conn.id.value()));
        obj.insert(u"source"_s, static_cast<qint64>(conn.source.value()));
        obj.insert(u"target"_s, static_cast<qint64>(conn.target.value()));
        if (conn.controlOffsetHint)
            obj.insert(u"controlOffset"_s, *conn.controlOffsetHint);
        connections.append(obj);
    }
    root.insert(u"connections"_s, connections);

    return root;
}

GraphResult<GraphSnapshot> GraphJsonSerializer::deserialize(const QJsonObject& json, ViewportTransform* view)
{
    QStringList errors;

    const QJsonValue versionValue = json.value(u"schemaVersion"_s);
    if (!versionValue.isDouble())
        errors.push_back(u"schemaVersion is missing."_s);
    else if (versionValue.toInt() != kSchemaVersion)
        errors.push_back(u"Unsupported schemaVersion %1."_s.arg(versionValue.toInt()));

    const QJsonValue nodesValue = json.value(u"nodes"_s);
    if (!nodesValue.isUndefined() && !nodesValue.isArray())
        errors.push_back(u"nodes must be an array."_s);
    const QJsonValue connectionsValue = json.value(u"connections"_s);
    if (!connectionsValue.isUndefined() && !connectionsValue.isArray())
        errors.push_back(u"connections must be an array."_s);

    std::optional<double> zoom;
    std::optional<QPointF> pan;
    const QJsonValue viewValue = json.value(u"view"_s);
    if (viewValue.isObject()) {
        const QJsonObject viewObject = viewValue.toObject();
        double z = 0.0;
        if (parseNumber(viewObject, u"zoom"_s, z) && z > 0.0)
            zoom = z;
        else
            errors.push_back(u"view.zoom must be a positive number."_s);
        double px = 0.0;
        double py = 0.0;
        if (parseNumber(viewObject, u"panX"_s, px) && parseNumber(viewObject, u"panY"_s, py))
            pan = QPointF(px, py);
        else
            errors.push_back(u"view.panX and view.panY must be numeric."_s);
    } else if (!viewValue.isUndefined()) {
        errors.push_back(u"view must be an object."_s);
    }

    if (!errors.isEmpty())
        return graphError(GraphErrorCode::MalformedGraph, errors.join(u'\n'));

    GraphSnapshot snapshot;

    const QJsonArray nodes = nodesValue.toArray();
    for (int index = 0; index < nodes.size(); ++index) {
        if (!nodes.at(index).isObject()) {
            errors.push_back(u"nodes[%1]: must be an object."_s.arg(index));
            continue;
        }
        const QJsonObject obj = nodes.at(index).toObject();
        const auto id = parseId(obj.value(u"id"_s));
        if (!id) {
            errors.push_back(u"nodes[%1]: id is missing or invalid."_s.arg(index));
            continue;
        }

        NodeRecord node;
        node.id = NodeId(*id);
        double x = 0.0;
        double y = 0.0;
        double w = 0.0;
        double h = 0.0;
        if (!parseNumber(obj, u"x"_s, x) || !parseNumber(obj, u"y"_s, y)) {
            errors.push_back(u"nodes[%1]: position must include numeric x/y."_s.arg(index));
            continue;
        }
        if (!parseNumber(obj, u"width"_s, w) || !parseNumber(obj, u"height"_s, h) || w <= 0.0 || h <= 0.0) {
            errors.push_back(u"nodes[%1]: size must be positive."_s.arg(index));
            continue;
        }
        node.position = QPointF(x, y);
        node.size = QSizeF(w, h);

        node.payload.title = obj.value(u"title"_s).toString();
        node.payload.typeTag = obj.value(u"typeTag"_s).toString();
        node.payload.category = obj.value(u"category"_s).toString(node.payload.category);
        const QJsonValue props = obj.value(u"properties"_s);
        if (props.isObject())
            node.payload.properties = props.toObject().toVariantMap();
        else if (!props.isUndefined())
            errors.push_back(u"nodes[%1]: properties must be an object."_s.arg(index));

        parseSockets(obj.value(u"inputs"_s), SocketDirection::Input,
                     u"nodes[%1].inputs"_s.arg(index), node.inputs, errors);
        parseSockets(obj.value(u"outputs"_s), SocketDirection::Output,
                     u"nodes[%1].outputs"_s.arg(index), node.outputs, errors);

        snapshot.nodes.push_back(std::move(node));
    }

    const QJsonArray connections = connectionsValue.toArray();
    for (int index = 0; index < connections.size(); ++index) {
        const QJsonObject obj = connections.at(index).toObject();
        const auto id = parseId(obj.value(u"id"_s));
        const auto source = parseId(obj.value(u"source"_s));
        const auto target = parseId(obj.value(u"target"_s));
        if (!id || !source || !target) {
            errors.push_back(u"connections[%1]: id, source and target must be positive integers."_s.arg(index));
            continue;
        }

        ConnectionRecord conn{ConnectionId(*id), SocketId(*source), SocketId(*target), std::nullopt};
        const QJsonValue offset = obj.value(u"controlOffset"_s);
        if (offset.isDouble())
            conn.controlOffsetHint = offset.toDouble();
        else if (!offset.isUndefined())
            errors.push_back(u"connections[%1]: controlOffset must be numeric."_s.arg(index));
        snapshot.connections.push_back(conn);
    }

    if (!errors.isEmpty())
        return graphError(GraphErrorCode::MalformedGraph, errors.join(u'\n'));

    if (view) {
        if (zoom)
            view->setZoom(*zoom);
        if (pan)
            view->setPan(*pan);
    }
    return snapshot;
}

QByteArray GraphJsonSerializer::toBytes(const GraphSnapshot& snapshot, const ViewportTransform* view)
{
    return QJsonDocument(serialize(snapshot, view)).toJson(QJsonDocument::Indented);
}

GraphResult<GraphSnapshot> GraphJsonSerializer::fromBytes(const QByteArray& bytes, ViewportTransform* view)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return graphError(GraphErrorCode::MalformedGraph, parseError.errorString());
    if (!doc.isObject())
        return graphError(GraphErrorCode::MalformedGraph, u"Document root must be an object."_s);
    return deserialize(doc.object(), view);
}

} // namespace NodeEditor
