// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/GraphStore.hpp"

#include "nodeeditor/ConnectionGeometry.hpp"
#include "nodeeditor/NodeEditorConfig.hpp"

#include <QtCore/QDebug>

#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(nodeeditorlog, "panelkit.nodeeditor")

namespace NodeEditor {

namespace {

using namespace Qt::StringLiterals;

QString idText(quint64 id)
{
    return QString::number(id);
}

struct SocketInfo final {
    NodeId node{};
    SocketDirection direction{SocketDirection::Input};
};

} // namespace

GraphStore::GraphStore(const GraphPolicy& policy)
    : m_policy(policy)
{}

void GraphStore::setPolicy(const GraphPolicy& policy)
{
    const bool layoutChanged = policy.headerHeight != m_policy.headerHeight
                               || policy.socketSpacing != m_policy.socketSpacing;
    m_policy = policy;
    if (!layoutChanged)
        return;

    for (auto& [id, node] : m_nodes)
        relayoutSockets(node);
    notify(GraphChange::Kind::GraphReset);
}

void GraphStore::applyConfig(const NodeEditorConfig& config)
{
    GraphPolicy p;
    p.typeChecking = config.behavior.connectionTypeChecking;
    p.allowSameNode = config.behavior.allowSameNodeConnections;
    p.rejectCycles = config.behavior.rejectCycles;
    p.defaultNodeSize = QSizeF(config.layout.defaultNodeWidth, config.layout.defaultNodeHeight);
    p.headerHeight = config.layout.nodeHeaderHeight;
    p.socketSpacing = config.layout.socketSpacing;
    setPolicy(p);
}

NodeId GraphStore::addNode(const QPointF& position, NodePayload payload, std::optional<QSizeF> size)
{
    Node node;
    node.id = NodeId(m_nextNodeId++);
    node.position = position;
    node.size = size.value_or(m_policy.defaultNodeSize);
    if (node.size.isEmpty())
        node.size = m_policy.defaultNodeSize;
    node.payload = std::move(payload);

    const NodeId id = node.id;
    m_nodes.emplace(id, std::move(node));
    notify(GraphChange::Kind::NodeAdded, id);
    return id;
}

GraphResult<void> GraphStore::removeNode(NodeId id)
{
    auto it = m_nodes.find(id);
    if (it == m_nodes.end())
        return graphError(GraphErrorCode::NotFound, u"node %1 does not exist"_s.arg(idText(id.value())));

    std::vector<ConnectionId> doomed;
    for (const auto& [cid, conn] : m_connections) {
        const Socket& src = m_sockets.at(conn.source);
        const Socket& dst = m_sockets.at(conn.target);
        if (src.node == id || dst.node == id)
            doomed.push_back(cid);
    }

    for (ConnectionId cid : doomed)
        eraseConnection(cid);

    for (SocketId sid : it->second.inputs)
        m_sockets.erase(sid);
    for (SocketId sid : it->second.outputs)
        m_sockets.erase(sid);
    m_nodes.erase(it);

    for (ConnectionId cid : doomed)
        notify(GraphChange::Kind::ConnectionRemoved, {}, {}, cid);
    notify(GraphChange::Kind::NodeRemoved, id);
    return {};
}

GraphResult<void> GraphStore::moveNode(NodeId id, const QPointF& position)
{
    auto it = m_nodes.find(id);
    if (it == m_nodes.end())
        return graphError(GraphErrorCode::NotFound, u"node %1 does not exist"_s.arg(idText(id.value())));

    if (it->second.position == position)
        return {};
    it->second.position = position;
    notify(GraphChange::Kind::NodeMoved, id);
    return {};
}

GraphResult<void> GraphStore::resizeNode(NodeId id, const QSizeF& size)
{
    auto it = m_nodes.find(id);
    if (it == m_nodes.end())
        return graphError(GraphErrorCode::NotFound, u"node %1 does not exist"_s.arg(idText(id.value())));
    if (size.isEmpty())
        return graphError(GraphErrorCode::MalformedGraph, u"node size must be positive"_s);

    it->second.size = size;
    relayoutSockets(it->second);
    notify(GraphChange::Kind::NodeChanged, id);
    return {};
}

GraphResult<void> GraphStore::setPayload(NodeId id, NodePayload payload)
{
    auto it = m_nodes.find(id);
    if (it == m_nodes.end())
        return graphError(GraphErrorCode::NotFound, u"node %1 does not exist"_s.arg(idText(id.value())));

    it->second.payload = std::move(payload);
    notify(GraphChange::Kind::NodeChanged, id);
    return {};
}

GraphResult<SocketId> GraphStore::addSocket(NodeId nodeId,
                                            SocketDirection direction,
                                            const QString& typeTag,
                                            const QString& label)
{
    auto it = m_nodes.find(nodeId);
    if (it == m_nodes.end())
        return graphError(GraphErrorCode::NotFound, u"node %1 does not exist"_s.arg(idText(nodeId.value())));

    Socket socket;
    socket.id = SocketId(m_nextSocketId++);
    socket.node = nodeId;
    socket.direction = direction;
    socket.typeTag = typeTag;
    socket.label = label;

    const SocketId sid = socket.id;
    m_sockets.emplace(sid, std::move(socket));

    Node& node = it->second;
    if (direction == SocketDirection::Input)
        node.inputs.push_back(sid);
    else
        node.outputs.push_back(sid);
    relayoutSockets(node);

    notify(GraphChange::Kind::SocketAdded, nodeId, sid);
    return sid;
}

GraphResult<void> GraphStore::removeSocket(SocketId id)
{
    auto it = m_sockets.find(id);
    if (it == m_sockets.end())
        return graphError(GraphErrorCode::NotFound, u"socket %1 does not exist"_s.arg(idText(id.value())));

    const NodeId nodeId = it->second.node;
    const std::vector<ConnectionId> doomed = connectionsOf(id);
    for (ConnectionId cid : doomed)
        eraseConnection(cid);

    Node& node = m_nodes.at(nodeId);
    auto& list = it->second.isInput() ? node.inputs : node.outputs;
    list.erase(std::remove(list.begin(), list.end(), id), list.end());
    m_sockets.erase(it);
    relayoutSockets(node);

    for (ConnectionId cid : doomed)
        notify(GraphChange::Kind::ConnectionRemoved, {}, {}, cid);
    notify(GraphChange::Kind::SocketRemoved, nodeId, id);
    return {};
}

GraphResult<void> GraphStore::canConnect(SocketId output, SocketId input) const
{
    const Socket* out = socket(output);
    const Socket* in = socket(input);
    if (!out || !in)
        return graphError(GraphErrorCode::NotFound, u"socket does not exist"_s);

    if (!out->isOutput() || !in->isInput())
        return graphError(GraphErrorCode::InvalidDirection,
                          u"connection must run from an output to an input"_s);

    if (m_policy.typeChecking && !m_typeRules.isCompatible(out->typeTag, in->typeTag))
        return graphError(GraphErrorCode::TypeMismatch,
                          u"cannot connect %1 to %2"_s.arg(out->typeTag, in->typeTag));

    if (m_incoming.contains(input))
        return graphError(GraphErrorCode::SlotOccupied,
                          u"input %1 already has a connection"_s.arg(idText(input.value())));

    if (!m_policy.allowSameNode && out->node == in->node)
        return graphError(GraphErrorCode::SameNode, u"cannot connect a node to itself"_s);

    if (m_policy.rejectCycles && wouldCreateCycle(output, input))
        return graphError(GraphErrorCode::CycleDetected, u"connection would create a cycle"_s);

    return {};
}

GraphResult<ConnectionId> GraphStore::connect(SocketId output, SocketId input)
{
    if (auto ok = canConnect(output, input); !ok)
        return std::unexpected(ok.error());

    Connection conn;
    conn.id = ConnectionId(m_nextConnectionId++);
    conn.source = output;
    conn.target = input;

    const ConnectionId cid = conn.id;
    m_connections.emplace(cid, std::move(conn));
    m_incoming.insert(input, cid);

    notify(GraphChange::Kind::ConnectionAdded, {}, {}, cid);
    return cid;
}

GraphResult<void> GraphStore::disconnect(ConnectionId id)
{
    if (!m_connections.contains(id))
        return graphError(GraphErrorCode::NotFound, u"connection %1 does not exist"_s.arg(idText(id.value())));

    eraseConnection(id);
    notify(GraphChange::Kind::ConnectionRemoved, {}, {}, id);
    return {};
}

GraphResult<void> GraphStore::setControlOffsetHint(ConnectionId id, std::optional<double> hint)
{
    auto it = m_connections.find(id);
    if (it == m_connections.end())
        return graphError(GraphErrorCode::NotFound, u"connection %1 does not exist"_s.arg(idText(id.value())));

    it->second.controlOffsetHint = hint;
    return {};
}

bool GraphStore::wouldCreateCycle(SocketId output, SocketId input) const
{
    const Socket* out = socket(output);
    const Socket* in = socket(input);
    if (!out || !in)
        return false;
    if (out->node == in->node)
        return true;

    QHash<NodeId, std::vector<NodeId>> downstream;
    for (const auto& [cid, conn] : m_connections)
        downstream[m_sockets.at(conn.source).node].push_back(m_sockets.at(conn.target).node);

    // The new edge closes a loop when its source is reachable from its target.
    QSet<NodeId> visited;
    std::vector<NodeId> stack{in->node};
    while (!stack.empty()) {
        const NodeId current = stack.back();
        stack.pop_back();
        if (current == out->node)
            return true;
        if (visited.contains(current))
            continue;
        visited.insert(current);

        const auto it = downstream.constFind(current);
        if (it == downstream.constEnd())
            continue;
        for (NodeId next : it.value()) {
            if (!visited.contains(next))
                stack.push_back(next);
        }
    }
    return false;
}

const Node* GraphStore::node(NodeId id) const
{
    const auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : &it->second;
}

const Socket* GraphStore::socket(SocketId id) const
{
    const auto it = m_sockets.find(id);
    return it == m_sockets.end() ? nullptr : &it->second;
}

const Connection* GraphStore::connection(ConnectionId id) const
{
    const auto it = m_connections.find(id);
    return it == m_connections.end() ? nullptr : &it->second;
}

std::vector<NodeId> GraphStore::nodeIds() const
{
    std::vector<NodeId> out;
    out.reserve(m_nodes.size());
    for (const auto& [id, node] : m_nodes)
        out.push_back(id);
    return out;
}

std::vector<ConnectionId> GraphStore::connectionIds() const
{
    std::vector<ConnectionId> out;
    out.reserve(m_connections.size());
    for (const auto& [id, conn] : m_connections)
        out.push_back(id);
    return out;
}

std::optional<ConnectionId> GraphStore::incomingConnection(SocketId input) const
{
    const auto it = m_incoming.constFind(input);
    if (it == m_incoming.constEnd())
        return std::nullopt;
    return it.value();
}

std::vector<ConnectionId> GraphStore::connectionsOf(SocketId socketId) const
{
    std::vector<ConnectionId> out;
    for (const auto& [id, conn] : m_connections) {
        if (conn.source == socketId || conn.target == socketId)
            out.push_back(id);
    }
    return out;
}

bool GraphStore::isOccupied(SocketId socketId) const
{
    const Socket* s = socket(socketId);
    if (!s)
        return false;
    if (s->isInput())
        return m_incoming.contains(socketId);
    return std::any_of(m_connections.begin(), m_connections.end(),
                       [socketId](const auto& entry) { return entry.second.source == socketId; });
}

std::optional<QPointF> GraphStore::socketCanvasPos(SocketId socketId) const
{
    const Socket* s = socket(socketId);
    if (!s)
        return std::nullopt;
    const Node* owner = node(s->node);
    if (!owner)
        return std::nullopt;
    return owner->position + s->offset;
}

std::optional<SocketId> GraphStore::findSocketAt(const QPointF& canvasPos, double hitRadius) const
{
    // Nodes and sockets iterate in id order, so the first strict improvement
    // wins ties with the lowest node id and then the lowest socket id.
    std::optional<SocketId> best;
    double bestDist = hitRadius;
    for (const auto& [nid, n] : m_nodes) {
        auto scan = [&](const std::vector<SocketId>& ids) {
            for (SocketId sid : ids) {
                const Socket& s = m_sockets.at(sid);
                const double d = Geometry::distance(canvasPos, n.position + s.offset);
                if (d > hitRadius)
                    continue;
                if (!best || d < bestDist
                    || (d == bestDist && m_sockets.at(*best).node == nid && sid < *best)) {
                    best = sid;
                    bestDist = d;
                }
            }
        };
        scan(n.inputs);
        scan(n.outputs);
    }
    return best;
}

std::optional<NodeId> GraphStore::nodeAt(const QPointF& canvasPos) const
{
    for (auto it = m_nodes.rbegin(); it != m_nodes.rend(); ++it) {
        if (it->second.contains(canvasPos))
            return it->first;
    }
    return std::nullopt;
}

QSet<NodeId> GraphStore::nodesInRect(const QRectF& canvasRect) const
{
    QSet<NodeId> out;
    const QRectF r = canvasRect.normalized();
    for (const auto& [id, n] : m_nodes) {
        if (r.intersects(n.bounds()))
            out.insert(id);
    }
    return out;
}

QRectF GraphStore::nodesBounds() const
{
    QRectF out;
    for (const auto& [id, n] : m_nodes)
        out = out.isNull() ? n.bounds() : out.united(n.bounds());
    return out;
}

GraphSnapshot GraphStore::exportGraph() const
{
    QSet<NodeId> all;
    for (const auto& [id, n] : m_nodes)
        all.insert(id);
    return extract(all);
}

GraphResult<void> GraphStore::importGraph(const GraphSnapshot& snapshot)
{
    if (auto ok = validateFragment(snapshot, false); !ok) {
        qCWarning(nodeeditorlog) << "GraphStore: rejected import:" << ok.error().toString();
        return ok;
    }

    m_nodes.clear();
    m_sockets.clear();
    m_connections.clear();
    m_incoming.clear();
    insertFragment(snapshot);

    qCDebug(nodeeditorlog) << "GraphStore: imported" << m_nodes.size() << "nodes and"
                           << m_connections.size() << "connections";
    notify(GraphChange::Kind::GraphReset);
    return {};
}

GraphSnapshot GraphStore::extract(const QSet<NodeId>& nodes) const
{
    GraphSnapshot out;

    auto record = [this](SocketId sid) {
        const Socket& s = m_sockets.at(sid);
        return SocketRecord{s.id, s.direction, s.typeTag, s.label};
    };

    for (const auto& [id, n] : m_nodes) {
        if (!nodes.contains(id))
            continue;
        NodeRecord rec;
        rec.id = id;
        rec.position = n.position;
        rec.size = n.size;
        rec.payload = n.payload;
        for (SocketId sid : n.inputs)
            rec.inputs.push_back(record(sid));
        for (SocketId sid : n.outputs)
            rec.outputs.push_back(record(sid));
        out.nodes.push_back(std::move(rec));
    }

    for (const auto& [id, conn] : m_connections) {
        if (nodes.contains(m_sockets.at(conn.source).node) || nodes.contains(m_sockets.at(conn.target).node))
            out.connections.push_back(ConnectionRecord{id, conn.source, conn.target, conn.controlOffsetHint});
    }
    return out;
}

GraphSnapshot GraphStore::extractConnections(const QSet<ConnectionId>& connections) const
{
    GraphSnapshot out;
    for (const auto& [id, conn] : m_connections) {
        if (connections.contains(id))
            out.connections.push_back(ConnectionRecord{id, conn.source, conn.target, conn.controlOffsetHint});
    }
    return out;
}

GraphResult<void> GraphStore::restore(const GraphSnapshot& fragment)
{
    if (auto ok = validateFragment(fragment, true); !ok)
        return ok;

    insertFragment(fragment);

    for (const auto& rec : fragment.nodes)
        notify(GraphChange::Kind::NodeAdded, rec.id);
    for (const auto& rec : fragment.connections)
        notify(GraphChange::Kind::ConnectionAdded, {}, {}, rec.id);
    return {};
}

void GraphStore::clear()
{
    m_nodes.clear();
    m_sockets.clear();
    m_connections.clear();
    m_incoming.clear();
    notify(GraphChange::Kind::GraphReset);
}

GraphStore::ListenerId GraphStore::addListener(Listener listener)
{
    const ListenerId id = m_nextListenerId++;
    m_listeners.push_back(ListenerEntry{id, std::move(listener)});
    return id;
}

void GraphStore::removeListener(ListenerId id)
{
    std::erase_if(m_listeners, [id](const ListenerEntry& e) { return e.id == id; });
}

GraphResult<void> GraphStore::validateFragment(const GraphSnapshot& fragment, bool againstCurrent) const
{
    auto malformed = [](const QString& msg) { return graphError(GraphErrorCode::MalformedGraph, msg); };

    QSet<NodeId> nodeIds;
    QHash<SocketId, SocketInfo> sockets;
    QSet<ConnectionId> connIds;
    QSet<SocketId> filledInputs;

    for (const NodeRecord& rec : fragment.nodes) {
        if (!rec.id.isValid())
            return malformed(u"node with invalid id"_s);
        if (nodeIds.contains(rec.id) || (againstCurrent && m_nodes.contains(rec.id)))
            return malformed(u"duplicate node id %1"_s.arg(idText(rec.id.value())));
        if (rec.size.isEmpty())
            return malformed(u"node %1 has no area"_s.arg(idText(rec.id.value())));
        nodeIds.insert(rec.id);

        auto addSockets = [&](const std::vector<SocketRecord>& list, SocketDirection dir) -> GraphResult<void> {
            for (const SocketRecord& s : list) {
                if (!s.id.isValid())
                    return malformed(u"socket with invalid id"_s);
                if (s.direction != dir)
                    return malformed(u"socket %1 listed under the wrong direction"_s.arg(idText(s.id.value())));
                if (sockets.contains(s.id) || (againstCurrent && m_sockets.contains(s.id)))
                    return malformed(u"duplicate socket id %1"_s.arg(idText(s.id.value())));
                sockets.insert(s.id, SocketInfo{rec.id, dir});
            }
            return {};
        };
        if (auto ok = addSockets(rec.inputs, SocketDirection::Input); !ok)
            return ok;
        if (auto ok = addSockets(rec.outputs, SocketDirection::Output); !ok)
            return ok;
    }

    auto lookup = [&](SocketId sid) -> std::optional<SocketInfo> {
        if (const auto it = sockets.constFind(sid); it != sockets.constEnd())
            return it.value();
        if (againstCurrent) {
            if (const Socket* s = socket(sid))
                return SocketInfo{s->node, s->direction};
        }
        return std::nullopt;
    };

    for (const ConnectionRecord& rec : fragment.connections) {
        if (!rec.id.isValid())
            return malformed(u"connection with invalid id"_s);
        if (connIds.contains(rec.id) || (againstCurrent && m_connections.contains(rec.id)))
            return malformed(u"duplicate connection id %1"_s.arg(idText(rec.id.value())));
        connIds.insert(rec.id);

        const auto src = lookup(rec.source);
        const auto dst = lookup(rec.target);
        if (!src || !dst)
            return malformed(u"connection %1 references a missing socket"_s.arg(idText(rec.id.value())));
        if (src->direction != SocketDirection::Output || dst->direction != SocketDirection::Input)
            return malformed(u"connection %1 is not output to input"_s.arg(idText(rec.id.value())));
        if (filledInputs.contains(rec.target) || (againstCurrent && m_incoming.contains(rec.target)))
            return malformed(u"input %1 has more than one connection"_s.arg(idText(rec.target.value())));
        filledInputs.insert(rec.target);
    }

    return {};
}

void GraphStore::insertFragment(const GraphSnapshot& fragment)
{
    for (const NodeRecord& rec : fragment.nodes) {
        Node node;
        node.id = rec.id;
        node.position = rec.position;
        node.size = rec.size;
        node.payload = rec.payload;

        auto addSockets = [&](const std::vector<SocketRecord>& list, std::vector<SocketId>& ids) {
            for (const SocketRecord& s : list) {
                m_sockets.emplace(s.id, Socket{s.id, rec.id, s.direction, s.typeTag, s.label, QPointF()});
                ids.push_back(s.id);
                m_nextSocketId = std::max(m_nextSocketId, s.id.value() + 1);
            }
        };
        addSockets(rec.inputs, node.inputs);
        addSockets(rec.outputs, node.outputs);
        relayoutSockets(node);

        m_nextNodeId = std::max(m_nextNodeId, rec.id.value() + 1);
        m_nodes.emplace(rec.id, std::move(node));
    }

    for (const ConnectionRecord& rec : fragment.connections) {
        m_connections.emplace(rec.id, Connection{rec.id, rec.source, rec.target, rec.controlOffsetHint});
        m_incoming.insert(rec.target, rec.id);
        m_nextConnectionId = std::max(m_nextConnectionId, rec.id.value() + 1);
    }
}

void GraphStore::relayoutSockets(Node& node)
{
    for (size_t i = 0; i < node.inputs.size(); ++i) {
        m_sockets.at(node.inputs[i]).offset
            = QPointF(0.0, m_policy.headerHeight + static_cast<double>(i + 1) * m_policy.socketSpacing);
    }
    for (size_t i = 0; i < node.outputs.size(); ++i) {
        m_sockets.at(node.outputs[i]).offset
            = QPointF(node.size.width(), m_policy.headerHeight + static_cast<double>(i + 1) * m_policy.socketSpacing);
    }
}

void GraphStore::eraseConnection(ConnectionId id)
{
    const auto it = m_connections.find(id);
    if (it == m_connections.end())
        return;
    m_incoming.remove(it->second.target);
    m_connections.erase(it);
}

void GraphStore::notify(const GraphChange& change)
{
    // Copy so listeners may unregister themselves while being notified.
    const auto listeners = m_listeners;
    for (const auto& entry : listeners) {
        if (entry.fn)
            entry.fn(change);
    }
}

void GraphStore::notify(GraphChange::Kind kind, NodeId node, SocketId socket, ConnectionId connection)
{
    notify(GraphChange{kind, node, socket, connection});
}

} // namespace NodeEditor
