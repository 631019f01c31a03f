// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/commands/GraphCommands.hpp"

#include "nodeeditor/GraphStore.hpp"

#include <QtCore/QDebug>
#include <QtCore/QHash>

#include <algorithm>
#include <utility>

namespace NodeEditor {

using namespace Qt::StringLiterals;

MoveNodesCommand::MoveNodesCommand(std::vector<NodeMove> moves)
    : m_moves(std::move(moves))
{}

QString MoveNodesCommand::name() const
{
    return m_moves.size() == 1 ? u"Move Node"_s : u"Move Nodes"_s;
}

GraphResult<void> MoveNodesCommand::apply(GraphStore& graph)
{
    return moveAll(graph, true);
}

GraphResult<void> MoveNodesCommand::revert(GraphStore& graph)
{
    return moveAll(graph, false);
}

GraphResult<void> MoveNodesCommand::moveAll(GraphStore& graph, bool forward)
{
    for (const NodeMove& m : m_moves) {
        if (!graph.node(m.node))
            return graphError(GraphErrorCode::NotFound, u"node %1 does not exist"_s.arg(m.node.value()));
    }
    for (const NodeMove& m : m_moves) {
        if (auto ok = graph.moveNode(m.node, forward ? m.to : m.from); !ok)
            return ok;
    }
    return {};
}

AddNodeCommand::AddNodeCommand(NodeRecord node)
    : m_template(std::move(node))
{}

QString AddNodeCommand::name() const
{
    return u"Add Node"_s;
}

GraphResult<void> AddNodeCommand::apply(GraphStore& graph)
{
    if (!m_created.isEmpty())
        return graph.restore(m_created);

    std::optional<QSizeF> size;
    if (!m_template.size.isEmpty())
        size = m_template.size;
    const NodeId id = graph.addNode(m_template.position, m_template.payload, size);

    auto addAll = [&](const std::vector<SocketRecord>& list, SocketDirection dir) -> GraphResult<void> {
        for (const SocketRecord& s : list) {
            if (auto sid = graph.addSocket(id, dir, s.typeTag, s.label); !sid)
                return std::unexpected(sid.error());
        }
        return {};
    };
    auto ok = addAll(m_template.inputs, SocketDirection::Input);
    if (ok)
        ok = addAll(m_template.outputs, SocketDirection::Output);
    if (!ok) {
        if (auto removed = graph.removeNode(id); !removed)
            qCWarning(nodeeditorlog) << "AddNodeCommand: rollback failed:" << removed.error().toString();
        return ok;
    }

    m_nodeId = id;
    m_created = graph.extract(QSet<NodeId>{id});
    return {};
}

GraphResult<void> AddNodeCommand::revert(GraphStore& graph)
{
    return graph.removeNode(m_nodeId);
}

ConnectCommand::ConnectCommand(SocketId output, SocketId input)
    : m_output(output)
    , m_input(input)
{}

QString ConnectCommand::name() const
{
    return u"Connect"_s;
}

GraphResult<void> ConnectCommand::apply(GraphStore& graph)
{
    if (m_connection) {
        // Redo keeps the id handed out the first time.
        GraphSnapshot fragment;
        fragment.connections.push_back(ConnectionRecord{m_connection, m_output, m_input, std::nullopt});
        return graph.restore(fragment);
    }

    auto cid = graph.connect(m_output, m_input);
    if (!cid)
        return std::unexpected(cid.error());
    m_connection = *cid;
    return {};
}

GraphResult<void> ConnectCommand::revert(GraphStore& graph)
{
    return graph.disconnect(m_connection);
}

DisconnectCommand::DisconnectCommand(ConnectionId connection)
    : m_connection(connection)
{}

QString DisconnectCommand::name() const
{
    return u"Disconnect"_s;
}

GraphResult<void> DisconnectCommand::apply(GraphStore& graph)
{
    GraphSnapshot saved = graph.extractConnections(QSet<ConnectionId>{m_connection});
    if (auto ok = graph.disconnect(m_connection); !ok)
        return ok;
    m_saved = std::move(saved);
    return {};
}

GraphResult<void> DisconnectCommand::revert(GraphStore& graph)
{
    return graph.restore(m_saved);
}

PasteNodesCommand::PasteNodesCommand(GraphSnapshot fragment, const QPointF& offset)
    : m_fragment(std::move(fragment))
    , m_offset(offset)
{}

QString PasteNodesCommand::name() const
{
    return m_fragment.nodes.size() == 1 ? u"Paste Node"_s : u"Paste Nodes"_s;
}

GraphResult<void> PasteNodesCommand::apply(GraphStore& graph)
{
    if (!m_created.isEmpty())
        return graph.restore(m_created);
    if (m_fragment.nodes.empty())
        return graphError(GraphErrorCode::NotFound, u"nothing to paste"_s);

    std::vector<NodeId> created;
    if (auto ok = insertCopy(graph, created); !ok) {
        for (NodeId id : created) {
            if (auto removed = graph.removeNode(id); !removed)
                qCWarning(nodeeditorlog) << "PasteNodesCommand: rollback failed:" << removed.error().toString();
        }
        return ok;
    }

    m_created = graph.extract(QSet<NodeId>(created.begin(), created.end()));
    return {};
}

GraphResult<void> PasteNodesCommand::insertCopy(GraphStore& graph, std::vector<NodeId>& created)
{
    QHash<SocketId, SocketId> remap;

    for (const NodeRecord& rec : m_fragment.nodes) {
        std::optional<QSizeF> size;
        if (!rec.size.isEmpty())
            size = rec.size;
        const NodeId id = graph.addNode(rec.position + m_offset, rec.payload, size);
        created.push_back(id);

        auto addAll = [&](const std::vector<SocketRecord>& list, SocketDirection dir) -> GraphResult<void> {
            for (const SocketRecord& s : list) {
                auto sid = graph.addSocket(id, dir, s.typeTag, s.label);
                if (!sid)
                    return std::unexpected(sid.error());
                remap.insert(s.id, *sid);
            }
            return {};
        };
        if (auto ok = addAll(rec.inputs, SocketDirection::Input); !ok)
            return ok;
        if (auto ok = addAll(rec.outputs, SocketDirection::Output); !ok)
            return ok;
    }

    for (const ConnectionRecord& rec : m_fragment.connections) {
        const auto src = remap.constFind(rec.source);
        const auto dst = remap.constFind(rec.target);
        if (src == remap.constEnd() || dst == remap.constEnd())
            continue;
        auto cid = graph.connect(src.value(), dst.value());
        if (!cid)
            return std::unexpected(cid.error());
        if (rec.controlOffsetHint) {
            if (auto ok = graph.setControlOffsetHint(*cid, rec.controlOffsetHint); !ok)
                return ok;
        }
    }
    return {};
}

GraphResult<void> PasteNodesCommand::revert(GraphStore& graph)
{
    for (const NodeRecord& rec : m_created.nodes) {
        if (auto ok = graph.removeNode(rec.id); !ok)
            return ok;
    }
    return {};
}

QSet<NodeId> PasteNodesCommand::createdNodes() const
{
    QSet<NodeId> out;
    for (const NodeRecord& rec : m_created.nodes)
        out.insert(rec.id);
    return out;
}

RemoveSelectionCommand::RemoveSelectionCommand(QSet<NodeId> nodes, QSet<ConnectionId> connections)
    : m_nodes(std::move(nodes))
    , m_connections(std::move(connections))
{}

QString RemoveSelectionCommand::name() const
{
    return u"Delete"_s;
}

GraphResult<void> RemoveSelectionCommand::apply(GraphStore& graph)
{
    QSet<NodeId> nodes;
    for (NodeId id : std::as_const(m_nodes)) {
        if (graph.node(id))
            nodes.insert(id);
    }
    QSet<ConnectionId> connections;
    for (ConnectionId id : std::as_const(m_connections)) {
        if (graph.connection(id))
            connections.insert(id);
    }
    if (nodes.isEmpty() && connections.isEmpty())
        return graphError(GraphErrorCode::NotFound, u"nothing to delete"_s);

    GraphSnapshot saved = graph.extract(nodes);
    QSet<ConnectionId> captured;
    for (const ConnectionRecord& rec : saved.connections)
        captured.insert(rec.id);
    const GraphSnapshot loose = graph.extractConnections(connections - captured);
    saved.connections.insert(saved.connections.end(), loose.connections.begin(), loose.connections.end());
    std::sort(saved.connections.begin(), saved.connections.end(),
              [](const ConnectionRecord& a, const ConnectionRecord& b) { return a.id < b.id; });

    for (const ConnectionRecord& rec : loose.connections) {
        if (auto ok = graph.disconnect(rec.id); !ok)
            return ok;
    }
    for (const NodeRecord& rec : saved.nodes) {
        if (auto ok = graph.removeNode(rec.id); !ok)
            return ok;
    }

    m_saved = std::move(saved);
    return {};
}

GraphResult<void> RemoveSelectionCommand::revert(GraphStore& graph)
{
    return graph.restore(m_saved);
}

} // namespace NodeEditor
