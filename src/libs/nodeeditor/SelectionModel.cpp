// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/SelectionModel.hpp"

#include "nodeeditor/GraphStore.hpp"

#include <utility>

namespace NodeEditor {

NodeId SelectionModel::singleNode() const noexcept
{
    if (m_nodes.size() != 1 || !m_connections.isEmpty())
        return NodeId{};
    return *m_nodes.constBegin();
}

void SelectionModel::setSelection(const QSet<NodeId>& nodes, const QSet<ConnectionId>& connections)
{
    if (m_nodes == nodes && m_connections == connections)
        return;
    m_nodes = nodes;
    m_connections = connections;
    notify();
}

void SelectionModel::setSelectedNodes(const QSet<NodeId>& nodes)
{
    setSelection(nodes, {});
}

void SelectionModel::selectNode(NodeId id)
{
    if (!id) {
        clear();
        return;
    }
    setSelection(QSet<NodeId>{id}, {});
}

void SelectionModel::toggleNode(NodeId id)
{
    if (!id)
        return;
    QSet<NodeId> next = m_nodes;
    if (next.contains(id))
        next.remove(id);
    else
        next.insert(id);
    setSelection(next, m_connections);
}

void SelectionModel::addNodes(const QSet<NodeId>& nodes)
{
    setSelection(m_nodes | nodes, m_connections);
}

void SelectionModel::removeNode(NodeId id)
{
    if (!m_nodes.contains(id))
        return;
    QSet<NodeId> next = m_nodes;
    next.remove(id);
    setSelection(next, m_connections);
}

void SelectionModel::selectConnection(ConnectionId id)
{
    if (!id) {
        clear();
        return;
    }
    setSelection({}, QSet<ConnectionId>{id});
}

void SelectionModel::toggleConnection(ConnectionId id)
{
    if (!id)
        return;
    QSet<ConnectionId> next = m_connections;
    if (next.contains(id))
        next.remove(id);
    else
        next.insert(id);
    setSelection(m_nodes, next);
}

void SelectionModel::selectAll(const GraphStore& graph)
{
    QSet<NodeId> nodes;
    for (NodeId id : graph.nodeIds())
        nodes.insert(id);
    setSelection(nodes, {});
}

void SelectionModel::clear()
{
    setSelection({}, {});
}

void SelectionModel::prune(const GraphStore& graph)
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
    setSelection(nodes, connections);
}

SelectionModel::ListenerId SelectionModel::addListener(Listener listener)
{
    const ListenerId id = m_nextListenerId++;
    m_listeners.push_back(ListenerEntry{id, std::move(listener)});
    return id;
}

void SelectionModel::removeListener(ListenerId id)
{
    std::erase_if(m_listeners, [id](const ListenerEntry& e) { return e.id == id; });
}

void SelectionModel::notify()
{
    const auto listeners = m_listeners;
    for (const auto& entry : listeners) {
        if (entry.fn)
            entry.fn();
    }
}

} // namespace NodeEditor
