// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QSet>

#include <functional>
#include <vector>

namespace NodeEditor {

class GraphStore;

class NODEEDITOR_EXPORT SelectionModel final
{
public:
    using Listener = std::function<void()>;
    using ListenerId = quint64;

    const QSet<NodeId>& selectedNodes() const noexcept { return m_nodes; }
    const QSet<ConnectionId>& selectedConnections() const noexcept { return m_connections; }

    bool isSelected(NodeId id) const noexcept { return m_nodes.contains(id); }
    bool isSelected(ConnectionId id) const noexcept { return m_connections.contains(id); }
    bool isEmpty() const noexcept { return m_nodes.isEmpty() && m_connections.isEmpty(); }

    // Returns the node when exactly one node and no connection is selected.
    NodeId singleNode() const noexcept;

    void setSelection(const QSet<NodeId>& nodes, const QSet<ConnectionId>& connections);
    void setSelectedNodes(const QSet<NodeId>& nodes);
    void selectNode(NodeId id);
    void toggleNode(NodeId id);
    void addNodes(const QSet<NodeId>& nodes);
    void removeNode(NodeId id);

    void selectConnection(ConnectionId id);
    void toggleConnection(ConnectionId id);

    void selectAll(const GraphStore& graph);
    void clear();

    // Drops ids that no longer exist in the graph.
    void prune(const GraphStore& graph);

    ListenerId addListener(Listener listener);
    void removeListener(ListenerId id);

private:
    void notify();

    QSet<NodeId> m_nodes;
    QSet<ConnectionId> m_connections;

    struct ListenerEntry final {
        ListenerId id = 0;
        Listener fn;
    };
    std::vector<ListenerEntry> m_listeners;
    ListenerId m_nextListenerId = 1;
};

} // namespace NodeEditor
