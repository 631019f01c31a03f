// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/Connection.hpp"
#include "nodeeditor/GraphError.hpp"
#include "nodeeditor/GraphSnapshot.hpp"
#include "nodeeditor/Node.hpp"
#include "nodeeditor/NodeEditorConstants.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"
#include "nodeeditor/Socket.hpp"
#include "nodeeditor/SocketTypeRules.hpp"

#include <QtCore/QHash>
#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSet>
#include <QtCore/QSizeF>

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace NodeEditor {

struct NodeEditorConfig;

struct NODEEDITOR_EXPORT GraphChange final {
    enum class Kind : quint8 {
        NodeAdded,
        NodeRemoved,
        NodeMoved,
        NodeChanged,
        SocketAdded,
        SocketRemoved,
        ConnectionAdded,
        ConnectionRemoved,
        GraphReset
    };

    Kind kind = Kind::GraphReset;
    NodeId node{};
    SocketId socket{};
    ConnectionId connection{};
};

struct NODEEDITOR_EXPORT GraphPolicy final {
    bool typeChecking = true;
    bool allowSameNode = false;
    bool rejectCycles = false;

    QSizeF defaultNodeSize{Constants::kDefaultNodeWidth, Constants::kDefaultNodeHeight};
    double headerHeight = Constants::kNodeHeaderHeight;
    double socketSpacing = Constants::kSocketSpacing;
};

// Owns every node, socket and connection. All mutations are atomic: they either
// succeed completely or leave the store untouched, and each one notifies the
// listeners synchronously in registration order.
class NODEEDITOR_EXPORT GraphStore final
{
public:
    using Listener = std::function<void(const GraphChange&)>;
    using ListenerId = quint64;

    GraphStore() = default;
    explicit GraphStore(const GraphPolicy& policy);

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    const GraphPolicy& policy() const noexcept { return m_policy; }
    void setPolicy(const GraphPolicy& policy);
    void applyConfig(const NodeEditorConfig& config);

    SocketTypeRules& typeRules() noexcept { return m_typeRules; }
    const SocketTypeRules& typeRules() const noexcept { return m_typeRules; }

    NodeId addNode(const QPointF& position, NodePayload payload, std::optional<QSizeF> size = std::nullopt);
    GraphResult<void> removeNode(NodeId id);
    GraphResult<void> moveNode(NodeId id, const QPointF& position);
    GraphResult<void> resizeNode(NodeId id, const QSizeF& size);
    GraphResult<void> setPayload(NodeId id, NodePayload payload);

    GraphResult<SocketId> addSocket(NodeId nodeId,
                                    SocketDirection direction,
                                    const QString& typeTag,
                                    const QString& label = {});
    GraphResult<void> removeSocket(SocketId id);

    GraphResult<ConnectionId> connect(SocketId output, SocketId input);
    GraphResult<void> canConnect(SocketId output, SocketId input) const;
    GraphResult<void> disconnect(ConnectionId id);
    GraphResult<void> setControlOffsetHint(ConnectionId id, std::optional<double> hint);
    bool wouldCreateCycle(SocketId output, SocketId input) const;

    const Node* node(NodeId id) const;
    const Socket* socket(SocketId id) const;
    const Connection* connection(ConnectionId id) const;

    std::vector<NodeId> nodeIds() const;
    std::vector<ConnectionId> connectionIds() const;
    int nodeCount() const noexcept { return static_cast<int>(m_nodes.size()); }
    int socketCount() const noexcept { return static_cast<int>(m_sockets.size()); }
    int connectionCount() const noexcept { return static_cast<int>(m_connections.size()); }

    std::optional<ConnectionId> incomingConnection(SocketId input) const;
    std::vector<ConnectionId> connectionsOf(SocketId socket) const;
    bool isOccupied(SocketId socket) const;
    std::optional<QPointF> socketCanvasPos(SocketId socket) const;

    std::optional<SocketId> findSocketAt(const QPointF& canvasPos, double hitRadius) const;
    std::optional<NodeId> nodeAt(const QPointF& canvasPos) const;
    QSet<NodeId> nodesInRect(const QRectF& canvasRect) const;
    QRectF nodesBounds() const;

    GraphSnapshot exportGraph() const;
    GraphResult<void> importGraph(const GraphSnapshot& snapshot);

    // Fragment containing the given nodes, their sockets and every connection
    // touching them.
    GraphSnapshot extract(const QSet<NodeId>& nodes) const;
    GraphSnapshot extractConnections(const QSet<ConnectionId>& connections) const;
    // Re-inserts a fragment with its original ids.
    GraphResult<void> restore(const GraphSnapshot& fragment);

    void clear();

    ListenerId addListener(Listener listener);
    void removeListener(ListenerId id);

private:
    GraphResult<void> validateFragment(const GraphSnapshot& fragment, bool againstCurrent) const;
    void insertFragment(const GraphSnapshot& fragment);
    void relayoutSockets(Node& node);
    void eraseConnection(ConnectionId id);
    void notify(const GraphChange& change);
    void notify(GraphChange::Kind kind, NodeId node = {}, SocketId socket = {}, ConnectionId connection = {});

    GraphPolicy m_policy;
    SocketTypeRules m_typeRules;

    std::map<NodeId, Node> m_nodes;
    std::map<SocketId, Socket> m_sockets;
    std::map<ConnectionId, Connection> m_connections;
    QHash<SocketId, ConnectionId> m_incoming;

    quint64 m_nextNodeId = 1;
    quint64 m_nextSocketId = 1;
    quint64 m_nextConnectionId = 1;

    struct ListenerEntry final {
        ListenerId id = 0;
        Listener fn;
    };
    std::vector<ListenerEntry> m_listeners;
    ListenerId m_nextListenerId = 1;
};

} // namespace NodeEditor
