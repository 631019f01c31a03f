// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/GraphSnapshot.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"
#include "nodeeditor/commands/GraphCommand.hpp"

#include <QtCore/QPointF>
#include <QtCore/QSet>

#include <vector>

namespace NodeEditor {

struct NodeMove final {
    NodeId node{};
    QPointF from;
    QPointF to;
};

class NODEEDITOR_EXPORT MoveNodesCommand final : public GraphCommand
{
public:
    explicit MoveNodesCommand(std::vector<NodeMove> moves);

    QString name() const override;
    GraphResult<void> apply(GraphStore& graph) override;
    GraphResult<void> revert(GraphStore& graph) override;

private:
    GraphResult<void> moveAll(GraphStore& graph, bool forward);

    std::vector<NodeMove> m_moves;
};

class NODEEDITOR_EXPORT AddNodeCommand final : public GraphCommand
{
public:
    // Sockets listed in the record are created with fresh ids; the record's own
    // ids are ignored.
    explicit AddNodeCommand(NodeRecord node);

    QString name() const override;
    GraphResult<void> apply(GraphStore& graph) override;
    GraphResult<void> revert(GraphStore& graph) override;

    NodeId nodeId() const noexcept { return m_nodeId; }

private:
    NodeRecord m_template;
    NodeId m_nodeId{};
    GraphSnapshot m_created;
};

class NODEEDITOR_EXPORT ConnectCommand final : public GraphCommand
{
public:
    ConnectCommand(SocketId output, SocketId input);

    QString name() const override;
    GraphResult<void> apply(GraphStore& graph) override;
    GraphResult<void> revert(GraphStore& graph) override;

    ConnectionId connectionId() const noexcept { return m_connection; }

private:
    SocketId m_output{};
    SocketId m_input{};
    ConnectionId m_connection{};
};

class NODEEDITOR_EXPORT DisconnectCommand final : public GraphCommand
{
public:
    explicit DisconnectCommand(ConnectionId connection);

    QString name() const override;
    GraphResult<void> apply(GraphStore& graph) override;
    GraphResult<void> revert(GraphStore& graph) override;

private:
    ConnectionId m_connection{};
    GraphSnapshot m_saved;
};

// Inserts a copy of a fragment shifted by `offset`. Nodes, sockets and
// connections get fresh ids; connections whose endpoints are not both inside
// the fragment are dropped. Redo re-inserts the ids handed out the first time.
class NODEEDITOR_EXPORT PasteNodesCommand final : public GraphCommand
{
public:
    PasteNodesCommand(GraphSnapshot fragment, const QPointF& offset);

    QString name() const override;
    GraphResult<void> apply(GraphStore& graph) override;
    GraphResult<void> revert(GraphStore& graph) override;

    QSet<NodeId> createdNodes() const;

private:
    GraphResult<void> insertCopy(GraphStore& graph, std::vector<NodeId>& created);

    GraphSnapshot m_fragment;
    QPointF m_offset;
    GraphSnapshot m_created;
};

// Removes connections first, then nodes with their sockets and every
// connection still attached. Revert re-inserts everything with the original ids.
class NODEEDITOR_EXPORT RemoveSelectionCommand final : public GraphCommand
{
public:
    RemoveSelectionCommand(QSet<NodeId> nodes, QSet<ConnectionId> connections);

    QString name() const override;
    GraphResult<void> apply(GraphStore& graph) override;
    GraphResult<void> revert(GraphStore& graph) override;

private:
    QSet<NodeId> m_nodes;
    QSet<ConnectionId> m_connections;
    GraphSnapshot m_saved;
};

} // namespace NodeEditor
