// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/commands/GraphCommandManager.hpp"
#include "nodeeditor/commands/GraphCommands.hpp"

#include <memory>

using namespace NodeEditor;

namespace {

struct Chain final {
    GraphStore graph;
    NodeId a{};
    NodeId b{};
    NodeId c{};
    SocketId aOut{};
    SocketId bIn{};
    SocketId bOut{};
    SocketId cIn{};
};

void buildChain(Chain& ch)
{
    ch.a = ch.graph.addNode(QPointF(0.0, 0.0), NodePayload{});
    ch.b = ch.graph.addNode(QPointF(300.0, 0.0), NodePayload{});
    ch.c = ch.graph.addNode(QPointF(600.0, 0.0), NodePayload{});
    ch.aOut = ch.graph.addSocket(ch.a, SocketDirection::Output, QStringLiteral("number")).value();
    ch.bIn = ch.graph.addSocket(ch.b, SocketDirection::Input, QStringLiteral("number")).value();
    ch.bOut = ch.graph.addSocket(ch.b, SocketDirection::Output, QStringLiteral("number")).value();
    ch.cIn = ch.graph.addSocket(ch.c, SocketDirection::Input, QStringLiteral("number")).value();
}

} // namespace

TEST(GraphCommandTests, MoveUndoRedo)
{
    Chain ch;
    buildChain(ch);
    GraphCommandManager mgr(&ch.graph);

    std::vector<NodeMove> moves{{ch.a, QPointF(0.0, 0.0), QPointF(40.0, 60.0)},
                                {ch.b, QPointF(300.0, 0.0), QPointF(340.0, 60.0)}};
    ASSERT_TRUE(mgr.execute(std::make_unique<MoveNodesCommand>(moves)));
    EXPECT_EQ(ch.graph.node(ch.b)->position, QPointF(340.0, 60.0));
    EXPECT_TRUE(mgr.canUndo());

    ASSERT_TRUE(mgr.undo());
    EXPECT_EQ(ch.graph.node(ch.a)->position, QPointF(0.0, 0.0));
    EXPECT_EQ(ch.graph.node(ch.b)->position, QPointF(300.0, 0.0));
    EXPECT_TRUE(mgr.canRedo());

    ASSERT_TRUE(mgr.redo());
    EXPECT_EQ(ch.graph.node(ch.a)->position, QPointF(40.0, 60.0));
}

TEST(GraphCommandTests, FailedCommandIsNotRecorded)
{
    Chain ch;
    buildChain(ch);
    GraphCommandManager mgr(&ch.graph);

    const auto result = mgr.execute(std::make_unique<MoveNodesCommand>(
        std::vector<NodeMove>{{ch.a, QPointF(), QPointF(5.0, 5.0)}, {NodeId(99), QPointF(), QPointF()}}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), GraphErrorCode::NotFound);
    EXPECT_EQ(ch.graph.node(ch.a)->position, QPointF(0.0, 0.0));
    EXPECT_FALSE(mgr.canUndo());

    const auto bad = mgr.execute(std::make_unique<ConnectCommand>(ch.bIn, ch.aOut));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code(), GraphErrorCode::InvalidDirection);
    EXPECT_EQ(mgr.undoCount(), 0);
}

TEST(GraphCommandTests, ConnectUndoRedoKeepsConnectionId)
{
    Chain ch;
    buildChain(ch);
    GraphCommandManager mgr(&ch.graph);

    auto cmd = std::make_unique<ConnectCommand>(ch.aOut, ch.bIn);
    ConnectCommand* raw = cmd.get();
    ASSERT_TRUE(mgr.execute(std::move(cmd)));
    const ConnectionId id = raw->connectionId();
    ASSERT_TRUE(id.isValid());

    ASSERT_TRUE(mgr.undo());
    EXPECT_EQ(ch.graph.connectionCount(), 0);

    ASSERT_TRUE(mgr.redo());
    EXPECT_EQ(ch.graph.incomingConnection(ch.bIn), id);
}

TEST(GraphCommandTests, DisconnectRestoresOnUndo)
{
    Chain ch;
    buildChain(ch);
    const ConnectionId link = ch.graph.connect(ch.aOut, ch.bIn).value();
    ASSERT_TRUE(ch.graph.setControlOffsetHint(link, 70.0));
    GraphCommandManager mgr(&ch.graph);

    ASSERT_TRUE(mgr.execute(std::make_unique<DisconnectCommand>(link)));
    EXPECT_EQ(ch.graph.connection(link), nullptr);

    ASSERT_TRUE(mgr.undo());
    const Connection* restored = ch.graph.connection(link);
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->controlOffsetHint, std::optional<double>(70.0));
}

TEST(GraphCommandTests, AddNodeUndoRedo)
{
    GraphStore graph;
    GraphCommandManager mgr(&graph);

    NodeRecord tmpl;
    tmpl.position = QPointF(20.0, 30.0);
    tmpl.payload.title = QStringLiteral("Add");
    tmpl.inputs.push_back(SocketRecord{SocketId{}, SocketDirection::Input, QStringLiteral("number"), QStringLiteral("a")});
    tmpl.inputs.push_back(SocketRecord{SocketId{}, SocketDirection::Input, QStringLiteral("number"), QStringLiteral("b")});
    tmpl.outputs.push_back(SocketRecord{SocketId{}, SocketDirection::Output, QStringLiteral("number"), QStringLiteral("sum")});

    auto cmd = std::make_unique<AddNodeCommand>(tmpl);
    AddNodeCommand* raw = cmd.get();
    ASSERT_TRUE(mgr.execute(std::move(cmd)));
    const NodeId id = raw->nodeId();
    ASSERT_NE(graph.node(id), nullptr);
    EXPECT_EQ(graph.node(id)->inputs.size(), 2u);
    EXPECT_EQ(graph.node(id)->size, QSizeF(120.0, 80.0));
    const SocketId sum = graph.node(id)->outputs.front();

    ASSERT_TRUE(mgr.undo());
    EXPECT_EQ(graph.nodeCount(), 0);
    EXPECT_EQ(graph.socketCount(), 0);

    ASSERT_TRUE(mgr.redo());
    ASSERT_NE(graph.node(id), nullptr);
    EXPECT_EQ(graph.node(id)->outputs.front(), sum);
    EXPECT_EQ(graph.socket(sum)->label, QStringLiteral("sum"));
}

TEST(GraphCommandTests, RemoveSelectionRestoresEverything)
{
    Chain ch;
    buildChain(ch);
    const ConnectionId ab = ch.graph.connect(ch.aOut, ch.bIn).value();
    const ConnectionId bc = ch.graph.connect(ch.bOut, ch.cIn).value();
    GraphCommandManager mgr(&ch.graph);

    ASSERT_TRUE(mgr.execute(std::make_unique<RemoveSelectionCommand>(QSet<NodeId>{ch.b}, QSet<ConnectionId>{})));
    EXPECT_EQ(ch.graph.nodeCount(), 2);
    EXPECT_EQ(ch.graph.connectionCount(), 0);

    ASSERT_TRUE(mgr.undo());
    EXPECT_EQ(ch.graph.nodeCount(), 3);
    EXPECT_EQ(ch.graph.incomingConnection(ch.bIn), ab);
    EXPECT_EQ(ch.graph.incomingConnection(ch.cIn), bc);
    EXPECT_EQ(ch.graph.socketCanvasPos(ch.bOut), QPointF(420.0, 44.0));
}

TEST(GraphCommandTests, RemoveSelectionHandlesLooseConnections)
{
    Chain ch;
    buildChain(ch);
    const ConnectionId ab = ch.graph.connect(ch.aOut, ch.bIn).value();
    const ConnectionId bc = ch.graph.connect(ch.bOut, ch.cIn).value();
    GraphCommandManager mgr(&ch.graph);

    ASSERT_TRUE(mgr.execute(std::make_unique<RemoveSelectionCommand>(QSet<NodeId>{ch.c},
                                                                     QSet<ConnectionId>{ab, bc})));
    EXPECT_EQ(ch.graph.nodeCount(), 2);
    EXPECT_EQ(ch.graph.connectionCount(), 0);

    ASSERT_TRUE(mgr.undo());
    EXPECT_NE(ch.graph.connection(ab), nullptr);
    EXPECT_NE(ch.graph.connection(bc), nullptr);
    EXPECT_NE(ch.graph.node(ch.c), nullptr);
}

TEST(GraphCommandTests, RemoveSelectionOfNothingFails)
{
    Chain ch;
    buildChain(ch);
    GraphCommandManager mgr(&ch.graph);

    const auto result = mgr.execute(std::make_unique<RemoveSelectionCommand>(QSet<NodeId>{NodeId(404)},
                                                                             QSet<ConnectionId>{}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), GraphErrorCode::NotFound);
}

TEST(GraphCommandTests, NewCommandClearsRedo)
{
    Chain ch;
    buildChain(ch);
    GraphCommandManager mgr(&ch.graph);

    ASSERT_TRUE(mgr.execute(std::make_unique<MoveNodesCommand>(
        std::vector<NodeMove>{{ch.a, QPointF(0.0, 0.0), QPointF(10.0, 0.0)}})));
    ASSERT_TRUE(mgr.undo());
    ASSERT_TRUE(mgr.canRedo());

    ASSERT_TRUE(mgr.execute(std::make_unique<MoveNodesCommand>(
        std::vector<NodeMove>{{ch.b, QPointF(300.0, 0.0), QPointF(310.0, 0.0)}})));
    EXPECT_FALSE(mgr.canRedo());
    EXPECT_FALSE(mgr.redo());
}

TEST(GraphCommandTests, HistoryIsBounded)
{
    Chain ch;
    buildChain(ch);
    GraphCommandManager mgr(&ch.graph, 3);

    for (int i = 1; i <= 5; ++i) {
        ASSERT_TRUE(mgr.execute(std::make_unique<MoveNodesCommand>(
            std::vector<NodeMove>{{ch.a, QPointF((i - 1) * 10.0, 0.0), QPointF(i * 10.0, 0.0)}})));
    }
    EXPECT_EQ(mgr.undoCount(), 3);

    while (mgr.undo()) {}
    EXPECT_EQ(ch.graph.node(ch.a)->position, QPointF(20.0, 0.0));

    mgr.setMaxSteps(0);
    EXPECT_EQ(mgr.undoCount(), 0);
    ASSERT_TRUE(mgr.execute(std::make_unique<MoveNodesCommand>(
        std::vector<NodeMove>{{ch.a, QPointF(20.0, 0.0), QPointF(0.0, 0.0)}})));
    EXPECT_EQ(ch.graph.node(ch.a)->position, QPointF(0.0, 0.0));
    EXPECT_FALSE(mgr.canUndo());
}

TEST(GraphCommandTests, PasteCopiesFragmentWithFreshIds)
{
    Chain ch;
    buildChain(ch);
    const ConnectionId ab = ch.graph.connect(ch.aOut, ch.bIn).value();
    ASSERT_TRUE(ch.graph.connect(ch.bOut, ch.cIn));
    ASSERT_TRUE(ch.graph.setControlOffsetHint(ab, 80.0));
    GraphCommandManager mgr(&ch.graph);

    const GraphSnapshot fragment = ch.graph.extract(QSet<NodeId>{ch.a, ch.b});
    auto cmd = std::make_unique<PasteNodesCommand>(fragment, QPointF(0.0, 200.0));
    PasteNodesCommand* paste = cmd.get();
    ASSERT_TRUE(mgr.execute(std::move(cmd)));

    ASSERT_EQ(ch.graph.nodeCount(), 5);
    // b -> c leaves the fragment, so only the copy of a -> b comes along.
    ASSERT_EQ(ch.graph.connectionCount(), 3);

    const QSet<NodeId> created = paste->createdNodes();
    ASSERT_EQ(created.size(), 2);
    EXPECT_FALSE(created.contains(ch.a));
    EXPECT_FALSE(created.contains(ch.b));

    const std::vector<NodeId> ids = ch.graph.nodeIds();
    const Node* aCopy = ch.graph.node(ids.at(3));
    const Node* bCopy = ch.graph.node(ids.at(4));
    ASSERT_NE(aCopy, nullptr);
    ASSERT_NE(bCopy, nullptr);
    EXPECT_EQ(aCopy->position, QPointF(0.0, 200.0));
    EXPECT_EQ(bCopy->position, QPointF(300.0, 200.0));
    ASSERT_EQ(aCopy->outputs.size(), 1u);
    ASSERT_EQ(bCopy->inputs.size(), 1u);
    EXPECT_NE(aCopy->outputs.front(), ch.aOut);

    const auto incoming = ch.graph.incomingConnection(bCopy->inputs.front());
    ASSERT_TRUE(incoming.has_value());
    const Connection* copied = ch.graph.connection(*incoming);
    EXPECT_EQ(copied->source, aCopy->outputs.front());
    EXPECT_EQ(copied->controlOffsetHint, std::optional<double>(80.0));

    ASSERT_TRUE(mgr.undo());
    EXPECT_EQ(ch.graph.nodeCount(), 3);
    EXPECT_EQ(ch.graph.connectionCount(), 2);

    ASSERT_TRUE(mgr.redo());
    EXPECT_NE(ch.graph.node(ids.at(3)), nullptr);
    EXPECT_NE(ch.graph.node(ids.at(4)), nullptr);
    EXPECT_EQ(ch.graph.connectionCount(), 3);
}

TEST(GraphCommandTests, PasteOfEmptyFragmentFails)
{
    Chain ch;
    buildChain(ch);
    GraphCommandManager mgr(&ch.graph);

    EXPECT_FALSE(mgr.execute(std::make_unique<PasteNodesCommand>(GraphSnapshot{}, QPointF(50.0, 50.0))));
    EXPECT_EQ(ch.graph.nodeCount(), 3);
    EXPECT_FALSE(mgr.canUndo());
}
