// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/SelectionModel.hpp"
#include "nodeeditor/ViewportTransform.hpp"
#include "nodeeditor/commands/GraphCommandManager.hpp"
#include "nodeeditor/controllers/InteractionController.hpp"

using namespace NodeEditor;

namespace {

// A at (0,0) with an output at (120,44); B at (300,0) with an input at (300,44).
class InteractionControllerTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        a = graph.addNode(QPointF(0.0, 0.0), NodePayload{});
        b = graph.addNode(QPointF(300.0, 0.0), NodePayload{});
        aOut = graph.addSocket(a, SocketDirection::Output, QStringLiteral("number")).value();
        bIn = graph.addSocket(b, SocketDirection::Input, QStringLiteral("number")).value();
        controller = std::make_unique<InteractionController>(graph, viewport, selection, commands);
        controller->setViewportSize(QSizeF(800.0, 600.0));
    }

    void TearDown() override { controller.reset(); }

    bool press(const QPointF& pos,
               PointerButton button = PointerButton::Left,
               Qt::KeyboardModifiers mods = Qt::NoModifier)
    {
        return controller->pointerDown(PointerEvent{pos, button, mods});
    }

    bool move(const QPointF& pos) { return controller->pointerMove(PointerEvent{pos, PointerButton::None, Qt::NoModifier}); }

    bool release(const QPointF& pos, PointerButton button = PointerButton::Left)
    {
        return controller->pointerUp(PointerEvent{pos, button, Qt::NoModifier});
    }

    bool key(int k, Qt::KeyboardModifiers mods = Qt::NoModifier) { return controller->keyDown(KeyEvent{k, mods}); }

    GraphStore graph;
    ViewportTransform viewport;
    SelectionModel selection;
    GraphCommandManager commands{&graph};
    std::unique_ptr<InteractionController> controller;

    NodeId a{};
    NodeId b{};
    SocketId aOut{};
    SocketId bIn{};
};

} // namespace

TEST_F(InteractionControllerTests, ClickSelectsAndDragMovesNode)
{
    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    EXPECT_EQ(controller->state(), InteractionController::State::DraggingNode);
    EXPECT_EQ(selection.singleNode(), a);

    EXPECT_TRUE(move(QPointF(110.0, 60.0)));
    EXPECT_EQ(graph.node(a)->position, QPointF(50.0, 50.0));

    EXPECT_TRUE(release(QPointF(110.0, 60.0)));
    EXPECT_EQ(controller->state(), InteractionController::State::Idle);
    EXPECT_EQ(commands.undoCount(), 1);

    ASSERT_TRUE(key(Qt::Key_Z, Qt::ControlModifier));
    EXPECT_EQ(graph.node(a)->position, QPointF(0.0, 0.0));
    ASSERT_TRUE(key(Qt::Key_Z, Qt::ControlModifier | Qt::ShiftModifier));
    EXPECT_EQ(graph.node(a)->position, QPointF(50.0, 50.0));
}

TEST_F(InteractionControllerTests, ClickWithoutMovementRecordsNothing)
{
    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    ASSERT_TRUE(release(QPointF(60.0, 10.0)));
    EXPECT_EQ(commands.undoCount(), 0);
    EXPECT_TRUE(selection.isSelected(a));
}

TEST_F(InteractionControllerTests, DragSnapsToGrid)
{
    NodeEditorConfig cfg;
    cfg.behavior.snapToGrid = true;
    controller->setConfig(cfg);

    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    move(QPointF(73.0, 38.0));
    EXPECT_EQ(graph.node(a)->position, QPointF(20.0, 20.0));
    release(QPointF(73.0, 38.0));
}

TEST_F(InteractionControllerTests, GroupDragMovesSelection)
{
    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    release(QPointF(60.0, 10.0));
    ASSERT_TRUE(press(QPointF(360.0, 70.0), PointerButton::Left, Qt::ControlModifier));
    release(QPointF(360.0, 70.0));
    ASSERT_EQ(selection.selectedNodes(), (QSet<NodeId>{a, b}));

    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    move(QPointF(70.0, 30.0));
    release(QPointF(70.0, 30.0));
    EXPECT_EQ(graph.node(a)->position, QPointF(10.0, 20.0));
    EXPECT_EQ(graph.node(b)->position, QPointF(310.0, 20.0));
    EXPECT_EQ(selection.selectedNodes(), (QSet<NodeId>{a, b}));

    ASSERT_TRUE(controller->undo());
    EXPECT_EQ(graph.node(b)->position, QPointF(300.0, 0.0));
}

TEST_F(InteractionControllerTests, AdditiveClickOnSelectedNodeDeselects)
{
    selection.selectNode(a);
    ASSERT_TRUE(press(QPointF(60.0, 10.0), PointerButton::Left, Qt::ShiftModifier));
    EXPECT_FALSE(selection.isSelected(a));
    EXPECT_EQ(controller->state(), InteractionController::State::Idle);
}

TEST_F(InteractionControllerTests, DragFromOutputToInputConnects)
{
    ASSERT_TRUE(press(QPointF(121.0, 45.0)));
    EXPECT_EQ(controller->state(), InteractionController::State::DraggingConnection);

    move(QPointF(298.0, 46.0));
    const InteractionOverlay overlay = controller->overlay();
    ASSERT_TRUE(overlay.preview.has_value());
    EXPECT_EQ(overlay.preview->origin, aOut);
    EXPECT_EQ(overlay.preview->candidate, bIn);
    EXPECT_TRUE(overlay.preview->candidateAccepted);

    release(QPointF(298.0, 46.0));
    EXPECT_EQ(controller->state(), InteractionController::State::Idle);
    ASSERT_EQ(graph.connectionCount(), 1);
    EXPECT_TRUE(graph.incomingConnection(bIn).has_value());
    EXPECT_FALSE(controller->overlay().preview.has_value());

    ASSERT_TRUE(controller->undo());
    EXPECT_EQ(graph.connectionCount(), 0);
}

TEST_F(InteractionControllerTests, DragFromInputToOutputConnects)
{
    ASSERT_TRUE(press(QPointF(300.0, 44.0)));
    move(QPointF(120.0, 44.0));
    release(QPointF(120.0, 44.0));

    const auto incoming = graph.incomingConnection(bIn);
    ASSERT_TRUE(incoming.has_value());
    EXPECT_EQ(graph.connection(*incoming)->source, aOut);
}

TEST_F(InteractionControllerTests, RejectedDropCreatesNothing)
{
    const SocketId text = graph.addSocket(b, SocketDirection::Input, QStringLiteral("string")).value();
    const QPointF textPos = *graph.socketCanvasPos(text);

    ASSERT_TRUE(press(QPointF(120.0, 44.0)));
    move(textPos);
    const InteractionOverlay overlay = controller->overlay();
    ASSERT_TRUE(overlay.preview.has_value());
    EXPECT_EQ(overlay.preview->candidate, text);
    EXPECT_FALSE(overlay.preview->candidateAccepted);
    release(textPos);
    EXPECT_EQ(graph.connectionCount(), 0);

    ASSERT_TRUE(press(QPointF(120.0, 44.0)));
    move(QPointF(200.0, 300.0));
    release(QPointF(200.0, 300.0));
    EXPECT_EQ(graph.connectionCount(), 0);
    EXPECT_EQ(commands.undoCount(), 0);
}

TEST_F(InteractionControllerTests, ClickOnWireSelectsConnection)
{
    const ConnectionId link = graph.connect(aOut, bIn).value();

    ASSERT_TRUE(press(QPointF(210.0, 47.0)));
    release(QPointF(210.0, 47.0));
    EXPECT_TRUE(selection.isSelected(link));
    EXPECT_TRUE(selection.selectedNodes().isEmpty());

    ASSERT_TRUE(key(Qt::Key_Delete));
    EXPECT_EQ(graph.connectionCount(), 0);
    EXPECT_TRUE(selection.isEmpty());

    EXPECT_FALSE(key(Qt::Key_Y, Qt::ControlModifier));
    ASSERT_TRUE(key(Qt::Key_Z, Qt::ControlModifier));
    EXPECT_NE(graph.connection(link), nullptr);
}

TEST_F(InteractionControllerTests, BoxSelectCollectsIntersectingNodes)
{
    ASSERT_TRUE(press(QPointF(-50.0, -50.0)));
    EXPECT_EQ(controller->state(), InteractionController::State::BoxSelecting);
    move(QPointF(130.0, 130.0));
    const InteractionOverlay overlay = controller->overlay();
    ASSERT_TRUE(overlay.boxCanvas.has_value());
    EXPECT_EQ(*overlay.boxCanvas, QRectF(-50.0, -50.0, 180.0, 180.0));

    release(QPointF(130.0, 130.0));
    EXPECT_EQ(selection.selectedNodes(), QSet<NodeId>{a});

    ASSERT_TRUE(press(QPointF(500.0, 200.0), PointerButton::Left, Qt::ShiftModifier));
    move(QPointF(250.0, -20.0));
    release(QPointF(250.0, -20.0));
    EXPECT_EQ(selection.selectedNodes(), (QSet<NodeId>{a, b}));

    ASSERT_TRUE(press(QPointF(600.0, 400.0)));
    release(QPointF(610.0, 410.0));
    EXPECT_TRUE(selection.isEmpty());
}

TEST_F(InteractionControllerTests, MiddleDragPansAndEscapeRestores)
{
    ASSERT_TRUE(press(QPointF(10.0, 10.0), PointerButton::Middle));
    EXPECT_EQ(controller->state(), InteractionController::State::Panning);
    move(QPointF(40.0, 25.0));
    EXPECT_EQ(viewport.pan(), QPointF(30.0, 15.0));

    ASSERT_TRUE(key(Qt::Key_Escape));
    EXPECT_EQ(viewport.pan(), QPointF(0.0, 0.0));
    EXPECT_EQ(controller->state(), InteractionController::State::Idle);
}

TEST_F(InteractionControllerTests, EscapeRestoresDraggedNode)
{
    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    move(QPointF(160.0, 110.0));
    ASSERT_TRUE(key(Qt::Key_Escape));
    EXPECT_EQ(graph.node(a)->position, QPointF(0.0, 0.0));
    EXPECT_FALSE(release(QPointF(160.0, 110.0)));
    EXPECT_EQ(commands.undoCount(), 0);
}

TEST_F(InteractionControllerTests, PanningCanBeDisabled)
{
    NodeEditorConfig cfg;
    cfg.behavior.panEnabled = false;
    controller->setConfig(cfg);
    EXPECT_FALSE(press(QPointF(10.0, 10.0), PointerButton::Middle));
    EXPECT_EQ(controller->state(), InteractionController::State::Idle);
}

TEST_F(InteractionControllerTests, WheelZoomsAroundPointer)
{
    const QPointF pivot(200.0, 100.0);
    const QPointF before = viewport.toCanvas(pivot);
    ASSERT_TRUE(controller->wheel(WheelEvent{pivot, 1.0, Qt::NoModifier}));
    EXPECT_DOUBLE_EQ(viewport.zoom(), 1.1);
    const QPointF after = viewport.toCanvas(pivot);
    EXPECT_NEAR(after.x(), before.x(), 1e-9);
    EXPECT_NEAR(after.y(), before.y(), 1e-9);

    for (int i = 0; i < 100; ++i)
        controller->wheel(WheelEvent{pivot, 1.0, Qt::NoModifier});
    EXPECT_DOUBLE_EQ(viewport.zoom(), 3.0);

    NodeEditorConfig cfg;
    cfg.behavior.zoomEnabled = false;
    controller->setConfig(cfg);
    EXPECT_FALSE(controller->wheel(WheelEvent{pivot, -1.0, Qt::NoModifier}));
}

TEST_F(InteractionControllerTests, SocketHitRadiusScalesWithZoom)
{
    viewport.setZoom(2.0);
    // Output sits at (240,88) on screen; 30px away is 15 canvas units.
    ASSERT_TRUE(press(QPointF(270.0, 88.0)));
    EXPECT_NE(controller->state(), InteractionController::State::DraggingConnection);
    controller->cancel();

    ASSERT_TRUE(press(QPointF(254.0, 88.0)));
    EXPECT_EQ(controller->state(), InteractionController::State::DraggingConnection);
}

TEST_F(InteractionControllerTests, FrameAllCentresGraph)
{
    ASSERT_TRUE(key(Qt::Key_F));
    const QRectF bounds = graph.nodesBounds();
    const QPointF centre = viewport.toScreen(bounds.center());
    EXPECT_NEAR(centre.x(), 400.0, 1e-6);
    EXPECT_NEAR(centre.y(), 300.0, 1e-6);
}

TEST_F(InteractionControllerTests, SelectAllAndHover)
{
    ASSERT_TRUE(key(Qt::Key_A, Qt::ControlModifier));
    EXPECT_EQ(selection.selectedNodes(), (QSet<NodeId>{a, b}));
    EXPECT_FALSE(key(Qt::Key_A));

    EXPECT_FALSE(move(QPointF(60.0, 40.0)));
    EXPECT_EQ(controller->overlay().hoveredNode, a);
    move(QPointF(119.0, 44.0));
    EXPECT_EQ(controller->overlay().hoveredSocket, aOut);
}

TEST_F(InteractionControllerTests, RemovedNodesLeaveSelectionAndHover)
{
    selection.selectNode(b);
    move(QPointF(350.0, 60.0));
    ASSERT_EQ(controller->overlay().hoveredNode, b);

    ASSERT_TRUE(graph.removeNode(b));
    EXPECT_TRUE(selection.isEmpty());
    EXPECT_FALSE(controller->overlay().hoveredNode.isValid());
}

TEST_F(InteractionControllerTests, DeleteKeyRemovesNodeWithUndo)
{
    ASSERT_TRUE(graph.connect(aOut, bIn));
    selection.selectNode(a);
    ASSERT_TRUE(key(Qt::Key_Backspace));
    EXPECT_EQ(graph.node(a), nullptr);
    EXPECT_EQ(graph.connectionCount(), 0);

    ASSERT_TRUE(key(Qt::Key_Z, Qt::ControlModifier));
    EXPECT_NE(graph.node(a), nullptr);
    EXPECT_EQ(graph.connectionCount(), 1);
    EXPECT_FALSE(key(Qt::Key_Delete));
}

TEST_F(InteractionControllerTests, WheelBeyondRangeClampsToMin)
{
    const QPointF pivot(200.0, 100.0);
    const QPointF before = viewport.toCanvas(pivot);

    // factor = 1 + (-10 * 0.1) = 0
    ASSERT_TRUE(controller->wheel(WheelEvent{pivot, -10.0, Qt::NoModifier}));
    EXPECT_DOUBLE_EQ(viewport.zoom(), 0.2);
    const QPointF after = viewport.toCanvas(pivot);
    EXPECT_NEAR(after.x(), before.x(), 1e-9);
    EXPECT_NEAR(after.y(), before.y(), 1e-9);

    viewport.setZoom(1.0);
    ASSERT_TRUE(controller->wheel(WheelEvent{pivot, -25.0, Qt::NoModifier}));
    EXPECT_DOUBLE_EQ(viewport.zoom(), 0.2);
}

TEST_F(InteractionControllerTests, OnlyTheStartingButtonEndsAGesture)
{
    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    move(QPointF(110.0, 60.0));
    EXPECT_FALSE(release(QPointF(110.0, 60.0), PointerButton::Right));
    EXPECT_EQ(controller->state(), InteractionController::State::DraggingNode);
    EXPECT_EQ(commands.undoCount(), 0);

    move(QPointF(120.0, 70.0));
    EXPECT_TRUE(release(QPointF(120.0, 70.0)));
    EXPECT_EQ(controller->state(), InteractionController::State::Idle);
    EXPECT_EQ(graph.node(a)->position, QPointF(60.0, 60.0));
    EXPECT_EQ(commands.undoCount(), 1);

    ASSERT_TRUE(press(QPointF(500.0, 300.0), PointerButton::Middle));
    move(QPointF(520.0, 310.0));
    EXPECT_FALSE(release(QPointF(520.0, 310.0), PointerButton::Left));
    EXPECT_EQ(controller->state(), InteractionController::State::Panning);
    EXPECT_TRUE(release(QPointF(520.0, 310.0), PointerButton::Middle));
    EXPECT_EQ(controller->state(), InteractionController::State::Idle);
    EXPECT_EQ(viewport.pan(), QPointF(20.0, 10.0));
}

TEST_F(InteractionControllerTests, CopyPasteCreatesOffsetCopies)
{
    ASSERT_TRUE(graph.connect(aOut, bIn));
    EXPECT_FALSE(key(Qt::Key_V, Qt::ControlModifier));
    EXPECT_FALSE(key(Qt::Key_C, Qt::ControlModifier));

    selection.setSelectedNodes(QSet<NodeId>{a, b});
    ASSERT_TRUE(key(Qt::Key_C, Qt::ControlModifier));
    EXPECT_TRUE(controller->hasClipboard());

    ASSERT_TRUE(key(Qt::Key_V, Qt::ControlModifier));
    ASSERT_EQ(graph.nodeCount(), 4);
    EXPECT_EQ(graph.connectionCount(), 2);

    const std::vector<NodeId> ids = graph.nodeIds();
    EXPECT_EQ(graph.node(ids.at(2))->position, QPointF(50.0, 50.0));
    EXPECT_EQ(graph.node(ids.at(3))->position, QPointF(350.0, 50.0));
    EXPECT_EQ(selection.selectedNodes(), (QSet<NodeId>{ids.at(2), ids.at(3)}));

    ASSERT_TRUE(key(Qt::Key_V, Qt::ControlModifier));
    ASSERT_EQ(graph.nodeCount(), 6);
    EXPECT_EQ(graph.node(graph.nodeIds().at(4))->position, QPointF(100.0, 100.0));

    ASSERT_TRUE(key(Qt::Key_Z, Qt::ControlModifier));
    EXPECT_EQ(graph.nodeCount(), 4);
    EXPECT_EQ(graph.connectionCount(), 2);
    EXPECT_TRUE(selection.isEmpty());
}

TEST_F(InteractionControllerTests, PastedCopyDropsConnectionsLeavingTheSelection)
{
    ASSERT_TRUE(graph.connect(aOut, bIn));
    selection.selectNode(a);
    ASSERT_TRUE(key(Qt::Key_C, Qt::ControlModifier));
    ASSERT_TRUE(key(Qt::Key_V, Qt::ControlModifier));

    EXPECT_EQ(graph.nodeCount(), 3);
    EXPECT_EQ(graph.connectionCount(), 1);
    const Node* copy = graph.node(graph.nodeIds().back());
    ASSERT_EQ(copy->outputs.size(), 1u);
    EXPECT_FALSE(graph.isOccupied(copy->outputs.front()));
}

TEST_F(InteractionControllerTests, DuplicateLeavesClipboardAlone)
{
    EXPECT_FALSE(key(Qt::Key_D, Qt::ControlModifier));

    selection.selectNode(b);
    ASSERT_TRUE(key(Qt::Key_D, Qt::ControlModifier));
    ASSERT_EQ(graph.nodeCount(), 3);
    const NodeId copy = graph.nodeIds().back();
    EXPECT_EQ(graph.node(copy)->position, QPointF(350.0, 50.0));
    EXPECT_EQ(selection.singleNode(), copy);
    EXPECT_FALSE(controller->hasClipboard());

    ASSERT_TRUE(key(Qt::Key_Z, Qt::ControlModifier));
    EXPECT_EQ(graph.nodeCount(), 2);
}

TEST_F(InteractionControllerTests, ResetViewAndDisplayToggles)
{
    viewport.setZoom(2.0);
    viewport.setPan(QPointF(-120.0, 45.0));
    ASSERT_TRUE(key(Qt::Key_R));
    EXPECT_DOUBLE_EQ(viewport.zoom(), 1.0);
    EXPECT_EQ(viewport.pan(), QPointF(0.0, 0.0));

    const bool grid = controller->config().behavior.showGrid;
    ASSERT_TRUE(key(Qt::Key_G));
    EXPECT_EQ(controller->config().behavior.showGrid, !grid);
    ASSERT_TRUE(key(Qt::Key_G));
    EXPECT_EQ(controller->config().behavior.showGrid, grid);

    ASSERT_FALSE(controller->config().behavior.snapToGrid);
    ASSERT_TRUE(key(Qt::Key_S));
    EXPECT_TRUE(controller->config().behavior.snapToGrid);
    ASSERT_TRUE(press(QPointF(60.0, 10.0)));
    move(QPointF(73.0, 38.0));
    EXPECT_EQ(graph.node(a)->position, QPointF(20.0, 20.0));
    release(QPointF(73.0, 38.0));
}

TEST_F(InteractionControllerTests, BoxDragSelectsInsideAndStraddlingNodes)
{
    // a straddles the box edge, b stays outside, n sits fully inside.
    ASSERT_TRUE(graph.moveNode(a, QPointF(80.0, 60.0)));
    const NodeId n = graph.addNode(QPointF(20.0, 20.0), NodePayload{}, QSizeF(50.0, 50.0));

    ASSERT_TRUE(press(QPointF(0.0, 0.0)));
    ASSERT_EQ(controller->state(), InteractionController::State::BoxSelecting);
    move(QPointF(100.0, 100.0));
    ASSERT_TRUE(release(QPointF(100.0, 100.0)));

    EXPECT_EQ(selection.selectedNodes(), (QSet<NodeId>{n, a}));
    EXPECT_FALSE(selection.isSelected(b));
}
