// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/controllers/InteractionController.hpp"

#include "nodeeditor/SelectionModel.hpp"
#include "nodeeditor/ViewportTransform.hpp"
#include "nodeeditor/commands/GraphCommandManager.hpp"
#include "nodeeditor/commands/GraphCommands.hpp"
#include "nodeeditor/controllers/BoxSelectionController.hpp"
#include "nodeeditor/controllers/InteractionHelpers.hpp"
#include "nodeeditor/controllers/LinkingController.hpp"
#include "nodeeditor/controllers/NodeDragController.hpp"

#include <QtCore/QDebug>

namespace NodeEditor {

InteractionController::InteractionController(GraphStore& graph,
                                             ViewportTransform& viewport,
                                             SelectionModel& selection,
                                             GraphCommandManager& commands,
                                             const NodeEditorConfig& config)
    : m_graph(graph)
    , m_viewport(viewport)
    , m_selection(selection)
    , m_commands(commands)
    , m_drag(std::make_unique<Controllers::NodeDragController>(&graph, &selection, &commands))
    , m_linking(std::make_unique<Controllers::LinkingController>(&graph, &commands))
    , m_box(std::make_unique<Controllers::BoxSelectionController>(&graph, &selection))
{
    setConfig(config);
    m_graphListener = m_graph.addListener([this](const GraphChange& change) { onGraphChanged(change); });
}

InteractionController::~InteractionController()
{
    m_graph.removeListener(m_graphListener);
}

void InteractionController::setConfig(const NodeEditorConfig& config)
{
    m_config = config.validated();
    m_viewport.setZoomRange(m_config.behavior.minZoom, m_config.behavior.maxZoom);
    m_commands.setMaxSteps(m_config.interaction.maxUndoSteps);
}

bool InteractionController::pointerDown(const PointerEvent& ev)
{
    if (m_state != State::Idle)
        return false;
    const bool consumed = beginPress(ev);
    if (m_state != State::Idle)
        m_gestureButton = ev.button;
    return consumed;
}

bool InteractionController::beginPress(const PointerEvent& ev)
{
    const auto& behavior = m_config.behavior;
    const bool panGesture = ev.button == PointerButton::Middle
                            || (ev.button == PointerButton::Left && ev.modifiers.testFlag(Qt::AltModifier));
    if (panGesture) {
        if (!behavior.panEnabled)
            return false;
        m_panStartPointer = ev.pos;
        m_panStartPan = m_viewport.pan();
        m_state = State::Panning;
        return true;
    }

    if (ev.button != PointerButton::Left)
        return false;

    const QPointF canvasPos = m_viewport.toCanvas(ev.pos);

    if (const auto socket = m_graph.findSocketAt(canvasPos, socketHitRadius())) {
        if (m_linking->begin(*socket, canvasPos)) {
            m_state = State::DraggingConnection;
            return true;
        }
    }

    if (const auto node = m_graph.nodeAt(canvasPos)) {
        if (Controllers::Detail::isAdditive(ev.modifiers) && behavior.allowMultipleSelection) {
            m_selection.toggleNode(*node);
            if (!m_selection.isSelected(*node))
                return true;
        } else if (!m_selection.isSelected(*node)) {
            m_selection.selectNode(*node);
        }

        if (m_drag->begin(*node, canvasPos))
            m_state = State::DraggingNode;
        return true;
    }

    const double tolerance = m_config.layout.connectionSelectionTolerance / m_viewport.zoom();
    if (const auto conn = Controllers::Detail::pickConnection(m_graph, m_config.layout, canvasPos, tolerance)) {
        if (Controllers::Detail::isAdditive(ev.modifiers) && behavior.allowMultipleSelection)
            m_selection.toggleConnection(*conn);
        else
            m_selection.selectConnection(*conn);
        return true;
    }

    if (behavior.rectangleSelectionEnabled) {
        m_box->begin(canvasPos, behavior.allowMultipleSelection ? ev.modifiers : Qt::NoModifier);
        m_state = State::BoxSelecting;
        return true;
    }

    if (!Controllers::Detail::isAdditive(ev.modifiers))
        m_selection.clear();
    return true;
}

bool InteractionController::pointerMove(const PointerEvent& ev)
{
    const QPointF canvasPos = m_viewport.toCanvas(ev.pos);

    switch (m_state) {
    case State::Idle:
        updateHover(canvasPos);
        return false;
    case State::DraggingNode:
        m_drag->update(canvasPos, m_config.behavior.snapToGrid ? m_config.layout.gridSize : 0.0);
        return true;
    case State::DraggingConnection:
        m_linking->update(canvasPos, socketHitRadius());
        return true;
    case State::BoxSelecting:
        m_box->update(canvasPos);
        return true;
    case State::Panning:
        m_viewport.setPan(m_panStartPan + (ev.pos - m_panStartPointer) * m_config.interaction.panSpeed);
        return true;
    }
    return false;
}

bool InteractionController::pointerUp(const PointerEvent& ev)
{
    // Only the button that started the gesture ends it.
    if (m_state != State::Idle && ev.button != m_gestureButton)
        return false;

    const QPointF canvasPos = m_viewport.toCanvas(ev.pos);
    const State finished = m_state;
    m_state = State::Idle;
    m_gestureButton = PointerButton::None;

    switch (finished) {
    case State::Idle:
        return false;
    case State::DraggingNode:
        if (auto ok = m_drag->commit(); !ok)
            qCWarning(nodeeditorlog) << "InteractionController: move failed:" << ok.error().toString();
        break;
    case State::DraggingConnection:
        if (auto created = m_linking->commit(canvasPos, socketHitRadius()); !created)
            qCInfo(nodeeditorlog) << "InteractionController: connection discarded:" << created.error().toString();
        break;
    case State::BoxSelecting:
        m_box->commit(canvasPos, m_config.behavior.allowMultipleSelection);
        break;
    case State::Panning:
        break;
    }

    updateHover(canvasPos);
    return true;
}

bool InteractionController::wheel(const WheelEvent& ev)
{
    if (m_state != State::Idle || !m_config.behavior.zoomEnabled)
        return false;

    const double factor = 1.0 + ev.notches * m_config.interaction.scrollZoomSpeed;
    if (factor <= 0.0)
        m_viewport.zoomAt(ev.pos, m_viewport.minZoom());
    else
        m_viewport.zoomBy(ev.pos, factor);
    return true;
}

bool InteractionController::keyDown(const KeyEvent& ev)
{
    if (ev.key == Qt::Key_Escape)
        return cancel();
    if (m_state != State::Idle)
        return false;

    const bool ctrl = ev.modifiers.testFlag(Qt::ControlModifier);
    const bool shift = ev.modifiers.testFlag(Qt::ShiftModifier);

    switch (ev.key) {
    case Qt::Key_Delete:
    case Qt::Key_Backspace:
        return deleteSelection();
    case Qt::Key_A:
        if (!ctrl)
            return false;
        selectAll();
        return true;
    case Qt::Key_F:
        if (ctrl)
            return false;
        return frameAll();
    case Qt::Key_R:
        if (ctrl)
            return false;
        resetView();
        return true;
    case Qt::Key_G:
        if (ctrl)
            return false;
        toggleGrid();
        return true;
    case Qt::Key_S:
        if (ctrl)
            return false;
        toggleSnapToGrid();
        return true;
    case Qt::Key_C:
        if (!ctrl)
            return false;
        return copySelection();
    case Qt::Key_V:
        if (!ctrl)
            return false;
        return paste();
    case Qt::Key_D:
        if (!ctrl)
            return false;
        return duplicateSelection();
    case Qt::Key_Z:
        if (!ctrl)
            return false;
        return shift ? redo() : undo();
    case Qt::Key_Y:
        if (!ctrl)
            return false;
        return redo();
    default:
        return false;
    }
}

bool InteractionController::cancel()
{
    switch (m_state) {
    case State::Idle:
        return false;
    case State::DraggingNode:
        m_drag->cancel();
        break;
    case State::DraggingConnection:
        m_linking->cancel();
        break;
    case State::BoxSelecting:
        m_box->cancel();
        break;
    case State::Panning:
        m_viewport.setPan(m_panStartPan);
        break;
    }
    m_state = State::Idle;
    m_gestureButton = PointerButton::None;
    return true;
}

InteractionOverlay InteractionController::overlay() const
{
    InteractionOverlay out;
    if (m_state == State::DraggingConnection)
        out.preview = m_linking->preview();
    if (m_state == State::BoxSelecting)
        out.boxCanvas = m_box->rect();
    out.hoveredNode = m_hoveredNode;
    out.hoveredSocket = m_hoveredSocket;
    return out;
}

bool InteractionController::deleteSelection()
{
    if (m_selection.isEmpty())
        return false;

    auto cmd = std::make_unique<RemoveSelectionCommand>(m_selection.selectedNodes(),
                                                        m_selection.selectedConnections());
    if (auto ok = m_commands.execute(std::move(cmd)); !ok) {
        qCWarning(nodeeditorlog) << "InteractionController: delete failed:" << ok.error().toString();
        return false;
    }
    m_selection.clear();
    return true;
}

void InteractionController::selectAll()
{
    if (!m_config.behavior.allowMultipleSelection)
        return;
    m_selection.selectAll(m_graph);
}

bool InteractionController::frameAll()
{
    const QRectF bounds = m_graph.nodesBounds();
    if (bounds.isNull())
        return false;
    return m_viewport.frame(bounds, m_viewportSize, m_config.interaction.framePaddingPx);
}

void InteractionController::resetView()
{
    m_viewport.setZoom(1.0);
    m_viewport.setPan(QPointF(0.0, 0.0));
}

bool InteractionController::copySelection()
{
    const QSet<NodeId> nodes = m_selection.selectedNodes();
    if (nodes.isEmpty())
        return false;

    m_clipboard = m_graph.extract(nodes);
    m_pasteCount = 0;
    qCDebug(nodeeditorlog) << "InteractionController: copied" << m_clipboard.nodes.size() << "nodes";
    return true;
}

bool InteractionController::paste()
{
    if (!hasClipboard())
        return false;
    const double step = Constants::kPasteOffset * (m_pasteCount + 1);
    if (!pasteFragment(m_clipboard, QPointF(step, step)))
        return false;
    ++m_pasteCount;
    return true;
}

bool InteractionController::duplicateSelection()
{
    const QSet<NodeId> nodes = m_selection.selectedNodes();
    if (nodes.isEmpty())
        return false;
    return pasteFragment(m_graph.extract(nodes), QPointF(Constants::kPasteOffset, Constants::kPasteOffset));
}

bool InteractionController::pasteFragment(const GraphSnapshot& fragment, const QPointF& offset)
{
    const std::vector<NodeId> before = m_graph.nodeIds();
    const NodeId newest = before.empty() ? NodeId{} : before.back();

    if (auto ok = m_commands.execute(std::make_unique<PasteNodesCommand>(fragment, offset)); !ok) {
        qCWarning(nodeeditorlog) << "InteractionController: paste failed:" << ok.error().toString();
        return false;
    }

    // Ids only grow, so everything past the previous newest node is the copy.
    QSet<NodeId> pasted;
    for (NodeId id : m_graph.nodeIds()) {
        if (newest < id)
            pasted.insert(id);
    }
    m_selection.setSelectedNodes(pasted);
    return true;
}

void InteractionController::toggleGrid()
{
    m_config.behavior.showGrid = !m_config.behavior.showGrid;
}

void InteractionController::toggleSnapToGrid()
{
    m_config.behavior.snapToGrid = !m_config.behavior.snapToGrid;
}

bool InteractionController::undo()
{
    const bool done = m_commands.undo();
    if (done)
        m_selection.prune(m_graph);
    return done;
}

bool InteractionController::redo()
{
    const bool done = m_commands.redo();
    if (done)
        m_selection.prune(m_graph);
    return done;
}

void InteractionController::updateHover(const QPointF& canvasPos)
{
    const auto socket = m_graph.findSocketAt(canvasPos, socketHitRadius());
    const auto node = m_graph.nodeAt(canvasPos);
    m_hoveredSocket = socket.value_or(SocketId{});
    m_hoveredNode = node.value_or(NodeId{});
}

double InteractionController::socketHitRadius() const
{
    return m_config.interaction.socketHitRadiusPx / m_viewport.zoom();
}

void InteractionController::onGraphChanged(const GraphChange& change)
{
    switch (change.kind) {
    case GraphChange::Kind::NodeRemoved:
    case GraphChange::Kind::ConnectionRemoved:
    case GraphChange::Kind::SocketRemoved:
    case GraphChange::Kind::GraphReset:
        m_selection.prune(m_graph);
        if (m_hoveredNode && !m_graph.node(m_hoveredNode))
            m_hoveredNode = NodeId{};
        if (m_hoveredSocket && !m_graph.socket(m_hoveredSocket))
            m_hoveredSocket = SocketId{};
        break;
    default:
        break;
    }
}

} // namespace NodeEditor
