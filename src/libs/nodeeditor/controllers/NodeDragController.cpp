// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/controllers/NodeDragController.hpp"

#include "nodeeditor/ConnectionGeometry.hpp"
#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/SelectionModel.hpp"
#include "nodeeditor/commands/GraphCommandManager.hpp"
#include "nodeeditor/commands/GraphCommands.hpp"

#include <QtCore/QDebug>

#include <memory>

namespace NodeEditor::Controllers {

NodeDragController::NodeDragController(GraphStore* graph,
                                       SelectionModel* selection,
                                       GraphCommandManager* commands)
    : m_graph(graph)
    , m_selection(selection)
    , m_commands(commands)
{}

bool NodeDragController::begin(NodeId node, const QPointF& canvasPos)
{
    if (!m_graph)
        return false;
    const Node* primary = m_graph->node(node);
    if (!primary)
        return false;

    m_dragNodes.clear();
    m_primary = node;
    m_primaryStart = primary->position;
    m_dragOffset = canvasPos - m_primaryStart;

    const bool useSelection = m_selection && m_selection->isSelected(node)
                              && m_selection->selectedNodes().size() > 1;
    if (useSelection) {
        for (NodeId id : m_selection->selectedNodes()) {
            if (const Node* n = m_graph->node(id))
                m_dragNodes.push_back(DragNodeState{id, n->position});
        }
    }
    if (m_dragNodes.empty())
        m_dragNodes.push_back(DragNodeState{node, m_primaryStart});
    return true;
}

void NodeDragController::update(const QPointF& canvasPos, double gridStep)
{
    if (!isActive() || !m_graph)
        return;

    QPointF target = canvasPos - m_dragOffset;
    if (gridStep > 0.0)
        target = Geometry::snap(target, gridStep);
    const QPointF delta = target - m_primaryStart;

    for (const auto& state : m_dragNodes) {
        if (auto ok = m_graph->moveNode(state.node, state.startPos + delta); !ok)
            qCWarning(nodeeditorlog) << "NodeDragController:" << ok.error().toString();
    }
}

GraphResult<void> NodeDragController::commit()
{
    if (!isActive() || !m_graph) {
        reset();
        return {};
    }

    std::vector<NodeMove> moves;
    for (const auto& state : m_dragNodes) {
        const Node* n = m_graph->node(state.node);
        if (!n || n->position == state.startPos)
            continue;
        moves.push_back(NodeMove{state.node, state.startPos, n->position});
    }
    reset();

    if (moves.empty() || !m_commands)
        return {};
    return m_commands->execute(std::make_unique<MoveNodesCommand>(std::move(moves)));
}

void NodeDragController::cancel()
{
    if (isActive() && m_graph) {
        for (const auto& state : m_dragNodes) {
            if (auto ok = m_graph->moveNode(state.node, state.startPos); !ok)
                qCWarning(nodeeditorlog) << "NodeDragController: cancel:" << ok.error().toString();
        }
    }
    reset();
}

void NodeDragController::reset()
{
    m_primary = NodeId{};
    m_dragNodes.clear();
    m_dragOffset = QPointF();
}

} // namespace NodeEditor::Controllers
