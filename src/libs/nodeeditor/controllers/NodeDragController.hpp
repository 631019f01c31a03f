// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/GraphError.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>

#include <vector>

namespace NodeEditor {
class GraphCommandManager;
class GraphStore;
class SelectionModel;
}

namespace NodeEditor::Controllers {

// Moves the pressed node, and every other selected node with it, by the same
// delta. Positions are live during the drag; the commit records one undo step.
class NodeDragController final
{
public:
    NodeDragController(GraphStore* graph, SelectionModel* selection, GraphCommandManager* commands);

    bool isActive() const noexcept { return m_primary.isValid(); }
    NodeId primary() const noexcept { return m_primary; }
    QPointF dragOffset() const noexcept { return m_dragOffset; }

    bool begin(NodeId node, const QPointF& canvasPos);
    // gridStep <= 0 disables snapping.
    void update(const QPointF& canvasPos, double gridStep);
    GraphResult<void> commit();
    void cancel();

private:
    struct DragNodeState final {
        NodeId node{};
        QPointF startPos;
    };

    void reset();

    GraphStore* m_graph = nullptr;
    SelectionModel* m_selection = nullptr;
    GraphCommandManager* m_commands = nullptr;

    NodeId m_primary{};
    QPointF m_primaryStart;
    QPointF m_dragOffset;
    std::vector<DragNodeState> m_dragNodes;
};

} // namespace NodeEditor::Controllers
