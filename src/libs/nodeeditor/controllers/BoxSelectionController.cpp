// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/controllers/BoxSelectionController.hpp"

#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/SelectionModel.hpp"
#include "nodeeditor/controllers/InteractionHelpers.hpp"

#include <utility>

namespace NodeEditor::Controllers {

BoxSelectionController::BoxSelectionController(GraphStore* graph, SelectionModel* selection)
    : m_graph(graph)
    , m_selection(selection)
{}

void BoxSelectionController::begin(const QPointF& canvasPos, Qt::KeyboardModifiers mods)
{
    m_active = true;
    m_anchor = canvasPos;
    m_rect = QRectF(canvasPos, canvasPos);
    m_baseSelection.clear();
    if (m_selection && Detail::isAdditive(mods))
        m_baseSelection = m_selection->selectedNodes();
}

void BoxSelectionController::update(const QPointF& canvasPos)
{
    if (!m_active)
        return;
    m_rect = QRectF(m_anchor, canvasPos).normalized();
}

void BoxSelectionController::commit(const QPointF& canvasPos, bool allowMultiple)
{
    if (!m_active)
        return;
    update(canvasPos);

    if (m_graph && m_selection) {
        QSet<NodeId> hits = m_graph->nodesInRect(m_rect);
        if (!allowMultiple) {
            NodeId top{};
            for (NodeId id : std::as_const(hits)) {
                if (top < id)
                    top = id;
            }
            hits.clear();
            if (top)
                hits.insert(top);
            m_selection->setSelectedNodes(hits);
        } else {
            m_selection->setSelectedNodes(m_baseSelection | hits);
        }
    }
    cancel();
}

void BoxSelectionController::cancel()
{
    m_active = false;
    m_rect = QRectF();
    m_baseSelection.clear();
}

} // namespace NodeEditor::Controllers
