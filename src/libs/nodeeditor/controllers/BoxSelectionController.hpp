// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSet>
#include <QtCore/Qt>

namespace NodeEditor {
class GraphStore;
class SelectionModel;
}

namespace NodeEditor::Controllers {

class BoxSelectionController final
{
public:
    BoxSelectionController(GraphStore* graph, SelectionModel* selection);

    bool isActive() const noexcept { return m_active; }
    QRectF rect() const noexcept { return m_rect; }

    void begin(const QPointF& canvasPos, Qt::KeyboardModifiers mods);
    void update(const QPointF& canvasPos);
    // Applies the selection. Only the topmost hit is kept when multiple
    // selection is disabled.
    void commit(const QPointF& canvasPos, bool allowMultiple);
    void cancel();

private:
    GraphStore* m_graph = nullptr;
    SelectionModel* m_selection = nullptr;

    bool m_active = false;
    QPointF m_anchor;
    QRectF m_rect;
    QSet<NodeId> m_baseSelection;
};

} // namespace NodeEditor::Controllers
