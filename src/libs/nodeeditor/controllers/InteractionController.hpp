// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/InputEvents.hpp"
#include "nodeeditor/InteractionOverlay.hpp"
#include "nodeeditor/NodeEditorConfig.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QSizeF>

#include <memory>

namespace NodeEditor {

class GraphCommandManager;
class SelectionModel;
class ViewportTransform;

namespace Controllers {
class BoxSelectionController;
class LinkingController;
class NodeDragController;
}

// Turns normalized pointer, wheel and key events into graph mutations,
// selection changes and viewport changes. Every handler returns whether the
// event was consumed.
class NODEEDITOR_EXPORT InteractionController final
{
public:
    enum class State : quint8 {
        Idle,
        DraggingNode,
        DraggingConnection,
        BoxSelecting,
        Panning
    };

    InteractionController(GraphStore& graph,
                          ViewportTransform& viewport,
                          SelectionModel& selection,
                          GraphCommandManager& commands,
                          const NodeEditorConfig& config = {});
    ~InteractionController();

    InteractionController(const InteractionController&) = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    State state() const noexcept { return m_state; }

    const NodeEditorConfig& config() const noexcept { return m_config; }
    void setConfig(const NodeEditorConfig& config);

    QSizeF viewportSize() const noexcept { return m_viewportSize; }
    void setViewportSize(const QSizeF& size) { m_viewportSize = size; }

    bool pointerDown(const PointerEvent& ev);
    bool pointerMove(const PointerEvent& ev);
    bool pointerUp(const PointerEvent& ev);
    bool wheel(const WheelEvent& ev);
    bool keyDown(const KeyEvent& ev);

    // Abandons the current gesture and restores the state it started from.
    bool cancel();

    InteractionOverlay overlay() const;

    bool deleteSelection();
    void selectAll();
    bool frameAll();
    void resetView();
    bool undo();
    bool redo();

    // Clipboard holds the selected nodes with the connections between them.
    // Each paste lands one paste offset further from the copied position.
    bool copySelection();
    bool paste();
    bool duplicateSelection();
    bool hasClipboard() const noexcept { return !m_clipboard.nodes.empty(); }

    void toggleGrid();
    void toggleSnapToGrid();

private:
    bool beginPress(const PointerEvent& ev);
    bool pasteFragment(const GraphSnapshot& fragment, const QPointF& offset);
    void updateHover(const QPointF& canvasPos);
    double socketHitRadius() const;
    void onGraphChanged(const GraphChange& change);

    GraphStore& m_graph;
    ViewportTransform& m_viewport;
    SelectionModel& m_selection;
    GraphCommandManager& m_commands;
    NodeEditorConfig m_config;

    State m_state = State::Idle;
    PointerButton m_gestureButton = PointerButton::None;
    QSizeF m_viewportSize;

    std::unique_ptr<Controllers::NodeDragController> m_drag;
    std::unique_ptr<Controllers::LinkingController> m_linking;
    std::unique_ptr<Controllers::BoxSelectionController> m_box;

    QPointF m_panStartPointer;
    QPointF m_panStartPan;

    GraphSnapshot m_clipboard;
    int m_pasteCount = 0;

    NodeId m_hoveredNode{};
    SocketId m_hoveredSocket{};

    GraphStore::ListenerId m_graphListener = 0;
};

} // namespace NodeEditor
