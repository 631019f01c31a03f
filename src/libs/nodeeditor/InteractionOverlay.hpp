// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>

#include <optional>

namespace NodeEditor {

// Wire following the pointer while a connection is being dragged.
struct ConnectionPreview final {
    SocketId origin{};
    bool originIsOutput = true;
    QPointF originCanvas;
    QPointF cursorCanvas;
    SocketId candidate{};
    bool candidateAccepted = false;
};

// Transient interaction state the renderer draws on top of the graph.
struct InteractionOverlay final {
    std::optional<ConnectionPreview> preview;
    std::optional<QRectF> boxCanvas;
    NodeId hoveredNode{};
    SocketId hoveredSocket{};
};

} // namespace NodeEditor
