// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/GraphError.hpp"
#include "nodeeditor/InteractionOverlay.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>

#include <optional>
#include <utility>

namespace NodeEditor {
class GraphCommandManager;
class GraphStore;
}

namespace NodeEditor::Controllers {

// Drags a wire out of a socket. Dragging may start on either end; the
// connection is oriented output to input when it is committed.
class LinkingController final
{
public:
    LinkingController(GraphStore* graph, GraphCommandManager* commands);

    bool isActive() const noexcept { return m_preview.has_value(); }
    const std::optional<ConnectionPreview>& preview() const noexcept { return m_preview; }

    bool begin(SocketId origin, const QPointF& canvasPos);
    void update(const QPointF& canvasPos, double hitRadius);
    // Fails with NotFound when released away from any socket.
    GraphResult<ConnectionId> commit(const QPointF& canvasPos, double hitRadius);
    void cancel();

private:
    GraphResult<void> check(SocketId candidate) const;
    std::pair<SocketId, SocketId> oriented(SocketId candidate) const;

    GraphStore* m_graph = nullptr;
    GraphCommandManager* m_commands = nullptr;
    std::optional<ConnectionPreview> m_preview;
};

} // namespace NodeEditor::Controllers
