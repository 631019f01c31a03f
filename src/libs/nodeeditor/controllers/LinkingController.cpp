// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/controllers/LinkingController.hpp"

#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/commands/GraphCommandManager.hpp"
#include "nodeeditor/commands/GraphCommands.hpp"

#include <memory>
#include <utility>

namespace NodeEditor::Controllers {

LinkingController::LinkingController(GraphStore* graph, GraphCommandManager* commands)
    : m_graph(graph)
    , m_commands(commands)
{}

bool LinkingController::begin(SocketId origin, const QPointF& canvasPos)
{
    if (!m_graph)
        return false;
    const Socket* s = m_graph->socket(origin);
    const auto pos = m_graph->socketCanvasPos(origin);
    if (!s || !pos)
        return false;

    ConnectionPreview preview;
    preview.origin = origin;
    preview.originIsOutput = s->isOutput();
    preview.originCanvas = *pos;
    preview.cursorCanvas = canvasPos;
    m_preview = preview;
    return true;
}

void LinkingController::update(const QPointF& canvasPos, double hitRadius)
{
    if (!m_preview || !m_graph)
        return;

    m_preview->cursorCanvas = canvasPos;
    m_preview->candidate = SocketId{};
    m_preview->candidateAccepted = false;

    const auto hit = m_graph->findSocketAt(canvasPos, hitRadius);
    if (!hit || *hit == m_preview->origin)
        return;
    m_preview->candidate = *hit;
    m_preview->candidateAccepted = check(*hit).has_value();
}

GraphResult<ConnectionId> LinkingController::commit(const QPointF& canvasPos, double hitRadius)
{
    if (!m_preview || !m_graph)
        return graphError(GraphErrorCode::NotFound, QStringLiteral("no connection drag in progress"));

    const auto hit = m_graph->findSocketAt(canvasPos, hitRadius);
    const auto [output, input] = hit ? oriented(*hit) : std::pair<SocketId, SocketId>{};
    m_preview.reset();

    if (!hit)
        return graphError(GraphErrorCode::NotFound, QStringLiteral("released away from any socket"));

    if (m_commands) {
        if (auto ok = m_commands->execute(std::make_unique<ConnectCommand>(output, input)); !ok)
            return std::unexpected(ok.error());
    } else {
        ConnectCommand cmd(output, input);
        if (auto ok = cmd.apply(*m_graph); !ok)
            return std::unexpected(ok.error());
    }

    const auto created = m_graph->incomingConnection(input);
    if (!created)
        return graphError(GraphErrorCode::NotFound, QStringLiteral("connection vanished after creation"));
    return *created;
}

void LinkingController::cancel()
{
    m_preview.reset();
}

GraphResult<void> LinkingController::check(SocketId candidate) const
{
    const auto [output, input] = oriented(candidate);
    return m_graph->canConnect(output, input);
}

std::pair<SocketId, SocketId> LinkingController::oriented(SocketId candidate) const
{
    if (m_preview && !m_preview->originIsOutput)
        return {candidate, m_preview->origin};
    return {m_preview ? m_preview->origin : SocketId{}, candidate};
}

} // namespace NodeEditor::Controllers
