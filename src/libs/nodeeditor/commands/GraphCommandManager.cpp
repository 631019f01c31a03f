// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/commands/GraphCommandManager.hpp"

#include "nodeeditor/GraphStore.hpp"

#include <QtCore/QDebug>

#include <algorithm>
#include <utility>

namespace NodeEditor {

GraphCommandManager::GraphCommandManager(GraphStore* graph, int maxSteps)
    : m_graph(graph)
    , m_maxSteps(std::max(0, maxSteps))
{}

GraphResult<void> GraphCommandManager::execute(std::unique_ptr<GraphCommand> cmd)
{
    if (!m_graph || !cmd)
        return graphError(GraphErrorCode::NotFound, QStringLiteral("no graph or command"));

    if (auto ok = cmd->apply(*m_graph); !ok)
        return ok;

    qCDebug(nodeeditorlog) << "GraphCommandManager: executed" << cmd->name();
    m_undo.emplace_back(std::move(cmd));
    m_redo.clear();
    trim();
    return {};
}

bool GraphCommandManager::canUndo() const noexcept { return !m_undo.empty(); }
bool GraphCommandManager::canRedo() const noexcept { return !m_redo.empty(); }

bool GraphCommandManager::undo()
{
    if (!m_graph || m_undo.empty())
        return false;

    auto cmd = std::move(m_undo.back());
    m_undo.pop_back();

    if (auto ok = cmd->revert(*m_graph); !ok) {
        qCWarning(nodeeditorlog) << "GraphCommandManager: undo of" << cmd->name()
                                 << "failed:" << ok.error().toString();
        return false;
    }

    m_redo.emplace_back(std::move(cmd));
    return true;
}

bool GraphCommandManager::redo()
{
    if (!m_graph || m_redo.empty())
        return false;

    auto cmd = std::move(m_redo.back());
    m_redo.pop_back();

    if (auto ok = cmd->apply(*m_graph); !ok) {
        qCWarning(nodeeditorlog) << "GraphCommandManager: redo of" << cmd->name()
                                 << "failed:" << ok.error().toString();
        return false;
    }

    m_undo.emplace_back(std::move(cmd));
    return true;
}

void GraphCommandManager::setMaxSteps(int maxSteps)
{
    m_maxSteps = std::max(0, maxSteps);
    trim();
}

void GraphCommandManager::clear()
{
    m_undo.clear();
    m_redo.clear();
}

void GraphCommandManager::trim()
{
    while (static_cast<int>(m_undo.size()) > m_maxSteps)
        m_undo.pop_front();
}

} // namespace NodeEditor
