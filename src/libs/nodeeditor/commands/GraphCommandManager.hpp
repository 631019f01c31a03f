// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/GraphError.hpp"
#include "nodeeditor/NodeEditorConstants.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/commands/GraphCommand.hpp"

#include <deque>
#include <memory>
#include <vector>

namespace NodeEditor {

class GraphStore;

class NODEEDITOR_EXPORT GraphCommandManager final
{
public:
    explicit GraphCommandManager(GraphStore* graph, int maxSteps = Constants::kMaxUndoSteps);

    GraphResult<void> execute(std::unique_ptr<GraphCommand> cmd);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;
    int undoCount() const noexcept { return static_cast<int>(m_undo.size()); }
    int redoCount() const noexcept { return static_cast<int>(m_redo.size()); }

    bool undo();
    bool redo();

    // Zero keeps no history at all.
    void setMaxSteps(int maxSteps);
    int maxSteps() const noexcept { return m_maxSteps; }

    void clear();

private:
    void trim();

    GraphStore* m_graph = nullptr;
    int m_maxSteps = Constants::kMaxUndoSteps;
    std::deque<std::unique_ptr<GraphCommand>> m_undo;
    std::vector<std::unique_ptr<GraphCommand>> m_redo;
};

} // namespace NodeEditor
