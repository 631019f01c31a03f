// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/Qt>

#include <optional>

namespace NodeEditor {
class GraphStore;
struct LayoutConfig;
}

namespace NodeEditor::Controllers::Detail {

// Connection whose curve passes within `tolerance` canvas units of the point.
// The nearest one wins; ties go to the lowest id.
std::optional<ConnectionId> pickConnection(const GraphStore& graph,
                                           const LayoutConfig& layout,
                                           const QPointF& canvasPos,
                                           double tolerance);

inline bool isAdditive(Qt::KeyboardModifiers mods)
{
    return mods.testFlag(Qt::ShiftModifier) || mods.testFlag(Qt::ControlModifier);
}

} // namespace NodeEditor::Controllers::Detail
