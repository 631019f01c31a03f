// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditorwidgets/NodeEditorWidgetsGlobal.hpp"

#include <nodeeditor/render/DrawPrimitives.hpp>

class QPainter;

namespace NodeEditor {

// Replays a draw list onto a QPainter.
class NODEEDITORWIDGETS_EXPORT PrimitivePainter final
{
public:
    static void paint(QPainter& painter, const DrawList& list);
};

} // namespace NodeEditor
