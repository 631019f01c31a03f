// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QPointF>
#include <QtCore/Qt>

namespace NodeEditor {

// Toolkit-neutral input. Positions are in screen pixels relative to the
// editor's top-left corner.

enum class PointerButton : quint8 {
    None,
    Left,
    Middle,
    Right
};

struct PointerEvent final {
    QPointF pos;
    PointerButton button = PointerButton::None;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

struct WheelEvent final {
    QPointF pos;
    double notches = 0.0; // positive scrolls away from the user
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

struct KeyEvent final {
    int key = 0; // Qt::Key
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

} // namespace NodeEditor
