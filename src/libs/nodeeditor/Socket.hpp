// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QString>

namespace NodeEditor {

enum class SocketDirection : quint8 {
    Input,
    Output
};

struct NODEEDITOR_EXPORT Socket final {
    SocketId id{};
    NodeId node{};
    SocketDirection direction{SocketDirection::Input};
    QString typeTag;
    QString label;

    // Relative to the owning node's top-left corner.
    QPointF offset;

    bool isInput() const noexcept { return direction == SocketDirection::Input; }
    bool isOutput() const noexcept { return direction == SocketDirection::Output; }
};

} // namespace NodeEditor
