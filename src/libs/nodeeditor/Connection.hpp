// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"

#include <optional>

namespace NodeEditor {

struct NODEEDITOR_EXPORT Connection final {
    ConnectionId id{};
    SocketId source{}; // always an output socket
    SocketId target{}; // always an input socket

    // Horizontal control point offset in canvas units. When unset the curve
    // derives it from the endpoint distance.
    std::optional<double> controlOffsetHint;
};

} // namespace NodeEditor
