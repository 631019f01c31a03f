// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/Node.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"
#include "nodeeditor/Socket.hpp"

#include <QtCore/QPointF>
#include <QtCore/QSizeF>
#include <QtCore/QString>

#include <optional>
#include <vector>

namespace NodeEditor {

struct NODEEDITOR_EXPORT SocketRecord final {
    SocketId id{};
    SocketDirection direction{SocketDirection::Input};
    QString typeTag;
    QString label;
};

struct NODEEDITOR_EXPORT NodeRecord final {
    NodeId id{};
    QPointF position;
    QSizeF size;
    NodePayload payload;
    std::vector<SocketRecord> inputs;
    std::vector<SocketRecord> outputs;
};

struct NODEEDITOR_EXPORT ConnectionRecord final {
    ConnectionId id{};
    SocketId source{};
    SocketId target{};
    std::optional<double> controlOffsetHint;
};

// Id-preserving, toolkit-neutral form of a graph or graph fragment. Used for
// export/import and for undoing deletions.
struct NODEEDITOR_EXPORT GraphSnapshot final {
    std::vector<NodeRecord> nodes;
    std::vector<ConnectionRecord> connections;

    bool isEmpty() const noexcept { return nodes.empty() && connections.empty(); }
};

} // namespace NodeEditor
