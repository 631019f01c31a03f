// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSizeF>
#include <QtCore/QString>
#include <QtCore/QVariantMap>

#include <vector>

namespace NodeEditor {

// Opaque to the graph store. Properties are an open key-value mapping so node
// libraries can grow without touching the model.
struct NODEEDITOR_EXPORT NodePayload final {
    QString title;
    QString typeTag;
    QString category{QStringLiteral("General")};
    QVariantMap properties;

    friend bool operator==(const NodePayload&, const NodePayload&) = default;
};

struct NODEEDITOR_EXPORT Node final {
    NodeId id{};
    QPointF position;
    QSizeF size;
    std::vector<SocketId> inputs;
    std::vector<SocketId> outputs;
    NodePayload payload;

    QRectF bounds() const { return QRectF(position, size); }
    bool contains(const QPointF& canvasPos) const { return bounds().contains(canvasPos); }
};

} // namespace NodeEditor
