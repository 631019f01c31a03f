// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/GraphError.hpp"
#include "nodeeditor/GraphSnapshot.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>

namespace NodeEditor {

class ViewportTransform;

// JSON form of a graph snapshot, optionally with the viewport's pan and zoom.
class NODEEDITOR_EXPORT GraphJsonSerializer final
{
public:
    static constexpr int kSchemaVersion = 1;

    static QJsonObject serialize(const GraphSnapshot& snapshot, const ViewportTransform* view = nullptr);

    // Structural problems are collected and reported together as one
    // MalformedGraph error. The view is only touched on success.
    static GraphResult<GraphSnapshot> deserialize(const QJsonObject& json, ViewportTransform* view = nullptr);

    static QByteArray toBytes(const GraphSnapshot& snapshot, const ViewportTransform* view = nullptr);
    static GraphResult<GraphSnapshot> fromBytes(const QByteArray& bytes, ViewportTransform* view = nullptr);
};

} // namespace NodeEditor
