// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/GraphError.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QString>

namespace NodeEditor {

class GraphStore;

class NODEEDITOR_EXPORT GraphCommand
{
public:
    virtual ~GraphCommand() = default;

    virtual QString name() const = 0;

    virtual GraphResult<void> apply(GraphStore& graph) = 0;

    virtual GraphResult<void> revert(GraphStore& graph) = 0;
};

} // namespace NodeEditor
