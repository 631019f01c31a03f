// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QSet>
#include <QtCore/QString>

namespace NodeEditor {

// Decides whether an output of one type tag may feed an input of another.
// Equal tags and the "any" wildcard are always compatible; further pairs can be
// declared as one-way conversions.
class NODEEDITOR_EXPORT SocketTypeRules final
{
public:
    void declareConversion(const QString& fromType, const QString& toType);
    void removeConversion(const QString& fromType, const QString& toType);
    void clearConversions();

    bool isCompatible(const QString& outputType, const QString& inputType) const;

    static bool isWildcard(const QString& typeTag);

private:
    QHash<QString, QSet<QString>> m_conversions;
};

} // namespace NodeEditor
