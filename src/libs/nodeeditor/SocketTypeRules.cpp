// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/SocketTypeRules.hpp"

#include "nodeeditor/NodeEditorConstants.hpp"

namespace NodeEditor {

void SocketTypeRules::declareConversion(const QString& fromType, const QString& toType)
{
    if (fromType.isEmpty() || toType.isEmpty() || fromType == toType)
        return;
    m_conversions[fromType].insert(toType);
}

void SocketTypeRules::removeConversion(const QString& fromType, const QString& toType)
{
    auto it = m_conversions.find(fromType);
    if (it == m_conversions.end())
        return;
    it->remove(toType);
    if (it->isEmpty())
        m_conversions.erase(it);
}

void SocketTypeRules::clearConversions()
{
    m_conversions.clear();
}

bool SocketTypeRules::isWildcard(const QString& typeTag)
{
    return typeTag == QLatin1StringView(Constants::kAnySocketType);
}

bool SocketTypeRules::isCompatible(const QString& outputType, const QString& inputType) const
{
    if (outputType == inputType)
        return true;
    if (isWildcard(outputType) || isWildcard(inputType))
        return true;

    const auto it = m_conversions.constFind(outputType);
    return it != m_conversions.constEnd() && it->contains(inputType);
}

} // namespace NodeEditor
