// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/render/ThemeProvider.hpp"

namespace NodeEditor {

using namespace Qt::StringLiterals;

DefaultThemeProvider::DefaultThemeProvider()
    : m_unknownSocket(128, 128, 128)
{
    m_roles = {
        {ColorRole::Background, QColor(30, 30, 30)},
        {ColorRole::Grid, QColor(40, 40, 40)},
        {ColorRole::NodeBody, QColor(80, 80, 80)},
        {ColorRole::NodeHeader, QColor(60, 60, 60)},
        {ColorRole::NodeBorder, QColor(100, 100, 100)},
        {ColorRole::NodeText, QColor(255, 255, 255)},
        {ColorRole::Selection, QColor(255, 255, 0)},
        {ColorRole::SocketBorder, QColor(200, 200, 200)},
        {ColorRole::SocketHover, QColor(255, 255, 255)},
        {ColorRole::SocketConnected, QColor(255, 255, 0)},
        {ColorRole::SocketLabel, QColor(220, 220, 220)},
        {ColorRole::Connection, QColor(200, 200, 200)},
        {ColorRole::ConnectionSelected, QColor(255, 255, 0)},
        {ColorRole::PreviewConnection, QColor(255, 255, 255, 128)},
        {ColorRole::PreviewRejected, QColor(255, 100, 100)},
        {ColorRole::SelectionRectFill, QColor(100, 150, 255, 64)},
        {ColorRole::SelectionRectBorder, QColor(100, 150, 255)},
    };

    m_socketColors = {
        {u"exec"_s, QColor(255, 255, 255)},
        {u"number"_s, QColor(100, 200, 100)},
        {u"string"_s, QColor(200, 100, 100)},
        {u"boolean"_s, QColor(200, 200, 100)},
        {u"vector"_s, QColor(100, 100, 200)},
        {u"color"_s, QColor(200, 100, 200)},
        {u"object"_s, QColor(150, 150, 150)},
        {u"any"_s, QColor(100, 100, 100)},
    };
}

QColor DefaultThemeProvider::color(ColorRole role) const
{
    return m_roles.value(role, QColor(255, 255, 255));
}

QColor DefaultThemeProvider::socketColor(const QString& typeTag) const
{
    return m_socketColors.value(typeTag, m_unknownSocket);
}

void DefaultThemeProvider::setColor(ColorRole role, const QColor& color)
{
    m_roles.insert(role, color);
}

void DefaultThemeProvider::setSocketColor(const QString& typeTag, const QColor& color)
{
    m_socketColors.insert(typeTag, color);
}

void DefaultThemeProvider::setFontPointSize(double size)
{
    if (size > 0.0)
        m_fontPointSize = size;
}

} // namespace NodeEditor
