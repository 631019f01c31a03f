// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtGui/QColor>

namespace NodeEditor {

enum class ColorRole : quint8 {
    Background,
    Grid,
    NodeBody,
    NodeHeader,
    NodeBorder,
    NodeText,
    Selection,
    SocketBorder,
    SocketHover,
    SocketConnected,
    SocketLabel,
    Connection,
    ConnectionSelected,
    PreviewConnection,
    PreviewRejected,
    SelectionRectFill,
    SelectionRectBorder
};

class NODEEDITOR_EXPORT IThemeProvider
{
public:
    virtual ~IThemeProvider() = default;

    virtual QColor color(ColorRole role) const = 0;
    virtual QColor socketColor(const QString& typeTag) const = 0;
    virtual double fontPointSize() const = 0;
};

class NODEEDITOR_EXPORT DefaultThemeProvider final : public IThemeProvider
{
public:
    DefaultThemeProvider();

    QColor color(ColorRole role) const override;
    QColor socketColor(const QString& typeTag) const override;
    double fontPointSize() const override { return m_fontPointSize; }

    void setColor(ColorRole role, const QColor& color);
    void setSocketColor(const QString& typeTag, const QColor& color);
    void setFontPointSize(double size);

private:
    QMap<ColorRole, QColor> m_roles;
    QHash<QString, QColor> m_socketColors;
    QColor m_unknownSocket;
    double m_fontPointSize = 10.0;
};

} // namespace NodeEditor
