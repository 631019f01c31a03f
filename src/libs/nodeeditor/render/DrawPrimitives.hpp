// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QString>
#include <QtCore/QVector>
#include <QtCore/Qt>
#include <QtGui/QColor>

#include <variant>

namespace NodeEditor {

// Screen-space drawing commands. A transparent fill or stroke is not drawn.

struct RectPrimitive final {
    QRectF rect;
    QColor fill;
    QColor stroke;
    double strokeWidth = 0.0;
    double cornerRadius = 0.0;
};

struct EllipsePrimitive final {
    QPointF center;
    double radius = 0.0;
    QColor fill;
    QColor stroke;
    double strokeWidth = 0.0;
};

struct LinePrimitive final {
    QPointF from;
    QPointF to;
    QColor color;
    double width = 1.0;
};

struct BezierPrimitive final {
    QPointF p0;
    QPointF p1;
    QPointF p2;
    QPointF p3;
    QColor color;
    double width = 1.0;
};

struct TextPrimitive final {
    QRectF box;
    QString text;
    QColor color;
    double pointSize = 10.0;
    Qt::Alignment alignment = Qt::AlignLeft | Qt::AlignVCenter;
};

using DrawPrimitive = std::variant<RectPrimitive, EllipsePrimitive, LinePrimitive, BezierPrimitive, TextPrimitive>;
using DrawList = QVector<DrawPrimitive>;

} // namespace NodeEditor
