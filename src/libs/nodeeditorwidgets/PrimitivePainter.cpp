// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditorwidgets/PrimitivePainter.hpp"

#include <QtGui/QFont>
#include <QtGui/QPainter>
#include <QtGui/QPainterPath>
#include <QtGui/QPen>

#include <variant>

namespace NodeEditor {

namespace {

QPen penFor(const QColor& color, double width)
{
    if (!color.isValid() || color.alpha() == 0 || width <= 0.0)
        return QPen(Qt::NoPen);
    QPen pen(color);
    pen.setWidthF(width);
    pen.setCapStyle(Qt::RoundCap);
    return pen;
}

QBrush brushFor(const QColor& color)
{
    if (!color.isValid() || color.alpha() == 0)
        return QBrush(Qt::NoBrush);
    return QBrush(color);
}

struct PrimitiveVisitor final {
    QPainter& p;

    void operator()(const RectPrimitive& r) const
    {
        p.setPen(penFor(r.stroke, r.strokeWidth));
        p.setBrush(brushFor(r.fill));
        if (r.cornerRadius > 0.0)
            p.drawRoundedRect(r.rect, r.cornerRadius, r.cornerRadius);
        else
            p.drawRect(r.rect);
    }

    void operator()(const EllipsePrimitive& e) const
    {
        p.setPen(penFor(e.stroke, e.strokeWidth));
        p.setBrush(brushFor(e.fill));
        p.drawEllipse(e.center, e.radius, e.radius);
    }

    void operator()(const LinePrimitive& l) const
    {
        p.setPen(penFor(l.color, l.width));
        p.drawLine(l.from, l.to);
    }

    void operator()(const BezierPrimitive& b) const
    {
        QPainterPath path(b.p0);
        path.cubicTo(b.p1, b.p2, b.p3);
        p.setPen(penFor(b.color, b.width));
        p.setBrush(Qt::NoBrush);
        p.drawPath(path);
    }

    void operator()(const TextPrimitive& t) const
    {
        if (t.pointSize <= 0.0 || t.box.isEmpty())
            return;
        QFont font = p.font();
        font.setPointSizeF(t.pointSize);
        p.setFont(font);
        p.setPen(t.color);
        const QString elided = p.fontMetrics().elidedText(t.text, Qt::ElideRight, qRound(t.box.width()));
        p.drawText(t.box, static_cast<int>(t.alignment), elided);
    }
};

} // namespace

void PrimitivePainter::paint(QPainter& painter, const DrawList& list)
{
    painter.save();
    const PrimitiveVisitor visitor{painter};
    for (const DrawPrimitive& prim : list)
        std::visit(visitor, prim);
    painter.restore();
}

} // namespace NodeEditor
