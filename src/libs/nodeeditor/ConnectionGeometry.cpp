// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/ConnectionGeometry.hpp"

#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/NodeEditorConfig.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace NodeEditor {

QPointF BezierCurve::pointAt(double t) const
{
    const double u = 1.0 - t;
    return p0 * (u * u * u)
         + p1 * (3.0 * u * u * t)
         + p2 * (3.0 * u * t * t)
         + p3 * (t * t * t);
}

QRectF BezierCurve::controlBounds() const
{
    const double left = std::min({p0.x(), p1.x(), p2.x(), p3.x()});
    const double right = std::max({p0.x(), p1.x(), p2.x(), p3.x()});
    const double top = std::min({p0.y(), p1.y(), p2.y(), p3.y()});
    const double bottom = std::max({p0.y(), p1.y(), p2.y(), p3.y()});
    return QRectF(QPointF(left, top), QPointF(right, bottom));
}

namespace Geometry {

BezierCurve connectionCurve(const QPointF& start, const QPointF& end, double offsetRatio, double minOffset)
{
    const double dx = std::abs(end.x() - start.x());
    return connectionCurveWithOffset(start, end, std::max(minOffset, dx * offsetRatio));
}

BezierCurve connectionCurveWithOffset(const QPointF& start, const QPointF& end, double offset)
{
    BezierCurve c;
    c.p0 = start;
    c.p1 = QPointF(start.x() + offset, start.y());
    c.p2 = QPointF(end.x() - offset, end.y());
    c.p3 = end;
    return c;
}

std::optional<BezierCurve> connectionCurve(const GraphStore& graph, ConnectionId id, const LayoutConfig& layout)
{
    const Connection* conn = graph.connection(id);
    if (!conn)
        return std::nullopt;
    const auto start = graph.socketCanvasPos(conn->source);
    const auto end = graph.socketCanvasPos(conn->target);
    if (!start || !end)
        return std::nullopt;

    if (conn->controlOffsetHint)
        return connectionCurveWithOffset(*start, *end, *conn->controlOffsetHint);
    return connectionCurve(*start, *end, layout.bezierControlOffsetRatio, layout.bezierMinControlOffset);
}

double distance(const QPointF& a, const QPointF& b)
{
    return std::hypot(a.x() - b.x(), a.y() - b.y());
}

double distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const QPointF ab = b - a;
    const double lenSq = QPointF::dotProduct(ab, ab);
    if (lenSq <= std::numeric_limits<double>::epsilon())
        return distance(p, a);

    const double t = std::clamp(QPointF::dotProduct(p - a, ab) / lenSq, 0.0, 1.0);
    return distance(p, a + ab * t);
}

double distanceToCurve(const QPointF& p, const BezierCurve& curve, int segments)
{
    segments = std::max(1, segments);
    const double step = 1.0 / static_cast<double>(segments);

    double best = std::numeric_limits<double>::max();
    QPointF last = curve.p0;
    for (int i = 1; i <= segments; ++i) {
        const QPointF current = curve.pointAt(step * i);
        best = std::min(best, distanceToSegment(p, last, current));
        last = current;
    }
    return best;
}

double snap(double v, double step)
{
    if (step <= 0.0)
        return v;
    return std::round(v / step) * step;
}

QPointF snap(const QPointF& p, double step)
{
    return QPointF(snap(p.x(), step), snap(p.y(), step));
}

} // namespace Geometry
} // namespace NodeEditor
