// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>

#include <optional>

namespace NodeEditor {

class GraphStore;
struct LayoutConfig;

struct NODEEDITOR_EXPORT BezierCurve final {
    QPointF p0;
    QPointF p1;
    QPointF p2;
    QPointF p3;

    QPointF pointAt(double t) const;
    QRectF controlBounds() const;
};

namespace Geometry {

// Horizontal S-curve between an output at `start` and an input at `end`.
// The control distance grows with the horizontal gap and never drops below
// minOffset.
NODEEDITOR_EXPORT BezierCurve connectionCurve(const QPointF& start,
                                              const QPointF& end,
                                              double offsetRatio,
                                              double minOffset);

NODEEDITOR_EXPORT BezierCurve connectionCurveWithOffset(const QPointF& start,
                                                        const QPointF& end,
                                                        double offset);

// Canvas-space curve of a stored connection. A control offset hint on the
// connection replaces the derived offset.
NODEEDITOR_EXPORT std::optional<BezierCurve> connectionCurve(const GraphStore& graph,
                                                             ConnectionId id,
                                                             const LayoutConfig& layout);

NODEEDITOR_EXPORT double distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b);
NODEEDITOR_EXPORT double distanceToCurve(const QPointF& p, const BezierCurve& curve, int segments);

NODEEDITOR_EXPORT double distance(const QPointF& a, const QPointF& b);
NODEEDITOR_EXPORT double snap(double v, double step);
NODEEDITOR_EXPORT QPointF snap(const QPointF& p, double step);

} // namespace Geometry
} // namespace NodeEditor
