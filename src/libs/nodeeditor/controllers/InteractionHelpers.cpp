// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/controllers/InteractionHelpers.hpp"

#include "nodeeditor/ConnectionGeometry.hpp"
#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/NodeEditorConfig.hpp"
#include "nodeeditor/NodeEditorConstants.hpp"

namespace NodeEditor::Controllers::Detail {

std::optional<ConnectionId> pickConnection(const GraphStore& graph,
                                           const LayoutConfig& layout,
                                           const QPointF& canvasPos,
                                           double tolerance)
{
    std::optional<ConnectionId> best;
    double bestDist = tolerance;

    for (ConnectionId id : graph.connectionIds()) {
        const auto curve = Geometry::connectionCurve(graph, id, layout);
        if (!curve)
            continue;
        if (!curve->controlBounds().adjusted(-tolerance, -tolerance, tolerance, tolerance).contains(canvasPos))
            continue;

        const double d = Geometry::distanceToCurve(canvasPos, *curve, Constants::kBezierHitSegments);
        if (d <= tolerance && (!best || d < bestDist)) {
            best = id;
            bestDist = d;
        }
    }
    return best;
}

} // namespace NodeEditor::Controllers::Detail
