// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/InteractionOverlay.hpp"
#include "nodeeditor/NodeEditorConfig.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"
#include "nodeeditor/NodeEditorTypes.hpp"
#include "nodeeditor/render/DrawPrimitives.hpp"

#include <QtCore/QSizeF>

namespace NodeEditor {

class GraphStore;
class IThemeProvider;
class SelectionModel;
class ViewportTransform;
struct BezierCurve;
struct Node;

// Produces the draw list for one frame. Reads the graph and the viewport and
// never mutates either. Order: grid, connections, nodes, preview wire,
// selection rectangle.
class NODEEDITOR_EXPORT RendererAdapter final
{
public:
    explicit RendererAdapter(const IThemeProvider* theme, const NodeEditorConfig& config = {});

    const NodeEditorConfig& config() const noexcept { return m_config; }
    void setConfig(const NodeEditorConfig& config) { m_config = config.validated(); }

    DrawList render(const GraphStore& graph,
                    const ViewportTransform& viewport,
                    const SelectionModel& selection,
                    const InteractionOverlay& overlay,
                    const QSizeF& viewportSize) const;

private:
    void drawGrid(DrawList& out, const ViewportTransform& viewport, const QSizeF& viewportSize) const;
    void drawConnections(DrawList& out,
                         const GraphStore& graph,
                         const ViewportTransform& viewport,
                         const SelectionModel& selection,
                         const QRectF& visibleCanvas) const;
    QColor wireColor(const GraphStore& graph, ConnectionId id) const;
    void drawNode(DrawList& out,
                  const GraphStore& graph,
                  const Node& node,
                  const ViewportTransform& viewport,
                  bool selected,
                  const InteractionOverlay& overlay) const;
    void drawPreview(DrawList& out, const ConnectionPreview& preview, const ViewportTransform& viewport) const;

    BezierPrimitive toScreen(const BezierCurve& curve, const ViewportTransform& viewport) const;

    const IThemeProvider* m_theme = nullptr;
    NodeEditorConfig m_config;
};

} // namespace NodeEditor
