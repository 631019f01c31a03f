// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/render/RendererAdapter.hpp"

#include "nodeeditor/ConnectionGeometry.hpp"
#include "nodeeditor/GraphStore.hpp"
#include "nodeeditor/SelectionModel.hpp"
#include "nodeeditor/ViewportTransform.hpp"
#include "nodeeditor/render/ThemeProvider.hpp"

#include <algorithm>
#include <cmath>

namespace NodeEditor {

namespace {

const DefaultThemeProvider& fallbackTheme()
{
    static const DefaultThemeProvider theme;
    return theme;
}

} // namespace

RendererAdapter::RendererAdapter(const IThemeProvider* theme, const NodeEditorConfig& config)
    : m_theme(theme ? theme : &fallbackTheme())
    , m_config(config.validated())
{}

DrawList RendererAdapter::render(const GraphStore& graph,
                                 const ViewportTransform& viewport,
                                 const SelectionModel& selection,
                                 const InteractionOverlay& overlay,
                                 const QSizeF& viewportSize) const
{
    DrawList out;

    if (m_config.behavior.showGrid)
        drawGrid(out, viewport, viewportSize);

    const bool cull = m_config.behavior.cullOffscreenNodes && !viewportSize.isEmpty();
    const QRectF visible = cull ? viewport.visibleCanvasRect(viewportSize) : QRectF();

    drawConnections(out, graph, viewport, selection, visible);

    for (NodeId id : graph.nodeIds()) {
        const Node* node = graph.node(id);
        if (!node)
            continue;
        if (cull && !visible.intersects(node->bounds()))
            continue;
        drawNode(out, graph, *node, viewport, selection.isSelected(id), overlay);
    }

    if (overlay.preview)
        drawPreview(out, *overlay.preview, viewport);

    if (overlay.boxCanvas) {
        RectPrimitive box;
        box.rect = viewport.toScreen(*overlay.boxCanvas);
        box.fill = m_theme->color(ColorRole::SelectionRectFill);
        box.stroke = m_theme->color(ColorRole::SelectionRectBorder);
        box.strokeWidth = 1.0;
        out.push_back(box);
    }

    return out;
}

void RendererAdapter::drawGrid(DrawList& out, const ViewportTransform& viewport, const QSizeF& viewportSize) const
{
    if (viewportSize.isEmpty())
        return;
    const double spacing = m_config.layout.gridSize * viewport.zoom();
    if (spacing < Constants::kMinGridSpacingPx)
        return;

    const QColor color = m_theme->color(ColorRole::Grid);
    const QPointF pan = viewport.pan();

    double x = std::fmod(pan.x(), spacing);
    if (x < 0.0)
        x += spacing;
    for (; x <= viewportSize.width(); x += spacing)
        out.push_back(LinePrimitive{QPointF(x, 0.0), QPointF(x, viewportSize.height()), color, 1.0});

    double y = std::fmod(pan.y(), spacing);
    if (y < 0.0)
        y += spacing;
    for (; y <= viewportSize.height(); y += spacing)
        out.push_back(LinePrimitive{QPointF(0.0, y), QPointF(viewportSize.width(), y), color, 1.0});
}

void RendererAdapter::drawConnections(DrawList& out,
                                      const GraphStore& graph,
                                      const ViewportTransform& viewport,
                                      const SelectionModel& selection,
                                      const QRectF& visibleCanvas) const
{
    for (ConnectionId id : graph.connectionIds()) {
        const auto curve = Geometry::connectionCurve(graph, id, m_config.layout);
        if (!curve)
            continue;
        // Straight wires have a zero-height hull, so pad before testing.
        if (!visibleCanvas.isNull() && !visibleCanvas.intersects(curve->controlBounds().adjusted(-1.0, -1.0, 1.0, 1.0)))
            continue;

        BezierPrimitive prim = toScreen(*curve, viewport);
        if (selection.isSelected(id))
            prim.color = m_theme->color(ColorRole::ConnectionSelected);
        else
            prim.color = wireColor(graph, id);
        prim.width = m_config.layout.connectionWidth;
        out.push_back(prim);
    }
}

// Unselected wires take the colour of their source socket's type.
QColor RendererAdapter::wireColor(const GraphStore& graph, ConnectionId id) const
{
    const Connection* conn = graph.connection(id);
    const Socket* source = conn ? graph.socket(conn->source) : nullptr;
    if (!source)
        return m_theme->color(ColorRole::Connection);
    return m_theme->socketColor(source->typeTag);
}

void RendererAdapter::drawNode(DrawList& out,
                               const GraphStore& graph,
                               const Node& node,
                               const ViewportTransform& viewport,
                               bool selected,
                               const InteractionOverlay& overlay) const
{
    const auto& layout = m_config.layout;
    const double zoom = viewport.zoom();
    const QRectF body = viewport.toScreen(node.bounds());
    const double radius = layout.nodeCornerRadius * zoom;

    RectPrimitive fill;
    fill.rect = body;
    fill.fill = m_theme->color(ColorRole::NodeBody);
    fill.cornerRadius = radius;
    out.push_back(fill);

    const QRectF header(body.topLeft(), QSizeF(body.width(), std::min(body.height(), layout.nodeHeaderHeight * zoom)));
    RectPrimitive head;
    head.rect = header;
    head.fill = m_theme->color(ColorRole::NodeHeader);
    head.cornerRadius = radius;
    out.push_back(head);

    RectPrimitive outline;
    outline.rect = body;
    outline.stroke = m_theme->color(selected ? ColorRole::Selection : ColorRole::NodeBorder);
    outline.strokeWidth = selected ? layout.selectionBorderWidth : layout.nodeBorderWidth;
    outline.cornerRadius = radius;
    out.push_back(outline);

    const double textPad = 6.0 * zoom;
    const double pointSize = m_theme->fontPointSize() * zoom;
    if (!node.payload.title.isEmpty()) {
        out.push_back(TextPrimitive{header.adjusted(textPad, 0.0, -textPad, 0.0),
                                    node.payload.title,
                                    m_theme->color(ColorRole::NodeText),
                                    pointSize,
                                    Qt::AlignLeft | Qt::AlignVCenter});
    }

    const bool labels = m_config.behavior.showSocketLabels && zoom >= Constants::kSocketLabelMinZoom;
    const double socketRadius = layout.socketRadius * zoom;

    auto drawSocket = [&](SocketId sid) {
        const Socket* socket = graph.socket(sid);
        if (!socket)
            return;
        const QPointF center = viewport.toScreen(node.position + socket->offset);

        ColorRole border = ColorRole::SocketBorder;
        if (overlay.hoveredSocket == sid)
            border = ColorRole::SocketHover;
        else if (graph.isOccupied(sid))
            border = ColorRole::SocketConnected;
        out.push_back(EllipsePrimitive{center,
                                       socketRadius,
                                       m_theme->socketColor(socket->typeTag),
                                       m_theme->color(border),
                                       1.0});

        if (!labels || socket->label.isEmpty())
            return;
        const double labelWidth = std::max(0.0, body.width() * 0.5 - socketRadius - textPad);
        const double labelHeight = layout.socketSpacing * zoom;
        QRectF box;
        Qt::Alignment align;
        if (socket->isInput()) {
            box = QRectF(center.x() + socketRadius + textPad * 0.5, center.y() - labelHeight * 0.5,
                         labelWidth, labelHeight);
            align = Qt::AlignLeft | Qt::AlignVCenter;
        } else {
            box = QRectF(center.x() - socketRadius - textPad * 0.5 - labelWidth, center.y() - labelHeight * 0.5,
                         labelWidth, labelHeight);
            align = Qt::AlignRight | Qt::AlignVCenter;
        }
        out.push_back(TextPrimitive{box, socket->label, m_theme->color(ColorRole::SocketLabel), pointSize * 0.9, align});
    };

    for (SocketId sid : node.inputs)
        drawSocket(sid);
    for (SocketId sid : node.outputs)
        drawSocket(sid);
}

void RendererAdapter::drawPreview(DrawList& out, const ConnectionPreview& preview, const ViewportTransform& viewport) const
{
    const QPointF start = preview.originIsOutput ? preview.originCanvas : preview.cursorCanvas;
    const QPointF end = preview.originIsOutput ? preview.cursorCanvas : preview.originCanvas;
    const BezierCurve curve = Geometry::connectionCurve(start, end,
                                                        m_config.layout.bezierControlOffsetRatio,
                                                        m_config.layout.bezierMinControlOffset);

    BezierPrimitive prim = toScreen(curve, viewport);
    const bool rejected = preview.candidate.isValid() && !preview.candidateAccepted;
    prim.color = m_theme->color(rejected ? ColorRole::PreviewRejected : ColorRole::PreviewConnection);
    prim.width = m_config.layout.connectionWidth;
    out.push_back(prim);
}

BezierPrimitive RendererAdapter::toScreen(const BezierCurve& curve, const ViewportTransform& viewport) const
{
    BezierPrimitive prim;
    prim.p0 = viewport.toScreen(curve.p0);
    prim.p1 = viewport.toScreen(curve.p1);
    prim.p2 = viewport.toScreen(curve.p2);
    prim.p3 = viewport.toScreen(curve.p3);
    return prim;
}

} // namespace NodeEditor
