// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorConstants.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSizeF>

namespace NodeEditor {

// Maps canvas space to screen space: screen = canvas * zoom + pan.
// Pan is expressed in screen units.
class NODEEDITOR_EXPORT ViewportTransform final
{
public:
    ViewportTransform() = default;
    ViewportTransform(double minZoom, double maxZoom);

    double zoom() const noexcept { return m_zoom; }
    double minZoom() const noexcept { return m_minZoom; }
    double maxZoom() const noexcept { return m_maxZoom; }
    QPointF pan() const noexcept { return m_pan; }

    void setZoomRange(double minZoom, double maxZoom);
    double clampZoom(double zoom) const;

    void setZoom(double zoom);
    void zoomAt(const QPointF& pivotScreen, double zoom);
    void zoomBy(const QPointF& pivotScreen, double factor);

    void setPan(const QPointF& pan) { m_pan = pan; }
    void panBy(const QPointF& deltaScreen) { m_pan += deltaScreen; }

    QPointF toScreen(const QPointF& canvasPos) const noexcept;
    QPointF toCanvas(const QPointF& screenPos) const noexcept;
    QRectF toScreen(const QRectF& canvasRect) const noexcept;
    QRectF toCanvas(const QRectF& screenRect) const noexcept;

    QRectF visibleCanvasRect(const QSizeF& viewportSize) const;

    // Fits canvasRect (plus paddingPx on every side) into the viewport and
    // centres it. Returns false when nothing was changed.
    bool frame(const QRectF& canvasRect, const QSizeF& viewportSize, double paddingPx);

private:
    double m_minZoom = Constants::kMinZoom;
    double m_maxZoom = Constants::kMaxZoom;
    double m_zoom = 1.0;
    QPointF m_pan{0.0, 0.0};
};

} // namespace NodeEditor
