// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/ViewportTransform.hpp"

#include <QtCore/QtGlobal>

#include <algorithm>
#include <utility>

namespace NodeEditor {

ViewportTransform::ViewportTransform(double minZoom, double maxZoom)
{
    setZoomRange(minZoom, maxZoom);
}

void ViewportTransform::setZoomRange(double minZoom, double maxZoom)
{
    if (minZoom <= 0.0 || maxZoom <= 0.0) {
        qCWarning(nodeeditorlog) << "ViewportTransform: ignoring non-positive zoom range" << minZoom << maxZoom;
        return;
    }
    if (minZoom > maxZoom)
        std::swap(minZoom, maxZoom);

    m_minZoom = minZoom;
    m_maxZoom = maxZoom;
    m_zoom = clampZoom(m_zoom);
}

double ViewportTransform::clampZoom(double zoom) const
{
    return std::clamp(zoom, m_minZoom, m_maxZoom);
}

void ViewportTransform::setZoom(double zoom)
{
    m_zoom = clampZoom(zoom);
}

void ViewportTransform::zoomAt(const QPointF& pivotScreen, double zoom)
{
    const QPointF pivotCanvas = toCanvas(pivotScreen);
    m_zoom = clampZoom(zoom);
    m_pan = pivotScreen - pivotCanvas * m_zoom;
}

void ViewportTransform::zoomBy(const QPointF& pivotScreen, double factor)
{
    if (factor <= 0.0)
        return;
    zoomAt(pivotScreen, m_zoom * factor);
}

QPointF ViewportTransform::toScreen(const QPointF& canvasPos) const noexcept
{
    return canvasPos * m_zoom + m_pan;
}

QPointF ViewportTransform::toCanvas(const QPointF& screenPos) const noexcept
{
    return (screenPos - m_pan) / m_zoom;
}

QRectF ViewportTransform::toScreen(const QRectF& canvasRect) const noexcept
{
    return QRectF(toScreen(canvasRect.topLeft()), canvasRect.size() * m_zoom);
}

QRectF ViewportTransform::toCanvas(const QRectF& screenRect) const noexcept
{
    return QRectF(toCanvas(screenRect.topLeft()), screenRect.size() / m_zoom);
}

QRectF ViewportTransform::visibleCanvasRect(const QSizeF& viewportSize) const
{
    if (viewportSize.isEmpty())
        return QRectF();
    return toCanvas(QRectF(QPointF(0.0, 0.0), viewportSize));
}

bool ViewportTransform::frame(const QRectF& canvasRect, const QSizeF& viewportSize, double paddingPx)
{
    if (viewportSize.isEmpty() || !canvasRect.isValid())
        return false;

    const double availW = std::max(1.0, viewportSize.width() - 2.0 * paddingPx);
    const double availH = std::max(1.0, viewportSize.height() - 2.0 * paddingPx);
    const double fit = std::min(availW / canvasRect.width(), availH / canvasRect.height());

    m_zoom = clampZoom(fit);
    const QPointF viewCenter(viewportSize.width() * 0.5, viewportSize.height() * 0.5);
    m_pan = viewCenter - canvasRect.center() * m_zoom;
    return true;
}

} // namespace NodeEditor
