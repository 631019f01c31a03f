// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditor/NodeEditorConfig.hpp"

#include <QtCore/QSettings>
#include <QtCore/QVariant>

#include <algorithm>
#include <cmath>
#include <utility>

namespace NodeEditor {

namespace {

using namespace Qt::StringLiterals;

double readDouble(const QSettings& s, const QString& key, double def)
{
    bool ok = false;
    const double v = s.value(key, def).toDouble(&ok);
    if (!ok || !std::isfinite(v)) {
        qCWarning(nodeeditorlog) << "NodeEditorConfig: ignoring non-numeric value for" << key;
        return def;
    }
    return v;
}

int readInt(const QSettings& s, const QString& key, int def)
{
    bool ok = false;
    const int v = s.value(key, def).toInt(&ok);
    return ok ? v : def;
}

bool readBool(const QSettings& s, const QString& key, bool def)
{
    return s.value(key, def).toBool();
}

double positiveOr(double v, double def)
{
    return v > 0.0 ? v : def;
}

double nonNegativeOr(double v, double def)
{
    return v >= 0.0 ? v : def;
}

} // namespace

NodeEditorConfig NodeEditorConfig::validated() const
{
    NodeEditorConfig out = *this;
    const NodeEditorConfig defaults;

    auto& l = out.layout;
    l.gridSize = positiveOr(l.gridSize, defaults.layout.gridSize);
    l.defaultNodeWidth = positiveOr(l.defaultNodeWidth, defaults.layout.defaultNodeWidth);
    l.defaultNodeHeight = positiveOr(l.defaultNodeHeight, defaults.layout.defaultNodeHeight);
    l.nodeHeaderHeight = nonNegativeOr(l.nodeHeaderHeight, defaults.layout.nodeHeaderHeight);
    l.nodeBorderWidth = nonNegativeOr(l.nodeBorderWidth, defaults.layout.nodeBorderWidth);
    l.selectionBorderWidth = nonNegativeOr(l.selectionBorderWidth, defaults.layout.selectionBorderWidth);
    l.nodeCornerRadius = nonNegativeOr(l.nodeCornerRadius, defaults.layout.nodeCornerRadius);
    l.socketRadius = positiveOr(l.socketRadius, defaults.layout.socketRadius);
    l.socketSpacing = positiveOr(l.socketSpacing, defaults.layout.socketSpacing);
    l.connectionWidth = positiveOr(l.connectionWidth, defaults.layout.connectionWidth);
    l.connectionSelectionTolerance = nonNegativeOr(l.connectionSelectionTolerance,
                                                   defaults.layout.connectionSelectionTolerance);
    l.bezierControlOffsetRatio = nonNegativeOr(l.bezierControlOffsetRatio,
                                               defaults.layout.bezierControlOffsetRatio);
    l.bezierMinControlOffset = nonNegativeOr(l.bezierMinControlOffset,
                                             defaults.layout.bezierMinControlOffset);

    auto& i = out.interaction;
    i.scrollZoomSpeed = positiveOr(i.scrollZoomSpeed, defaults.interaction.scrollZoomSpeed);
    i.panSpeed = positiveOr(i.panSpeed, defaults.interaction.panSpeed);
    i.socketHitRadiusPx = positiveOr(i.socketHitRadiusPx, defaults.interaction.socketHitRadiusPx);
    i.framePaddingPx = nonNegativeOr(i.framePaddingPx, defaults.interaction.framePaddingPx);
    if (i.maxUndoSteps < 0)
        i.maxUndoSteps = defaults.interaction.maxUndoSteps;

    auto& b = out.behavior;
    if (b.minZoom <= 0.0)
        b.minZoom = defaults.behavior.minZoom;
    if (b.maxZoom <= 0.0)
        b.maxZoom = defaults.behavior.maxZoom;
    if (b.minZoom > b.maxZoom)
        std::swap(b.minZoom, b.maxZoom);

    return out;
}

NodeEditorConfig NodeEditorConfig::loadFromSettings(QSettings& settings)
{
    NodeEditorConfig cfg;

    settings.beginGroup(QString::fromLatin1(Constants::kSettingsGroup));

    settings.beginGroup(u"layout"_s);
    auto& l = cfg.layout;
    l.gridSize = readDouble(settings, u"gridSize"_s, l.gridSize);
    l.defaultNodeWidth = readDouble(settings, u"defaultNodeWidth"_s, l.defaultNodeWidth);
    l.defaultNodeHeight = readDouble(settings, u"defaultNodeHeight"_s, l.defaultNodeHeight);
    l.nodeHeaderHeight = readDouble(settings, u"nodeHeaderHeight"_s, l.nodeHeaderHeight);
    l.nodeBorderWidth = readDouble(settings, u"nodeBorderWidth"_s, l.nodeBorderWidth);
    l.selectionBorderWidth = readDouble(settings, u"selectionBorderWidth"_s, l.selectionBorderWidth);
    l.nodeCornerRadius = readDouble(settings, u"nodeCornerRadius"_s, l.nodeCornerRadius);
    l.socketRadius = readDouble(settings, u"socketRadius"_s, l.socketRadius);
    l.socketSpacing = readDouble(settings, u"socketSpacing"_s, l.socketSpacing);
    l.connectionWidth = readDouble(settings, u"connectionWidth"_s, l.connectionWidth);
    l.connectionSelectionTolerance = readDouble(settings, u"connectionSelectionTolerance"_s,
                                                l.connectionSelectionTolerance);
    l.bezierControlOffsetRatio = readDouble(settings, u"bezierControlOffsetRatio"_s,
                                            l.bezierControlOffsetRatio);
    l.bezierMinControlOffset = readDouble(settings, u"bezierMinControlOffset"_s, l.bezierMinControlOffset);
    settings.endGroup();

    settings.beginGroup(u"interaction"_s);
    auto& i = cfg.interaction;
    i.scrollZoomSpeed = readDouble(settings, u"scrollZoomSpeed"_s, i.scrollZoomSpeed);
    i.panSpeed = readDouble(settings, u"panSpeed"_s, i.panSpeed);
    i.socketHitRadiusPx = readDouble(settings, u"socketHitRadiusPx"_s, i.socketHitRadiusPx);
    i.framePaddingPx = readDouble(settings, u"framePaddingPx"_s, i.framePaddingPx);
    i.maxUndoSteps = readInt(settings, u"maxUndoSteps"_s, i.maxUndoSteps);
    settings.endGroup();

    settings.beginGroup(u"behavior"_s);
    auto& b = cfg.behavior;
    b.showGrid = readBool(settings, u"showGrid"_s, b.showGrid);
    b.snapToGrid = readBool(settings, u"snapToGrid"_s, b.snapToGrid);
    b.zoomEnabled = readBool(settings, u"zoomEnabled"_s, b.zoomEnabled);
    b.panEnabled = readBool(settings, u"panEnabled"_s, b.panEnabled);
    b.minZoom = readDouble(settings, u"minZoom"_s, b.minZoom);
    b.maxZoom = readDouble(settings, u"maxZoom"_s, b.maxZoom);
    b.allowMultipleSelection = readBool(settings, u"allowMultipleSelection"_s, b.allowMultipleSelection);
    b.rectangleSelectionEnabled = readBool(settings, u"rectangleSelectionEnabled"_s,
                                           b.rectangleSelectionEnabled);
    b.connectionTypeChecking = readBool(settings, u"connectionTypeChecking"_s, b.connectionTypeChecking);
    b.allowSameNodeConnections = readBool(settings, u"allowSameNodeConnections"_s,
                                          b.allowSameNodeConnections);
    b.rejectCycles = readBool(settings, u"rejectCycles"_s, b.rejectCycles);
    b.showSocketLabels = readBool(settings, u"showSocketLabels"_s, b.showSocketLabels);
    b.cullOffscreenNodes = readBool(settings, u"cullOffscreenNodes"_s, b.cullOffscreenNodes);
    settings.endGroup();

    settings.endGroup();

    return cfg.validated();
}

void NodeEditorConfig::saveToSettings(QSettings& settings) const
{
    settings.beginGroup(QString::fromLatin1(Constants::kSettingsGroup));

    settings.beginGroup(u"layout"_s);
    settings.setValue(u"gridSize"_s, layout.gridSize);
    settings.setValue(u"defaultNodeWidth"_s, layout.defaultNodeWidth);
    settings.setValue(u"defaultNodeHeight"_s, layout.defaultNodeHeight);
    settings.setValue(u"nodeHeaderHeight"_s, layout.nodeHeaderHeight);
    settings.setValue(u"nodeBorderWidth"_s, layout.nodeBorderWidth);
    settings.setValue(u"selectionBorderWidth"_s, layout.selectionBorderWidth);
    settings.setValue(u"nodeCornerRadius"_s, layout.nodeCornerRadius);
    settings.setValue(u"socketRadius"_s, layout.socketRadius);
    settings.setValue(u"socketSpacing"_s, layout.socketSpacing);
    settings.setValue(u"connectionWidth"_s, layout.connectionWidth);
    settings.setValue(u"connectionSelectionTolerance"_s, layout.connectionSelectionTolerance);
    settings.setValue(u"bezierControlOffsetRatio"_s, layout.bezierControlOffsetRatio);
    settings.setValue(u"bezierMinControlOffset"_s, layout.bezierMinControlOffset);
    settings.endGroup();

    settings.beginGroup(u"interaction"_s);
    settings.setValue(u"scrollZoomSpeed"_s, interaction.scrollZoomSpeed);
    settings.setValue(u"panSpeed"_s, interaction.panSpeed);
    settings.setValue(u"socketHitRadiusPx"_s, interaction.socketHitRadiusPx);
    settings.setValue(u"framePaddingPx"_s, interaction.framePaddingPx);
    settings.setValue(u"maxUndoSteps"_s, interaction.maxUndoSteps);
    settings.endGroup();

    settings.beginGroup(u"behavior"_s);
    settings.setValue(u"showGrid"_s, behavior.showGrid);
    settings.setValue(u"snapToGrid"_s, behavior.snapToGrid);
    settings.setValue(u"zoomEnabled"_s, behavior.zoomEnabled);
    settings.setValue(u"panEnabled"_s, behavior.panEnabled);
    settings.setValue(u"minZoom"_s, behavior.minZoom);
    settings.setValue(u"maxZoom"_s, behavior.maxZoom);
    settings.setValue(u"allowMultipleSelection"_s, behavior.allowMultipleSelection);
    settings.setValue(u"rectangleSelectionEnabled"_s, behavior.rectangleSelectionEnabled);
    settings.setValue(u"connectionTypeChecking"_s, behavior.connectionTypeChecking);
    settings.setValue(u"allowSameNodeConnections"_s, behavior.allowSameNodeConnections);
    settings.setValue(u"rejectCycles"_s, behavior.rejectCycles);
    settings.setValue(u"showSocketLabels"_s, behavior.showSocketLabels);
    settings.setValue(u"cullOffscreenNodes"_s, behavior.cullOffscreenNodes);
    settings.endGroup();

    settings.endGroup();
}

} // namespace NodeEditor
