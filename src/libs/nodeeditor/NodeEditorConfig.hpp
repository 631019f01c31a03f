// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorConstants.hpp"
#include "nodeeditor/NodeEditorGlobal.hpp"

class QSettings;

namespace NodeEditor {

struct NODEEDITOR_EXPORT LayoutConfig final {
	double gridSize = Constants::kGridSize;
	double defaultNodeWidth = Constants::kDefaultNodeWidth;
	double defaultNodeHeight = Constants::kDefaultNodeHeight;
	double nodeHeaderHeight = Constants::kNodeHeaderHeight;
	double nodeBorderWidth = Constants::kNodeBorderWidth;
	double selectionBorderWidth = Constants::kSelectionBorderWidth;
	double nodeCornerRadius = Constants::kNodeCornerRadius;

	double socketRadius = Constants::kSocketRadius;
	double socketSpacing = Constants::kSocketSpacing;

	double connectionWidth = Constants::kConnectionWidth;
	double connectionSelectionTolerance = Constants::kConnectionSelectionTolerancePx;
	double bezierControlOffsetRatio = Constants::kBezierControlOffsetRatio;
	double bezierMinControlOffset = Constants::kBezierMinControlOffset;
};

struct NODEEDITOR_EXPORT InteractionConfig final {
	double scrollZoomSpeed = Constants::kScrollZoomSpeed;
	double panSpeed = Constants::kPanSpeed;
	double socketHitRadiusPx = Constants::kSocketHitRadiusPx;
	double framePaddingPx = Constants::kFramePaddingPx;
	int maxUndoSteps = Constants::kMaxUndoSteps;
};

struct NODEEDITOR_EXPORT BehaviorConfig final {
	bool showGrid = true;
	bool snapToGrid = false;

	bool zoomEnabled = true;
	bool panEnabled = true;
	double minZoom = Constants::kMinZoom;
	double maxZoom = Constants::kMaxZoom;

	bool allowMultipleSelection = true;
	bool rectangleSelectionEnabled = true;

	bool connectionTypeChecking = true;
	bool allowSameNodeConnections = false;
	bool rejectCycles = false;

	bool showSocketLabels = true;
	bool cullOffscreenNodes = true;
};

struct NODEEDITOR_EXPORT NodeEditorConfig final {
	LayoutConfig layout;
	InteractionConfig interaction;
	BehaviorConfig behavior;

	// Returns a copy with out-of-range values replaced by defaults and the zoom
	// range ordered.
	NodeEditorConfig validated() const;

	static NodeEditorConfig loadFromSettings(QSettings& settings);
	void saveToSettings(QSettings& settings) const;
};

} // namespace NodeEditor
