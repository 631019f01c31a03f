// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace NodeEditor::Constants {

inline constexpr char kAnySocketType[] = "any";

inline constexpr double kDefaultNodeWidth = 120.0;
inline constexpr double kDefaultNodeHeight = 80.0;
inline constexpr double kNodeHeaderHeight = 24.0;
inline constexpr double kSocketRadius = 8.0;
inline constexpr double kSocketSpacing = 20.0;
inline constexpr double kGridSize = 20.0;

inline constexpr double kMinZoom = 0.20;
inline constexpr double kMaxZoom = 3.00;
inline constexpr double kScrollZoomSpeed = 0.10;
inline constexpr double kPanSpeed = 1.0;

inline constexpr double kBezierControlOffsetRatio = 0.5;
inline constexpr double kBezierMinControlOffset = 50.0;
inline constexpr int kBezierHitSegments = 32;

inline constexpr double kSocketHitRadiusPx = 16.0;
inline constexpr double kConnectionSelectionTolerancePx = 8.0;
inline constexpr double kFramePaddingPx = 100.0;
inline constexpr double kPasteOffset = 50.0;
inline constexpr double kMinGridSpacingPx = 4.0;
inline constexpr double kSocketLabelMinZoom = 0.5;

inline constexpr double kNodeBorderWidth = 2.0;
inline constexpr double kSelectionBorderWidth = 3.0;
inline constexpr double kConnectionWidth = 3.0;
inline constexpr double kNodeCornerRadius = 4.0;

inline constexpr int kMaxUndoSteps = 50;

inline constexpr char kSettingsGroup[] = "nodeEditor";

} // namespace NodeEditor::Constants
