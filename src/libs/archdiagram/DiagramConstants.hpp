// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace ArchDiagram::Constants {

// Persistence coalescing for drag and resize.
inline constexpr int kMutationDebounceMs = 300;

// Port edge resolution (block-local pixels, offsets in percent).
inline constexpr double kPortHysteresisPx = 20.0;
inline constexpr double kPortEdgeReleasePx = 100.0;
inline constexpr double kPortOffsetMin = 5.0;
inline constexpr double kPortOffsetMax = 95.0;

inline constexpr double kDefaultBlockWidth = 220.0;
inline constexpr double kDefaultBlockHeight = 140.0;
inline constexpr double kMinBlockWidth = 220.0;
inline constexpr double kMinBlockHeight = 140.0;
inline constexpr double kMaxBlockWidth = 500.0;
inline constexpr double kMaxBlockHeight = 400.0;

// New blocks cascade down and to the right, with a little jitter.
inline constexpr double kPlacementOrigin = 160.0;
inline constexpr double kPlacementStepX = 60.0;
inline constexpr double kPlacementStepY = 40.0;
inline constexpr int kPlacementJitter = 40;

inline constexpr double kDuplicateGap = 40.0;
inline constexpr double kDuplicateDropY = 40.0;

// Connector kind defaults.
inline constexpr char kFlowColor[] = "#2563eb";
inline constexpr char kDependencyColor[] = "#1e293b";
inline constexpr char kCompositionColor[] = "#16a34a";
inline constexpr char kAssociationColor[] = "#334155";
inline constexpr double kConnectorStrokeWidth = 2.0;
inline constexpr double kCompositionStrokeWidth = 3.0;

// Block defaults.
inline constexpr char kBlockBackgroundColor[] = "#ffffff";
inline constexpr char kBlockBorderColor[] = "#cbd5f5";
inline constexpr char kBlockTextColor[] = "#1f2937";
inline constexpr char kSelectionColor[] = "#2563eb";
inline constexpr double kBlockBorderWidth = 1.0;
inline constexpr double kBlockSelectedBorderWidth = 2.0;
inline constexpr double kBlockBorderRadius = 8.0;
inline constexpr double kBlockFontSize = 14.0;

// Port defaults.
inline constexpr char kPortBackgroundColor[] = "#ffffff";
inline constexpr char kPortBorderColor[] = "#64748b";
inline constexpr double kPortSize = 24.0;

inline constexpr char kCopySuffix[] = " copy";

} // namespace ArchDiagram::Constants
