// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace Spotlight::Constants {

// NSMainMenuWindowLevel
constexpr inline int kMainMenuWindowLevel = 24;
constexpr inline int kDefaultStackingLevel = kMainMenuWindowLevel + 1;

constexpr inline bool kDefaultAutoHide = true;

// NSWindowStyleMaskNonActivatingPanel
constexpr inline unsigned long kNonActivatingPanelStyleMask = 1ul << 7;

constexpr inline char kConfigWindowsKey[] = "windows";
constexpr inline char kConfigLabelKey[] = "label";
constexpr inline char kConfigShortcutKey[] = "shortcut";
constexpr inline char kConfigStackingLevelKey[] = "macos_window_level";
constexpr inline char kConfigAutoHideKey[] = "auto_hide";
constexpr inline char kConfigGlobalCloseShortcutKey[] = "global_close_shortcut";

} // namespace Spotlight::Constants
