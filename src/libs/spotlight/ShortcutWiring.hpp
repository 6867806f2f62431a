// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightConfig.hpp"
#include "spotlight/SpotlightError.hpp"
#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/IGlobalShortcutBackend.hpp"

#include <optional>

namespace Spotlight::Internal {

// Registers the window's toggle shortcut, if it has one.
SPOTLIGHT_EXPORT SpotlightError registerWindowShortcut(Api::IGlobalShortcutBackend& backend,
                                                       const WindowConfig& config,
                                                       Api::IGlobalShortcutBackend::Callback onTriggered);

// Registers the process-wide close shortcut unless it is already registered.
SPOTLIGHT_EXPORT SpotlightError registerCloseShortcut(Api::IGlobalShortcutBackend& backend,
                                                      const std::optional<QString>& shortcut,
                                                      Api::IGlobalShortcutBackend::Callback onTriggered);

} // namespace Spotlight::Internal
