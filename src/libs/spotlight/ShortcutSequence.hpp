// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QString>
#include <QtGui/QKeySequence>

namespace Spotlight::ShortcutSequence {

// Accelerators are '+'-separated modifier tokens followed by one key, e.g.
// "CmdOrCtrl+Shift+J" or "Escape". Command-style modifiers map to Qt's Ctrl,
// which is the Command key on macOS.
SPOTLIGHT_EXPORT bool parse(const QString& accelerator, QKeySequence& out, QString* error = nullptr);

// Portable text of the parsed sequence; empty when the accelerator is invalid.
SPOTLIGHT_EXPORT QString normalize(const QString& accelerator);

} // namespace Spotlight::ShortcutSequence
