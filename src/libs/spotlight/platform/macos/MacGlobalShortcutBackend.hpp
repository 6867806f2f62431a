// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/api/IGlobalShortcutBackend.hpp"

#include <memory>

namespace Spotlight::Internal {

// Carbon RegisterEventHotKey backend. Callbacks run on the main thread.
class MacGlobalShortcutBackend final : public Api::IGlobalShortcutBackend {
public:
    MacGlobalShortcutBackend();
    ~MacGlobalShortcutBackend() override;

    MacGlobalShortcutBackend(const MacGlobalShortcutBackend&) = delete;
    MacGlobalShortcutBackend& operator=(const MacGlobalShortcutBackend&) = delete;

    bool isRegistered(const QKeySequence& shortcut) const override;
    Api::ShortcutRegistrationStatus registerShortcut(const QKeySequence& shortcut,
                                                     Callback callback,
                                                     QString* error = nullptr) override;

private:
    struct Private;
    std::unique_ptr<Private> d;
};

} // namespace Spotlight::Internal
