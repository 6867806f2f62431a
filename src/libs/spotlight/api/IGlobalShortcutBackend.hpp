// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QString>
#include <QtGui/QKeySequence>

#include <functional>

namespace Spotlight::Api {

enum class ShortcutRegistrationStatus : quint8 {
    Registered,
    AlreadyRegistered,
    Failed
};

// System-wide hot keys. Callbacks may be invoked on any thread.
class SPOTLIGHT_EXPORT IGlobalShortcutBackend {
public:
    using Callback = std::function<void()>;

    virtual ~IGlobalShortcutBackend() = default;

    virtual bool isRegistered(const QKeySequence& shortcut) const = 0;
    virtual ShortcutRegistrationStatus registerShortcut(const QKeySequence& shortcut,
                                                        Callback callback,
                                                        QString* error = nullptr) = 0;
};

} // namespace Spotlight::Api
