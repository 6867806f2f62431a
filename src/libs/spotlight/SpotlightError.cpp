// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/SpotlightError.hpp"

namespace Spotlight {

QString toString(SpotlightErrorCode code)
{
    switch (code) {
        case SpotlightErrorCode::None: return QStringLiteral("none");
        case SpotlightErrorCode::Lock: return QStringLiteral("lock");
        case SpotlightErrorCode::NotFound: return QStringLiteral("notFound");
        case SpotlightErrorCode::ShortcutRegistration: return QStringLiteral("shortcutRegistration");
        case SpotlightErrorCode::PanelConversion: return QStringLiteral("panelConversion");
    }
    return QStringLiteral("unknown");
}

} // namespace Spotlight
