// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QString>

#include <utility>

namespace Spotlight {

enum class SpotlightErrorCode : quint8 {
    None = 0,
    Lock,
    NotFound,
    ShortcutRegistration,
    PanelConversion
};

class SPOTLIGHT_EXPORT SpotlightError final {
public:
    SpotlightError() = default;
    SpotlightError(SpotlightErrorCode code, QString message)
        : m_code(code), m_message(std::move(message)) {}

    bool ok() const noexcept { return m_code == SpotlightErrorCode::None; }
    SpotlightErrorCode code() const noexcept { return m_code; }
    const QString& message() const noexcept { return m_message; }

    static SpotlightError none() { return {}; }

    static SpotlightError lock(const QString& label)
    {
        return {SpotlightErrorCode::Lock,
                QStringLiteral("Panel registry is unusable for '%1' after a failed initialization.").arg(label)};
    }

    static SpotlightError notFound(const QString& label)
    {
        return {SpotlightErrorCode::NotFound, QStringLiteral("No panel registered for '%1'.").arg(label)};
    }

    static SpotlightError shortcutRegistration(QString message)
    {
        return {SpotlightErrorCode::ShortcutRegistration, std::move(message)};
    }

private:
    SpotlightErrorCode m_code{SpotlightErrorCode::None};
    QString m_message;
};

SPOTLIGHT_EXPORT QString toString(SpotlightErrorCode code);

} // namespace Spotlight
