// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/ShortcutWiring.hpp"
#include "spotlight/ShortcutSequence.hpp"

namespace Spotlight::Internal {

namespace {

SpotlightError parseShortcut(const QString& shortcut, QKeySequence& out)
{
    QString error;
    if (!ShortcutSequence::parse(shortcut, out, &error))
        return SpotlightError::shortcutRegistration(error);
    return SpotlightError::none();
}

SpotlightError registrationFailure(const QString& shortcut, Api::ShortcutRegistrationStatus status,
                                   const QString& detail)
{
    const QString reason = status == Api::ShortcutRegistrationStatus::AlreadyRegistered
                               ? QStringLiteral("already claimed by another application")
                               : (detail.isEmpty() ? QStringLiteral("rejected by the system") : detail);
    return SpotlightError::shortcutRegistration(
        QStringLiteral("Failed to register shortcut '%1': %2").arg(shortcut, reason));
}

} // namespace

SpotlightError registerWindowShortcut(Api::IGlobalShortcutBackend& backend,
                                      const WindowConfig& config,
                                      Api::IGlobalShortcutBackend::Callback onTriggered)
{
    if (!config.shortcut)
        return SpotlightError::none();

    QKeySequence sequence;
    const SpotlightError parsed = parseShortcut(*config.shortcut, sequence);
    if (!parsed.ok())
        return parsed;

    QString detail;
    const auto status = backend.registerShortcut(sequence, std::move(onTriggered), &detail);
    if (status != Api::ShortcutRegistrationStatus::Registered)
        return registrationFailure(*config.shortcut, status, detail);

    qCDebug(spotlightlog) << "registered toggle shortcut" << sequence << "for" << config.label;
    return SpotlightError::none();
}

SpotlightError registerCloseShortcut(Api::IGlobalShortcutBackend& backend,
                                     const std::optional<QString>& shortcut,
                                     Api::IGlobalShortcutBackend::Callback onTriggered)
{
    if (!shortcut)
        return SpotlightError::none();

    QKeySequence sequence;
    const SpotlightError parsed = parseShortcut(*shortcut, sequence);
    if (!parsed.ok())
        return parsed;

    if (backend.isRegistered(sequence))
        return SpotlightError::none();

    QString detail;
    const auto status = backend.registerShortcut(sequence, std::move(onTriggered), &detail);
    if (status != Api::ShortcutRegistrationStatus::Registered)
        return registrationFailure(*shortcut, status, detail);

    qCDebug(spotlightlog) << "registered close shortcut" << sequence;
    return SpotlightError::none();
}

} // namespace Spotlight::Internal
