// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/ShortcutSequence.hpp"

#include <QtCore/QHash>
#include <QtCore/QStringList>

namespace Spotlight::ShortcutSequence {

namespace {

// Qt reports the Command key as ControlModifier on macOS and the physical
// Control key as MetaModifier.
#if defined(Q_OS_MACOS)
constexpr Qt::KeyboardModifier kControlKeyModifier = Qt::MetaModifier;
#else
constexpr Qt::KeyboardModifier kControlKeyModifier = Qt::ControlModifier;
#endif

const QHash<QString, Qt::KeyboardModifier>& modifierTokens()
{
    static const QHash<QString, Qt::KeyboardModifier> tokens = {
        {QStringLiteral("cmdorctrl"), Qt::ControlModifier},
        {QStringLiteral("commandorcontrol"), Qt::ControlModifier},
        {QStringLiteral("cmd"), Qt::ControlModifier},
        {QStringLiteral("command"), Qt::ControlModifier},
        {QStringLiteral("super"), Qt::ControlModifier},
        {QStringLiteral("ctrl"), kControlKeyModifier},
        {QStringLiteral("control"), kControlKeyModifier},
        {QStringLiteral("alt"), Qt::AltModifier},
        {QStringLiteral("option"), Qt::AltModifier},
        {QStringLiteral("shift"), Qt::ShiftModifier},
        {QStringLiteral("meta"), Qt::MetaModifier},
    };
    return tokens;
}

bool fail(QString* error, const QString& message)
{
    if (error)
        *error = message;
    return false;
}

} // namespace

bool parse(const QString& accelerator, QKeySequence& out, QString* error)
{
    out = QKeySequence();

    const QString text = accelerator.trimmed();
    if (text.isEmpty())
        return fail(error, QStringLiteral("Shortcut is empty."));

    QStringList tokens = text.split(QLatin1Char('+'));
    QString keyToken = tokens.takeLast().trimmed();
    if (keyToken.isEmpty() && (text == QLatin1String("+") || text.endsWith(QLatin1String("++")))) {
        // "Ctrl++" splits into {"Ctrl", "", ""}
        keyToken = QStringLiteral("+");
        if (!tokens.isEmpty() && tokens.constLast().trimmed().isEmpty())
            tokens.removeLast();
    }
    if (keyToken.isEmpty())
        return fail(error, QStringLiteral("Shortcut '%1' has no key.").arg(accelerator));

    Qt::KeyboardModifiers modifiers;
    for (const QString& raw : std::as_const(tokens)) {
        const QString token = raw.trimmed().toLower();
        const auto it = modifierTokens().constFind(token);
        if (it == modifierTokens().constEnd())
            return fail(error, QStringLiteral("Shortcut '%1' has unknown modifier '%2'.").arg(accelerator, raw.trimmed()));
        modifiers |= it.value();
    }

    if (keyToken.size() == 1)
        keyToken = keyToken.toUpper();

    const QKeySequence keyOnly = QKeySequence::fromString(keyToken, QKeySequence::PortableText);
    if (keyOnly.count() != 1 || keyOnly[0].key() == Qt::Key_unknown)
        return fail(error, QStringLiteral("Shortcut '%1' has unknown key '%2'.").arg(accelerator, keyToken));

    const Qt::KeyboardModifiers keyModifiers = keyOnly[0].keyboardModifiers();
    if (keyModifiers != Qt::NoModifier)
        return fail(error, QStringLiteral("Shortcut '%1' has unknown key '%2'.").arg(accelerator, keyToken));

    out = QKeySequence(QKeyCombination(modifiers, keyOnly[0].key()));
    if (error)
        error->clear();
    return true;
}

QString normalize(const QString& accelerator)
{
    QKeySequence sequence;
    if (!parse(accelerator, sequence))
        return {};
    return sequence.toString(QKeySequence::PortableText);
}

} // namespace Spotlight::ShortcutSequence
