// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/platform/macos/MacGlobalShortcutBackend.hpp"

#include <Carbon/Carbon.h>

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>

#include <optional>
#include <utility>

namespace Spotlight::Internal {

namespace {

constexpr OSType kHotKeySignature = 'SPTL';

std::optional<UInt32> virtualKeyCode(Qt::Key key)
{
    static const QHash<int, UInt32> kKeys = {
        {Qt::Key_A, kVK_ANSI_A}, {Qt::Key_B, kVK_ANSI_B}, {Qt::Key_C, kVK_ANSI_C},
        {Qt::Key_D, kVK_ANSI_D}, {Qt::Key_E, kVK_ANSI_E}, {Qt::Key_F, kVK_ANSI_F},
        {Qt::Key_G, kVK_ANSI_G}, {Qt::Key_H, kVK_ANSI_H}, {Qt::Key_I, kVK_ANSI_I},
        {Qt::Key_J, kVK_ANSI_J}, {Qt::Key_K, kVK_ANSI_K}, {Qt::Key_L, kVK_ANSI_L},
        {Qt::Key_M, kVK_ANSI_M}, {Qt::Key_N, kVK_ANSI_N}, {Qt::Key_O, kVK_ANSI_O},
        {Qt::Key_P, kVK_ANSI_P}, {Qt::Key_Q, kVK_ANSI_Q}, {Qt::Key_R, kVK_ANSI_R},
        {Qt::Key_S, kVK_ANSI_S}, {Qt::Key_T, kVK_ANSI_T}, {Qt::Key_U, kVK_ANSI_U},
        {Qt::Key_V, kVK_ANSI_V}, {Qt::Key_W, kVK_ANSI_W}, {Qt::Key_X, kVK_ANSI_X},
        {Qt::Key_Y, kVK_ANSI_Y}, {Qt::Key_Z, kVK_ANSI_Z},
        {Qt::Key_0, kVK_ANSI_0}, {Qt::Key_1, kVK_ANSI_1}, {Qt::Key_2, kVK_ANSI_2},
        {Qt::Key_3, kVK_ANSI_3}, {Qt::Key_4, kVK_ANSI_4}, {Qt::Key_5, kVK_ANSI_5},
        {Qt::Key_6, kVK_ANSI_6}, {Qt::Key_7, kVK_ANSI_7}, {Qt::Key_8, kVK_ANSI_8},
        {Qt::Key_9, kVK_ANSI_9},
        {Qt::Key_F1, kVK_F1}, {Qt::Key_F2, kVK_F2}, {Qt::Key_F3, kVK_F3},
        {Qt::Key_F4, kVK_F4}, {Qt::Key_F5, kVK_F5}, {Qt::Key_F6, kVK_F6},
        {Qt::Key_F7, kVK_F7}, {Qt::Key_F8, kVK_F8}, {Qt::Key_F9, kVK_F9},
        {Qt::Key_F10, kVK_F10}, {Qt::Key_F11, kVK_F11}, {Qt::Key_F12, kVK_F12},
        {Qt::Key_Escape, kVK_Escape}, {Qt::Key_Space, kVK_Space},
        {Qt::Key_Return, kVK_Return}, {Qt::Key_Enter, kVK_ANSI_KeypadEnter},
        {Qt::Key_Tab, kVK_Tab}, {Qt::Key_Backspace, kVK_Delete},
        {Qt::Key_Delete, kVK_ForwardDelete},
        {Qt::Key_Left, kVK_LeftArrow}, {Qt::Key_Right, kVK_RightArrow},
        {Qt::Key_Up, kVK_UpArrow}, {Qt::Key_Down, kVK_DownArrow},
        {Qt::Key_Home, kVK_Home}, {Qt::Key_End, kVK_End},
        {Qt::Key_PageUp, kVK_PageUp}, {Qt::Key_PageDown, kVK_PageDown},
        {Qt::Key_Minus, kVK_ANSI_Minus}, {Qt::Key_Equal, kVK_ANSI_Equal},
        {Qt::Key_Plus, kVK_ANSI_Equal}, {Qt::Key_Comma, kVK_ANSI_Comma},
        {Qt::Key_Period, kVK_ANSI_Period}, {Qt::Key_Slash, kVK_ANSI_Slash},
        {Qt::Key_Semicolon, kVK_ANSI_Semicolon}, {Qt::Key_Apostrophe, kVK_ANSI_Quote},
        {Qt::Key_BracketLeft, kVK_ANSI_LeftBracket}, {Qt::Key_BracketRight, kVK_ANSI_RightBracket},
        {Qt::Key_Backslash, kVK_ANSI_Backslash}, {Qt::Key_QuoteLeft, kVK_ANSI_Grave},
    };

    const auto it = kKeys.constFind(key);
    if (it == kKeys.constEnd())
        return std::nullopt;
    return it.value();
}

// Qt maps the Command key to ControlModifier and the Control key to MetaModifier.
UInt32 carbonModifiers(Qt::KeyboardModifiers modifiers)
{
    UInt32 result = 0;
    if (modifiers.testFlag(Qt::ControlModifier))
        result |= cmdKey;
    if (modifiers.testFlag(Qt::MetaModifier))
        result |= controlKey;
    if (modifiers.testFlag(Qt::AltModifier))
        result |= optionKey;
    if (modifiers.testFlag(Qt::ShiftModifier))
        result |= shiftKey;
    return result;
}

QString shortcutKey(const QKeySequence& shortcut)
{
    return shortcut.toString(QKeySequence::PortableText);
}

} // namespace

struct MacGlobalShortcutBackend::Private {
    struct Entry {
        EventHotKeyRef ref = nullptr;
        UInt32 id = 0;
        Callback callback;
    };

    mutable QMutex mutex;
    QHash<QString, Entry> entries;
    UInt32 nextId = 1;
    EventHandlerRef handler = nullptr;

    static OSStatus onHotKey(EventHandlerCallRef, EventRef event, void* userData)
    {
        EventHotKeyID hotKeyId{};
        const OSStatus status = GetEventParameter(event, kEventParamDirectObject, typeEventHotKeyID,
                                                  nullptr, sizeof(hotKeyId), nullptr, &hotKeyId);
        if (status != noErr || hotKeyId.signature != kHotKeySignature)
            return eventNotHandledErr;

        auto* self = static_cast<Private*>(userData);
        Callback callback;
        {
            QMutexLocker locker(&self->mutex);
            for (const Entry& entry : std::as_const(self->entries)) {
                if (entry.id == hotKeyId.id) {
                    callback = entry.callback;
                    break;
                }
            }
        }
        if (!callback)
            return eventNotHandledErr;

        callback();
        return noErr;
    }
};

MacGlobalShortcutBackend::MacGlobalShortcutBackend()
    : d(std::make_unique<Private>())
{
    const EventTypeSpec pressed{kEventClassKeyboard, kEventHotKeyPressed};
    const OSStatus status = InstallApplicationEventHandler(&Private::onHotKey, 1, &pressed, d.get(), &d->handler);
    if (status != noErr)
        qCWarning(spotlightlog) << "failed to install hot key handler, OSStatus" << status;
}

MacGlobalShortcutBackend::~MacGlobalShortcutBackend()
{
    QMutexLocker locker(&d->mutex);
    for (const Private::Entry& entry : std::as_const(d->entries))
        UnregisterEventHotKey(entry.ref);
    d->entries.clear();
    locker.unlock();

    if (d->handler)
        RemoveEventHandler(d->handler);
}

bool MacGlobalShortcutBackend::isRegistered(const QKeySequence& shortcut) const
{
    QMutexLocker locker(&d->mutex);
    return d->entries.contains(shortcutKey(shortcut));
}

Api::ShortcutRegistrationStatus MacGlobalShortcutBackend::registerShortcut(const QKeySequence& shortcut,
                                                                           Callback callback,
                                                                           QString* error)
{
    const auto fail = [error](Api::ShortcutRegistrationStatus status, const QString& message) {
        if (error)
            *error = message;
        return status;
    };

    if (shortcut.count() != 1)
        return fail(Api::ShortcutRegistrationStatus::Failed, QStringLiteral("only single-chord shortcuts are supported"));

    const QKeyCombination combination = shortcut[0];
    const std::optional<UInt32> keyCode = virtualKeyCode(combination.key());
    if (!keyCode)
        return fail(Api::ShortcutRegistrationStatus::Failed, QStringLiteral("key has no macOS virtual key code"));

    const QString key = shortcutKey(shortcut);
    QMutexLocker locker(&d->mutex);
    if (d->entries.contains(key))
        return fail(Api::ShortcutRegistrationStatus::AlreadyRegistered, QStringLiteral("already registered"));

    const EventHotKeyID hotKeyId{kHotKeySignature, d->nextId};
    EventHotKeyRef ref = nullptr;
    const OSStatus status = RegisterEventHotKey(*keyCode, carbonModifiers(combination.keyboardModifiers()),
                                                hotKeyId, GetApplicationEventTarget(), 0, &ref);
    if (status == eventHotKeyExistsErr)
        return fail(Api::ShortcutRegistrationStatus::AlreadyRegistered, QStringLiteral("claimed by another application"));
    if (status != noErr)
        return fail(Api::ShortcutRegistrationStatus::Failed, QStringLiteral("RegisterEventHotKey failed with OSStatus %1").arg(status));

    d->entries.insert(key, Private::Entry{ref, d->nextId, std::move(callback)});
    ++d->nextId;
    return Api::ShortcutRegistrationStatus::Registered;
}

} // namespace Spotlight::Internal
