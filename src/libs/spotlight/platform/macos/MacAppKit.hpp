// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

// Objective-C++ only.

#import <AppKit/AppKit.h>

#include <QtWidgets/QWidget>

#include <functional>

namespace Spotlight::Internal {

// NSWindow hosting \a widget's native view; creates the native window if needed.
inline NSWindow* nativeWindow(QWidget* widget)
{
    if (!widget)
        return nil;
    NSView* view = (__bridge NSView*)reinterpret_cast<void*>(widget->winId());
    return view ? view.window : nil;
}

inline void runOnMainThread(const std::function<void()>& fn)
{
    if ([NSThread isMainThread]) {
        fn();
        return;
    }
    dispatch_sync(dispatch_get_main_queue(), ^{
        fn();
    });
}

} // namespace Spotlight::Internal
