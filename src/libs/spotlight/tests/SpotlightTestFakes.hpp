// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/ShortcutSequence.hpp"
#include "spotlight/api/IGlobalShortcutBackend.hpp"
#include "spotlight/api/IMonitorLocator.hpp"
#include "spotlight/api/IPanel.hpp"
#include "spotlight/api/IPanelFactory.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QSet>
#include <QtWidgets/QApplication>
#include <QtWidgets/QWidget>

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace Spotlight::Tests {

inline QApplication* ensureApp()
{
    static QApplication* app = []() {
        if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
            qputenv("QT_QPA_PLATFORM", QByteArrayLiteral("offscreen"));

        static int argc = 1;
        static char arg0[] = "spotlight-tests";
        static char* argv[] = {arg0, nullptr};
        return new QApplication(argc, argv);
    }();
    return app;
}

class FakePanel final : public Api::IPanel {
public:
    bool isVisible() const override { return visible.load(); }

    void show() override
    {
        ++showCalls;
        visible.store(true);
    }

    void hide() override
    {
        ++hideCalls;
        visible.store(false);
    }

    void setLevel(int value) override { level = value; }
    void setNonActivating(bool value) override { nonActivating = value; }
    void setCollectionBehavior(Api::PanelCollectionBehaviors value) override { behavior = value; }
    void setFocusLossHandler(FocusLossHandler handler) override { focusLost = std::move(handler); }

    QSize size() const override { return panelSize; }
    void moveTo(const QPoint& origin) override { movedTo = origin; }

    // Simulates the native window resigning key status.
    void loseFocus()
    {
        if (focusLost)
            focusLost();
    }

    std::atomic<bool> visible{false};
    std::atomic<int> showCalls{0};
    std::atomic<int> hideCalls{0};

    std::optional<int> level;
    bool nonActivating = false;
    Api::PanelCollectionBehaviors behavior;
    FocusLossHandler focusLost;
    QSize panelSize{800, 600};
    std::optional<QPoint> movedTo;
};

class FakePanelFactory final : public Api::IPanelFactory {
public:
    bool supportsPanels() const override { return supported; }

    Api::PanelHandle createPanel(QWidget* window, QString* error = nullptr) override
    {
        ++createCalls;
        if (throwOnCreate)
            throw std::runtime_error("native conversion crashed");
        if (failOnCreate) {
            if (error)
                *error = QStringLiteral("not a panel");
            return {};
        }

        auto panel = std::make_shared<FakePanel>();
        QMutexLocker locker(&mutex);
        panels.insert(window ? window->objectName() : QString(), panel);
        return panel;
    }

    std::shared_ptr<FakePanel> panelFor(const QString& label) const
    {
        QMutexLocker locker(&mutex);
        return panels.value(label);
    }

    bool supported = true;
    bool failOnCreate = false;
    bool throwOnCreate = false;
    std::atomic<int> createCalls{0};

    mutable QMutex mutex;
    QHash<QString, std::shared_ptr<FakePanel>> panels;
};

class FakeShortcutBackend final : public Api::IGlobalShortcutBackend {
public:
    bool isRegistered(const QKeySequence& shortcut) const override
    {
        QMutexLocker locker(&mutex);
        return callbacks.contains(keyOf(shortcut));
    }

    Api::ShortcutRegistrationStatus registerShortcut(const QKeySequence& shortcut,
                                                     Callback callback,
                                                     QString* error = nullptr) override
    {
        QMutexLocker locker(&mutex);
        const QString key = keyOf(shortcut);
        ++registrationCounts[key];
        if (claimedElsewhere.contains(key) || callbacks.contains(key)) {
            if (error)
                *error = QStringLiteral("taken");
            return Api::ShortcutRegistrationStatus::AlreadyRegistered;
        }
        callbacks.insert(key, std::move(callback));
        return Api::ShortcutRegistrationStatus::Registered;
    }

    // Marks \a accelerator as owned by another application.
    void claim(const QString& accelerator)
    {
        QMutexLocker locker(&mutex);
        claimedElsewhere.insert(ShortcutSequence::normalize(accelerator));
    }

    // Fires the callback registered for \a accelerator. Returns false if none is.
    bool trigger(const QString& accelerator)
    {
        Callback callback;
        {
            QMutexLocker locker(&mutex);
            callback = callbacks.value(ShortcutSequence::normalize(accelerator));
        }
        if (!callback)
            return false;
        callback();
        return true;
    }

    int registrationCount(const QString& accelerator) const
    {
        QMutexLocker locker(&mutex);
        return registrationCounts.value(ShortcutSequence::normalize(accelerator));
    }

    int registeredCount() const
    {
        QMutexLocker locker(&mutex);
        return int(callbacks.size());
    }

private:
    static QString keyOf(const QKeySequence& shortcut) { return shortcut.toString(QKeySequence::PortableText); }

    mutable QMutex mutex;
    QHash<QString, Callback> callbacks;
    QHash<QString, int> registrationCounts;
    QSet<QString> claimedElsewhere;
};

class FakeMonitorLocator final : public Api::IMonitorLocator {
public:
    std::optional<Api::MonitorInfo> monitorUnderPointer() const override { return monitor; }

    std::optional<Api::MonitorInfo> monitor;
};

} // namespace Spotlight::Tests
