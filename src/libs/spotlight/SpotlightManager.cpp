// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/SpotlightManager.hpp"
#include "spotlight/MonitorLocator.hpp"
#include "spotlight/NullSpotlightManager.hpp"
#include "spotlight/PanelActivation.hpp"
#include "spotlight/ShortcutWiring.hpp"

#if defined(Q_OS_MACOS)
#include "spotlight/platform/macos/MacGlobalShortcutBackend.hpp"
#include "spotlight/platform/macos/MacPanelFactory.hpp"
#endif

#include <QtCore/QMetaObject>
#include <QtCore/QMutexLocker>
#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

namespace Spotlight {

SpotlightManager::SpotlightManager(PluginConfig config,
                                   std::unique_ptr<Api::IPanelFactory> panelFactory,
                                   std::unique_ptr<Api::IGlobalShortcutBackend> shortcuts,
                                   std::unique_ptr<Api::IMonitorLocator> monitors,
                                   QObject* parent)
    : ISpotlightManager(parent)
    , m_config(std::move(config))
    , m_panelFactory(std::move(panelFactory))
    , m_shortcuts(std::move(shortcuts))
    , m_monitors(std::move(monitors))
{
    Q_ASSERT(m_panelFactory);
    Q_ASSERT(m_shortcuts);
}

// Drops the shortcut backend first so no callback can reach a half-destroyed manager.
SpotlightManager::~SpotlightManager()
{
    m_shortcuts.reset();
}

const PluginConfig& SpotlightManager::config() const
{
    return m_config;
}

bool SpotlightManager::supportsPanels() const
{
    return m_panelFactory && m_panelFactory->supportsPanels();
}

SpotlightError SpotlightManager::initSpotlightWindow(QWidget* window)
{
    if (!window)
        return SpotlightError::none();

    const QString label = window->objectName();
    const std::optional<WindowConfig> windowConfig = m_config.windowConfig(label);
    if (!windowConfig)
        return SpotlightError::none();

    if (!supportsPanels()) {
        qCDebug(spotlightlog) << "panels unsupported, leaving" << label << "as a normal window";
        return SpotlightError::none();
    }

    const auto activate = [this, window, &windowConfig, &label](Api::PanelHandle& out) {
        QPointer<SpotlightManager> self(this);
        auto onFocusLost = [self, label]() {
            if (self)
                self->post(PanelRequest::Hide, label);
        };
        return Internal::activatePanel(*m_panelFactory, window, *windowConfig, std::move(onFocusLost), out);
    };

    bool inserted = false;
    const SpotlightError error = m_registry.insertOnce(label, activate, &inserted);
    if (!error.ok() || !inserted)
        return error;

    qCInfo(spotlightlog) << "registered spotlight panel" << label;
    emit panelRegistered(label);

    return wireShortcuts(*windowConfig);
}

SpotlightError SpotlightManager::wireShortcuts(const WindowConfig& config)
{
    QPointer<SpotlightManager> self(this);
    const QString label = config.label;

    SpotlightError error = Internal::registerWindowShortcut(*m_shortcuts, config, [self, label]() {
        if (self)
            self->post(PanelRequest::Toggle, label);
    });
    if (!error.ok())
        return error;

    // Serialized so concurrently initializing windows register it once.
    QMutexLocker locker(&m_shortcutMutex);
    return Internal::registerCloseShortcut(*m_shortcuts, m_config.globalCloseShortcut, [self]() {
        if (self)
            self->post(PanelRequest::HideAll);
    });
}

SpotlightError SpotlightManager::panel(const QString& label, Api::PanelHandle& out) const
{
    return m_registry.lookup(label, out);
}

SpotlightError SpotlightManager::show(const QString& label)
{
    qCDebug(spotlightlog) << "show" << label;
    return m_registry.show(label);
}

SpotlightError SpotlightManager::hide(const QString& label)
{
    qCDebug(spotlightlog) << "hide" << label;
    return m_registry.hide(label);
}

SpotlightError SpotlightManager::toggle(const QString& label)
{
    qCDebug(spotlightlog) << "toggle" << label;
    return m_registry.toggle(label);
}

SpotlightError SpotlightManager::hideAll()
{
    qCDebug(spotlightlog) << "hide all panels";
    return m_registry.hideAll(m_config.labels());
}

SpotlightError SpotlightManager::center(const QString& label)
{
    Api::PanelHandle panel;
    const SpotlightError error = m_registry.lookup(label, panel);
    if (error.code() == SpotlightErrorCode::NotFound)
        return SpotlightError::none();
    if (!error.ok())
        return error;

    if (!m_monitors)
        return SpotlightError::none();

    const std::optional<Api::MonitorInfo> monitor = m_monitors->monitorUnderPointer();
    if (!monitor) {
        qCDebug(spotlightlog) << "no monitor under pointer, not centering" << label;
        return SpotlightError::none();
    }

    panel->moveTo(centeredOrigin(*monitor, panel->size()));
    return SpotlightError::none();
}

void SpotlightManager::post(PanelRequest request, const QString& label)
{
    QMetaObject::invokeMethod(this, [this, request, label]() { dispatch(request, label); }, Qt::AutoConnection);
}

void SpotlightManager::dispatch(PanelRequest request, const QString& label)
{
    SpotlightError error;
    switch (request) {
        case PanelRequest::Toggle:
            error = toggle(label);
            break;
        case PanelRequest::Hide:
            error = hide(label);
            break;
        case PanelRequest::HideAll:
            error = hideAll();
            break;
    }

    if (!error.ok()) {
        qCWarning(spotlightlog).noquote()
            << QStringLiteral("Spotlight request for '%1' failed: %2").arg(label, error.message());
    }
}

ISpotlightManager* createPlatformManager(const PluginConfig& config, QObject* parent)
{
#if defined(Q_OS_MACOS)
    return new SpotlightManager(config,
                                std::make_unique<Internal::MacPanelFactory>(),
                                std::make_unique<Internal::MacGlobalShortcutBackend>(),
                                std::make_unique<QtMonitorLocator>(),
                                parent);
#else
    return new NullSpotlightManager(config, parent);
#endif
}

} // namespace Spotlight
