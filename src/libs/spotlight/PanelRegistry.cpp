// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/PanelRegistry.hpp"

#include <utils/Macros.hpp>

#include <QtCore/QReadWriteLock>

#include <algorithm>

namespace Spotlight::Internal {

SpotlightError PanelRegistry::insertOnce(const QString& label, const Activator& activate, bool* inserted)
{
    if (inserted)
        *inserted = false;

    {
        QWriteLocker locker(&m_lock);
        if (m_poisoned.contains(label))
            return SpotlightError::lock(label);
        if (m_panels.contains(label) || m_pending.contains(label))
            return SpotlightError::none();
        m_pending.insert(label);
    }

    Api::PanelHandle handle;
    SpotlightError error;
    {
        UTILS_ON_UNWIND(
            QWriteLocker unwindLocker(&m_lock);
            m_pending.remove(label);
            m_poisoned.insert(label);
        );
        if (activate)
            error = activate(handle);
    }

    QWriteLocker locker(&m_lock);
    m_pending.remove(label);
    if (!error.ok() || !handle)
        return error;

    m_panels.insert(label, std::move(handle));
    if (inserted)
        *inserted = true;
    return SpotlightError::none();
}

SpotlightError PanelRegistry::lookup(const QString& label, Api::PanelHandle& out) const
{
    out.reset();

    QReadLocker locker(&m_lock);
    if (m_poisoned.contains(label))
        return SpotlightError::lock(label);

    const auto it = m_panels.constFind(label);
    if (it == m_panels.constEnd())
        return SpotlightError::notFound(label);

    out = it.value();
    return SpotlightError::none();
}

SpotlightError PanelRegistry::resolve(const QString& label, Api::PanelHandle& out) const
{
    const SpotlightError error = lookup(label, out);
    if (error.code() == SpotlightErrorCode::NotFound)
        return SpotlightError::none();
    return error;
}

SpotlightError PanelRegistry::show(const QString& label)
{
    Api::PanelHandle panel;
    const SpotlightError error = resolve(label, panel);
    UTILS_GUARD_RET(error.ok(), error);

    if (panel && !panel->isVisible())
        panel->show();
    return SpotlightError::none();
}

SpotlightError PanelRegistry::hide(const QString& label)
{
    Api::PanelHandle panel;
    const SpotlightError error = resolve(label, panel);
    UTILS_GUARD_RET(error.ok(), error);

    if (panel && panel->isVisible())
        panel->hide();
    return SpotlightError::none();
}

SpotlightError PanelRegistry::toggle(const QString& label)
{
    Api::PanelHandle panel;
    const SpotlightError error = resolve(label, panel);
    UTILS_GUARD_RET(error.ok(), error);
    if (!panel)
        return SpotlightError::none();

    if (panel->isVisible())
        panel->hide();
    else
        panel->show();
    return SpotlightError::none();
}

SpotlightError PanelRegistry::hideAll(const QStringList& labels)
{
    SpotlightError first = SpotlightError::none();
    for (const QString& label : labels) {
        const SpotlightError error = hide(label);
        if (!error.ok() && first.ok())
            first = error;
    }
    return first;
}

bool PanelRegistry::isPoisoned(const QString& label) const
{
    QReadLocker locker(&m_lock);
    return m_poisoned.contains(label);
}

int PanelRegistry::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_panels.size());
}

QStringList PanelRegistry::labels() const
{
    QReadLocker locker(&m_lock);
    QStringList out = m_panels.keys();
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace Spotlight::Internal
