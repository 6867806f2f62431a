// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightError.hpp"
#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/IPanel.hpp"

#include <QtCore/QHash>
#include <QtCore/QReadWriteLock>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <functional>

namespace Spotlight::Internal {

// Thread-safe label -> panel map. Entries are inserted at most once and never
// removed. The lock guards only the map; panel calls happen unlocked.
class SPOTLIGHT_EXPORT PanelRegistry final
{
public:
    using Activator = std::function<SpotlightError(Api::PanelHandle& out)>;

    PanelRegistry() = default;
    PanelRegistry(const PanelRegistry&) = delete;
    PanelRegistry& operator=(const PanelRegistry&) = delete;

    // Reserves \a label, runs \a activate without holding the lock and stores
    // the produced handle. A label that is registered or being registered is
    // left alone. If \a activate throws, the label is poisoned and the
    // exception propagates.
    SpotlightError insertOnce(const QString& label, const Activator& activate, bool* inserted = nullptr);

    SpotlightError lookup(const QString& label, Api::PanelHandle& out) const;

    SpotlightError show(const QString& label);
    SpotlightError hide(const QString& label);
    SpotlightError toggle(const QString& label);

    // Hides every listed label that has a panel. Poisoned labels are skipped and
    // the first such error is returned once the whole list has been walked.
    SpotlightError hideAll(const QStringList& labels);

    bool isPoisoned(const QString& label) const;
    int size() const;
    QStringList labels() const;

private:
    // Resolves the handle for show/hide/toggle; absent entries yield a null handle.
    SpotlightError resolve(const QString& label, Api::PanelHandle& out) const;

    mutable QReadWriteLock m_lock;
    QHash<QString, Api::PanelHandle> m_panels;
    QSet<QString> m_pending;
    QSet<QString> m_poisoned;
};

} // namespace Spotlight::Internal
