// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/IMonitorLocator.hpp"

#include <QtCore/QPoint>
#include <QtCore/QSize>

namespace Spotlight {

// Monitor under QCursor::pos(), using the QScreen geometry scaled by its
// device pixel ratio. Must be called on the GUI thread.
class SPOTLIGHT_EXPORT QtMonitorLocator final : public Api::IMonitorLocator {
public:
    std::optional<Api::MonitorInfo> monitorUnderPointer() const override;
};

// Logical origin that centers a window of \a windowSize (logical) in the
// logical bounds of \a monitor.
SPOTLIGHT_EXPORT QPoint centeredOrigin(const Api::MonitorInfo& monitor, const QSize& windowSize);

} // namespace Spotlight
