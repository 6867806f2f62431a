// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightGlobal.hpp"

#include <QtCore/QFlags>
#include <QtCore/QPoint>
#include <QtCore/QSize>

#include <functional>
#include <memory>

namespace Spotlight::Api {

enum class PanelCollectionBehavior : quint8 {
    None = 0,
    Transient = 1 << 0,
    MoveToActiveSpace = 1 << 1,
    FullScreenAuxiliary = 1 << 2
};
Q_DECLARE_FLAGS(PanelCollectionBehaviors, PanelCollectionBehavior)

// Native overlay panel wrapping an application window. Implementations must
// tolerate calls from any thread; show/hide on an already shown/hidden panel
// is a no-op.
class SPOTLIGHT_EXPORT IPanel {
public:
    using FocusLossHandler = std::function<void()>;

    virtual ~IPanel() = default;

    virtual bool isVisible() const = 0;
    virtual void show() = 0;
    virtual void hide() = 0;

    virtual void setLevel(int level) = 0;
    virtual void setNonActivating(bool nonActivating) = 0;
    virtual void setCollectionBehavior(PanelCollectionBehaviors behavior) = 0;
    virtual void setFocusLossHandler(FocusLossHandler handler) = 0;

    // Logical coordinates.
    virtual QSize size() const = 0;
    virtual void moveTo(const QPoint& origin) = 0;
};

using PanelHandle = std::shared_ptr<IPanel>;

} // namespace Spotlight::Api

Q_DECLARE_OPERATORS_FOR_FLAGS(Spotlight::Api::PanelCollectionBehaviors)
