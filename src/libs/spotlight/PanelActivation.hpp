// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "spotlight/SpotlightConfig.hpp"
#include "spotlight/SpotlightError.hpp"
#include "spotlight/SpotlightGlobal.hpp"
#include "spotlight/api/IPanel.hpp"
#include "spotlight/api/IPanelFactory.hpp"

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Spotlight::Internal {

SPOTLIGHT_EXPORT Api::PanelCollectionBehaviors spotlightCollectionBehavior();

// Turns \a window into a floating, non-activating panel configured from
// \a config. \a onFocusLost is attached only when auto-hide is enabled.
SPOTLIGHT_EXPORT SpotlightError activatePanel(Api::IPanelFactory& factory,
                                              QWidget* window,
                                              const WindowConfig& config,
                                              Api::IPanel::FocusLossHandler onFocusLost,
                                              Api::PanelHandle& out);

} // namespace Spotlight::Internal
