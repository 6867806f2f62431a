// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "spotlight/PanelActivation.hpp"

namespace Spotlight::Internal {

Api::PanelCollectionBehaviors spotlightCollectionBehavior()
{
    return Api::PanelCollectionBehavior::Transient
           | Api::PanelCollectionBehavior::MoveToActiveSpace
           | Api::PanelCollectionBehavior::FullScreenAuxiliary;
}

SpotlightError activatePanel(Api::IPanelFactory& factory,
                             QWidget* window,
                             const WindowConfig& config,
                             Api::IPanel::FocusLossHandler onFocusLost,
                             Api::PanelHandle& out)
{
    out.reset();

    QString error;
    Api::PanelHandle panel = factory.createPanel(window, &error);
    if (!panel) {
        return {SpotlightErrorCode::PanelConversion,
                QStringLiteral("Window '%1' cannot be converted to a panel: %2").arg(config.label, error)};
    }

    panel->setLevel(config.effectiveStackingLevel());
    panel->setNonActivating(true);
    panel->setCollectionBehavior(spotlightCollectionBehavior());

    if (config.effectiveAutoHide() && onFocusLost)
        panel->setFocusLossHandler(std::move(onFocusLost));

    out = std::move(panel);
    return SpotlightError::none();
}

} // namespace Spotlight::Internal
