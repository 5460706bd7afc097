/*
 * Copyright (C) 2026 acerthyracer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include "scroll_zoom.h"

#include "config_manager.h"
#include "logger.h"
#include "magnification_math.h"
#include "scene_query.h"

#include <algorithm>
#include <cmath>
#include <exception>

void ScrollZoom::DiscoverRange(const SceneNode& optic) {
    if (m_rangeDiscovered) return;
    m_rangeDiscovered = true;

    m_nativeMinFov = m_nativeFov;
    m_nativeMaxFov = m_nativeFov;
    m_isVariableZoom = false;

    try {
        const IZoomHandler* handler = SceneQuery_CapabilityInSelfOrAncestors<IZoomHandler>(optic);
        if (!handler) handler = SceneQuery_CapabilityInSelfOrDescendants<IZoomHandler>(optic);
        if (!handler) {
            LOG_DEBUG("[ScrollZoom] No zoom handler, fixed scope, scroll zoom disabled");
            return;
        }

        auto range = handler->NativeFovRange();
        if (!range || range->maxFov <= optic_config::kMinConfidentFov ||
            range->minFov <= optic_config::kMinConfidentFov || range->maxFov <= range->minFov) {
            LOG_DEBUG("[ScrollZoom] No usable FOV range, fixed scope at FOV={:.2f}", m_nativeFov);
            return;
        }

        m_nativeMaxFov = range->maxFov * optic_config::kHalfAngleScale;
        m_nativeMinFov = range->minFov * optic_config::kHalfAngleScale;
        m_isVariableZoom = true;
        LOG_INFO("[ScrollZoom] Discovered FOV range: {:.2f} - {:.2f} (variable zoom)",
                 m_nativeMinFov, m_nativeMaxFov);
    } catch (const std::exception& ex) {
        LOG_DEBUG("[ScrollZoom] Range discovery threw: {}", ex.what());
    }
}

void ScrollZoom::ObserveNativeFov(float scopeFov) {
    if (scopeFov <= optic_config::kMinConfidentFov) return;
    m_nativeFov = scopeFov;

    if (!IsActive()) return;

    if (std::abs(scopeFov - m_lastNativeFov) > optic_config::kModeSwitchEpsilon) {
        LOG_INFO("[ScrollZoom] Native FOV changed {:.2f} -> {:.2f}, resetting scroll zoom",
                 m_lastNativeFov, scopeFov);
        m_active = false;
        m_overrideFov = 0.0f;
    } else {
        m_lastNativeFov = scopeFov;
    }
}

bool ScrollZoom::HandleScroll(float scrollDelta, const ZoomConfig& config) {
    if (!config.enableScrollZoom) return false;
    if (!std::isfinite(scrollDelta) || std::abs(scrollDelta) < scroll_config::kMinScrollDelta) return false;
    if (!m_isVariableZoom) return false;

    float minFov = m_nativeMinFov;
    float maxFov = m_nativeMaxFov;

    // Native limits inset by kBoundaryInset, or the raw limits for very narrow ranges
    float hardMinFov = m_nativeMinFov + scroll_config::kBoundaryInset;
    float hardMaxFov = m_nativeMaxFov - scroll_config::kBoundaryInset;
    if (hardMaxFov <= hardMinFov + scroll_config::kMinInsetRange) {
        hardMinFov = m_nativeMinFov;
        hardMaxFov = m_nativeMaxFov;
    }

    // Config limits are magnification units, 0 = native
    if (config.scrollZoomMax > 0.0f) minFov = Magnification_ToFov(config.scrollZoomMax);
    if (config.scrollZoomMin > 0.0f) maxFov = Magnification_ToFov(config.scrollZoomMin);

    minFov = std::clamp(minFov, hardMinFov, hardMaxFov);
    maxFov = std::clamp(maxFov, hardMinFov, hardMaxFov);
    if (maxFov <= minFov + scroll_config::kMinUsableRange) {
        minFov = hardMinFov;
        maxFov = hardMaxFov;
    }

    if (!m_active) {
        m_overrideFov = m_nativeFov;
        m_lastNativeFov = m_nativeFov;
        m_active = true;
    }

    const float factor = 1.0f + config.scrollZoomSensitivity;
    if (scrollDelta > 0.0f)
        m_overrideFov /= factor;
    else
        m_overrideFov *= factor;

    m_overrideFov = std::clamp(m_overrideFov, minFov, maxFov);

    LOG_INFO("[ScrollZoom] FOV={:.2f} (range={:.2f}-{:.2f})", m_overrideFov, minFov, maxFov);
    return true;
}

float ScrollZoom::EffectiveScopeFov() const {
    return IsActive() ? m_overrideFov : 0.0f;
}

void ScrollZoom::Reset() {
    m_active = false;
    m_overrideFov = 0.0f;
    m_lastNativeFov = 0.0f;
    m_rangeDiscovered = false;
    m_isVariableZoom = false;
}
