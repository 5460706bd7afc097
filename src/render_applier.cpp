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
#include "render_applier.h"
#include "logger.h"

#include <algorithm>
#include <cmath>

namespace {

// Highest-detail LOD while scoped
constexpr int kScopedMaxLodLevel = 0;

} // namespace

RenderParameterApplier::RenderParameterApplier(IRenderSettings& settings) : m_settings(settings) {}

RenderParameterApplier::~RenderParameterApplier() {
    Restore();
}

void RenderParameterApplier::Apply(float magnification, std::optional<float> providerFarClip) {
    // Save originals only on the first apply, never on re-apply from a mode switch
    if (!m_saved) {
        SavedRenderState s;
        s.lodBias = m_settings.GetLodBias();
        s.maxLodLevel = m_settings.GetMaxLodLevel();
        s.farClip = m_settings.GetFarClipPlane();
        s.cullDistances = m_settings.GetLayerCullDistances();
        m_saved = std::move(s);

        LOG_DEBUG("[RenderApplier] Saved: lodBias={:.2f} farClip={:.0f} maxLOD={} layers={}",
                  m_saved->lodBias, m_saved->farClip, m_saved->maxLodLevel, m_saved->cullDistances.size());
    }

    const SavedRenderState& saved = *m_saved;
    const float scale = std::isfinite(magnification) ? std::max(magnification, 1.0f) : 1.0f;

    const float lodBias = saved.lodBias * scale;
    m_settings.SetLodBias(lodBias);

    // TODO: apply Render.maxLodLevelOverride here when it is non-zero instead of forcing 0
    m_settings.SetMaxLodLevel(kScopedMaxLodLevel);

    float farClip = saved.farClip;
    if (providerFarClip && *providerFarClip > farClip) farClip = *providerFarClip;
    m_settings.SetFarClipPlane(farClip);

    if (!saved.cullDistances.empty()) {
        std::vector<float> cull = saved.cullDistances;
        for (float& d : cull) {
            if (d > 0.0f) d *= scale;
        }
        m_settings.SetLayerCullDistances(cull);
    }

    LOG_INFO("[RenderApplier] Applied: lodBias {:.2f}->{:.2f} (mag={:.1f}x) farClip={:.0f} maxLOD={}",
             saved.lodBias, lodBias, scale, farClip, kScopedMaxLodLevel);
}

void RenderParameterApplier::Restore() {
    if (!m_saved) return;

    const SavedRenderState& saved = *m_saved;
    m_settings.SetLodBias(saved.lodBias);
    m_settings.SetMaxLodLevel(saved.maxLodLevel);
    m_settings.SetFarClipPlane(saved.farClip);
    if (!saved.cullDistances.empty()) m_settings.SetLayerCullDistances(saved.cullDistances);

    LOG_INFO("[RenderApplier] Restored: lodBias={:.2f} farClip={:.0f} maxLOD={}",
             saved.lodBias, saved.farClip, saved.maxLodLevel);

    m_saved.reset();
}
