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
#include "magnification_math.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kRadToDeg = 180.0 / std::numbers::pi;

} // anonymous namespace

float Magnification_FromFov(float rawFov, float referenceFov) {
    if (!std::isfinite(rawFov) || rawFov <= optic_config::kMinConfidentFov) return 1.0f;
    return std::max(referenceFov / rawFov, 1.0f);
}

float Magnification_ToFov(float magnification, float referenceFov) {
    if (!std::isfinite(magnification) || magnification <= 0.0f) return referenceFov;
    return referenceFov / magnification;
}

float Magnification_CorrectedFov(float baseFov, float magnification) {
    const double mag = std::max(static_cast<double>(magnification), 1.0);
    const double halfBase = static_cast<double>(baseFov) * kDegToRad * 0.5;
    const double resultRad = 2.0 * std::atan2(std::tan(halfBase), mag);
    return static_cast<float>(resultRad * kRadToDeg);
}
