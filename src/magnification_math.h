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
#pragma once

#include "scopeview_config.h"

// Optic magnification from a raw (already doubled) scope FOV in degrees.
// referenceFov / rawFov, floored at 1. Unresolved FOVs (<= kMinConfidentFov)
// yield 1.
float Magnification_FromFov(float rawFov, float referenceFov = optic_config::kReferenceFov);

// Raw scope FOV that produces the given magnification (inverse of the above,
// used to convert magnification-unit config values into FOV space).
float Magnification_ToFov(float magnification, float referenceFov = optic_config::kReferenceFov);

// Main camera FOV (degrees) that shows the scene at `magnification` relative
// to baseFov: 2 * atan(tan(baseFov / 2) / magnification).
// Magnifications below 1 are treated as 1.
float Magnification_CorrectedFov(float baseFov, float magnification);
