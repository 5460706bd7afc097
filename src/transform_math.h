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
#include <cmath>

struct Vec3 {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(const Vec3& a, float s) { return {a.x * s, a.y * s, a.z * s}; }

inline float Dot3(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline Vec3 Cross3(const Vec3& a, const Vec3& b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}
inline float SqrLength3(const Vec3& v) { return Dot3(v, v); }
inline float Length3(const Vec3& v) { return std::sqrt(Dot3(v, v)); }

// a + (b - a) * t, t clamped to [0, 1]
inline Vec3 Lerp3(const Vec3& a, const Vec3& b, float t) {
  if (t < 0.0f) t = 0.0f;
  if (t > 1.0f) t = 1.0f;
  return a + (b - a) * t;
}

// Unit quaternion, (x, y, z) vector part, w scalar part
struct Quat {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
  float w = 1.0f;
};

inline Quat Conjugate(const Quat& q) { return {-q.x, -q.y, -q.z, q.w}; }

inline Vec3 Rotate(const Quat& q, const Vec3& v) {
  // v' = v + 2w(u x v) + 2(u x (u x v))
  const Vec3 u{q.x, q.y, q.z};
  const Vec3 t = Cross3(u, v) * 2.0f;
  return v + t * q.w + Cross3(u, t);
}

inline Quat AxisAngle(const Vec3& axis, float radians) {
  const float len = Length3(axis);
  if (len <= 0.0f) return {};
  const float s = std::sin(radians * 0.5f) / len;
  return {axis.x * s, axis.y * s, axis.z * s, std::cos(radians * 0.5f)};
}

// Rigid world transform of a scene node (no scale)
struct Pose {
  Vec3 position;
  Quat rotation;
};

// World-space point expressed in the pose's local frame
inline Vec3 InverseTransformPoint(const Pose& pose, const Vec3& worldPoint) {
  return Rotate(Conjugate(pose.rotation), worldPoint - pose.position);
}
