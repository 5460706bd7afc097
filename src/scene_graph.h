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
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "cpp26/reflection.h"
#include "transform_math.h"

// ============================================================================
// HOST SCENE-GRAPH CONTRACT
// ============================================================================
// Implemented by the host renderer. Any method may throw std::exception when
// the underlying object has been destroyed; callers isolate such failures.
// Nodes and components are borrowed, never owned.
// ============================================================================

class SceneNode;

class Component {
public:
    virtual ~Component() = default;

    // Runtime descriptor of the component's data shape
    virtual const cpp26::reflect::TypeInfo& Type() const = 0;
    // Pointer handed to the descriptor's field accessors
    virtual const void* Instance() const = 0;
    virtual const SceneNode& Owner() const = 0;
};

class SceneNode {
public:
    virtual ~SceneNode() = default;

    virtual std::string_view Name() const = 0;
    virtual const SceneNode* Parent() const = 0;

    virtual std::size_t ChildCount() const = 0;
    virtual const SceneNode* Child(std::size_t index) const = 0;

    virtual std::size_t ComponentCount() const = 0;
    virtual const Component* ComponentAt(std::size_t index) const = 0;

    virtual Pose WorldPose() const = 0;
};

// Native half-angle FOV range of a variable-zoom optic.
// maxFov = lowest zoom, minFov = highest zoom.
struct FovRange {
    float maxFov = 0.0f;
    float minFov = 0.0f;
};

// Capability exposed by the host's live zoom handler component.
// Values use the handler's half-angle convention.
class IZoomHandler {
public:
    virtual ~IZoomHandler() = default;

    virtual float FieldOfView() const = 0;
    virtual std::optional<FovRange> NativeFovRange() const = 0;
};

// Adapts a reflected struct into a Component. Hosts that author their
// camera-data structs in C++ attach these to their nodes.
template <typename T>
class ReflectedComponent : public Component {
public:
    ReflectedComponent(const SceneNode& owner, T data)
        : m_owner(owner), m_data(std::move(data)) {}

    const cpp26::reflect::TypeInfo& Type() const override {
        return cpp26::reflect::StructInfo<T>::info();
    }
    const void* Instance() const override { return &m_data; }
    const SceneNode& Owner() const override { return m_owner; }

    T& Data() { return m_data; }
    const T& Data() const { return m_data; }

private:
    const SceneNode& m_owner;
    T m_data;
};
