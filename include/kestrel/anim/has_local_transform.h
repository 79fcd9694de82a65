// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <string>

#include "kestrel/anim/transform.h"

namespace kestrel::anim {

/// Anything an animation can move: joints, spatials, cameras.
class HasLocalTransform {
public:
    virtual ~HasLocalTransform() = default;

    virtual Transform GetLocalTransform() const = 0;
    virtual void SetLocalTransform(const Transform& transform) = 0;
};

class Node : public HasLocalTransform {
public:
    explicit Node(std::string name = {}) : name(std::move(name)) {}

    const std::string& GetName() const { return name; }

    Transform GetLocalTransform() const override { return local; }
    void SetLocalTransform(const Transform& transform) override { local = transform; }

private:
    std::string name;
    Transform local;
};

} // namespace kestrel::anim
