// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

namespace kestrel::anim {

/**
 * A time based tween. Interpolate is driven with the local time in seconds.
 */
class Action {
public:
    virtual ~Action() = default;

    /// Returns true while the action is still running at time t.
    /// Actions sample their content at t * speed; length is in content time.
    virtual bool Interpolate(double t) = 0;

    double GetLength() const { return length; }
    void SetLength(double value) { length = value; }

    double GetSpeed() const { return speed; }
    void SetSpeed(double value) { speed = value; }

protected:
    double length = 0.0;
    double speed = 1.0;
};

} // namespace kestrel::anim
