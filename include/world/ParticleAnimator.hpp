/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PARTICLE_ANIMATOR_HPP
#define PARTICLE_ANIMATOR_HPP

#include "world/TreeParticle.hpp"

namespace TinselEngine {

/**
 * @brief Per-step inputs shared by every particle
 */
struct FrameContext {
    float deltaTime{0.0f};      // Seconds since the previous step
    float elapsedTime{0.0f};    // Seconds since the scene started
    TreeLayout layout{TreeLayout::Assembled};
};

/**
 * @brief Advances one particle by one step
 *
 * 1. Position eases toward the active layout target by dt * speed.
 * 2. Rotation adds the particle's constant per-step spin.
 * 3. Lights blink, the star pulses, snow spins a little faster.
 *
 * Stateless; every call depends only on the particle and the context.
 */
class ParticleAnimator {
public:
    static constexpr float DEFAULT_SPEED = 2.0f;
    static constexpr float ORNAMENT_SPEED = 1.8f;
    static constexpr float LEAF_SPEED = 2.2f;
    static constexpr float DISPERSED_SPEED = 1.5f;

    static constexpr float SNOW_SPIN_Y = 0.01f;
    static constexpr float SNOW_SPIN_Z = 0.005f;

    static void animate(TreeParticle& particle, const FrameContext& frame);

    // Lerp rate for a category in a layout (units: 1/s)
    static float speedFor(ParticleCategory category, TreeLayout layout);

    // Blink factor in [0, 1] for a light with the given phase
    static float lightBlink(float elapsedTime, float phase);
};

} // namespace TinselEngine

#endif // PARTICLE_ANIMATOR_HPP
