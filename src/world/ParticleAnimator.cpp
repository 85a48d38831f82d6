/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/ParticleAnimator.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace TinselEngine {

namespace {
constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

// Keeps angles bounded over long sessions; the visible pose is unchanged
float wrapAngle(float angle) {
  if (angle >= TWO_PI || angle <= -TWO_PI) {
    return std::fmod(angle, TWO_PI);
  }
  return angle;
}
} // namespace

float ParticleAnimator::speedFor(ParticleCategory category, TreeLayout layout) {
  if (layout == TreeLayout::Dispersed) {
    return DISPERSED_SPEED;
  }

  switch (category) {
  case ParticleCategory::Ornament:
    return ORNAMENT_SPEED;
  case ParticleCategory::Leaf:
    return LEAF_SPEED;
  default:
    return DEFAULT_SPEED;
  }
}

float ParticleAnimator::lightBlink(float elapsedTime, float phase) {
  return std::sin(elapsedTime * 3.0f + phase) * 0.5f + 0.5f;
}

void ParticleAnimator::animate(TreeParticle &particle, const FrameContext &frame) {
  MeshInstance &mesh = particle.getMesh();
  const ParticleCategory category = particle.getCategory();

  // Clamped so a long step lands on the target instead of overshooting it
  float alpha = std::clamp(frame.deltaTime * speedFor(category, frame.layout),
                           0.0f, 1.0f);
  mesh.position = Vector3D::lerp(mesh.position, particle.getTarget(frame.layout), alpha);

  Vector3D rotation = mesh.rotation + particle.getRotationSpeed();

  switch (category) {
  case ParticleCategory::Light: {
    float blink = lightBlink(frame.elapsedTime, particle.getPhase());
    mesh.material.emissiveIntensity = 0.5f + blink * 1.5f;
    mesh.scale = particle.getInitialScale() * (0.8f + blink * 0.4f);
    break;
  }
  case ParticleCategory::Star:
    mesh.scale = particle.getInitialScale() * (1.0f + std::sin(frame.elapsedTime * 2.0f) * 0.2f);
    mesh.material.emissiveIntensity = 1.0f + std::sin(frame.elapsedTime * 4.0f) * 0.5f;
    break;
  case ParticleCategory::Snow:
    rotation.setY(rotation.getY() + SNOW_SPIN_Y);
    rotation.setZ(rotation.getZ() + SNOW_SPIN_Z);
    break;
  case ParticleCategory::Leaf:
  case ParticleCategory::Ornament:
  case ParticleCategory::Trunk:
  case ParticleCategory::COUNT:
    break;
  }

  mesh.rotation = Vector3D(wrapAngle(rotation.getX()), wrapAngle(rotation.getY()),
                           wrapAngle(rotation.getZ()));
}

} // namespace TinselEngine
