/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/MaterialPalette.hpp"

namespace TinselEngine {

namespace {

constexpr Material makeLit(uint32_t color, uint32_t emissive = 0x000000, float intensity = 0.0f) {
  Material m{};
  m.color = ColorRGB::fromHex(color);
  m.emissive = ColorRGB::fromHex(emissive);
  m.emissiveIntensity = intensity;
  return m;
}

// Mid green appears twice so it is drawn half the time
constexpr std::array<Material, MaterialPalette::LEAF_VARIANTS> LEAF_MATERIALS = {
    makeLit(0x1a472a),
    makeLit(0x2e7d32),
    makeLit(0x2e7d32),
    makeLit(0x4caf50, 0x1b5e20, 0.2f),
};

// Gold, red, red, silver
constexpr std::array<Material, MaterialPalette::ORNAMENT_VARIANTS> ORNAMENT_MATERIALS = {
    makeLit(0xffd700, 0x443300, 0.4f),
    makeLit(0xd32f2f, 0x440000, 0.3f),
    makeLit(0xd32f2f, 0x440000, 0.3f),
    makeLit(0xe0e0e0, 0x222222, 0.3f),
};

} // namespace

Material MaterialPalette::leaf(size_t variant) {
  return LEAF_MATERIALS[variant % LEAF_VARIANTS];
}

Material MaterialPalette::ornament(size_t variant) {
  return ORNAMENT_MATERIALS[variant % ORNAMENT_VARIANTS];
}

Material MaterialPalette::trunk() {
  return makeLit(0x4e342e);
}

Material MaterialPalette::light(bool colored) {
  return colored ? makeLit(0xffcccc, 0xff0000, 2.0f)
                 : makeLit(0xffffee, 0xffaa00, 2.0f);
}

Material MaterialPalette::star() {
  // Unlit: the pulse drives the glow sprite, not the body color
  Material m = makeLit(0xffffee, 0xffffee, 1.0f);
  m.lit = false;
  return m;
}

Material MaterialPalette::snow() {
  Material m = makeLit(0xffffff);
  m.lit = false;
  m.opacity = 0.9f;
  return m;
}

const std::array<HaloLayer, 2>& MaterialPalette::starHalos() {
  static const std::array<HaloLayer, 2> halos = {{
      {2.0f, ColorRGB::fromHex(0xffdd00), 0.3f},
      {3.5f, ColorRGB::fromHex(0xffaa00), 0.1f},
  }};
  return halos;
}

MeshShape MaterialPalette::shapeFor(ParticleCategory category) {
  switch (category) {
  case ParticleCategory::Leaf:
  case ParticleCategory::Snow:
    return MeshShape::Tetrahedron;
  case ParticleCategory::Ornament:
  case ParticleCategory::Light:
    return MeshShape::Sphere;
  case ParticleCategory::Star:
    return MeshShape::Octahedron;
  case ParticleCategory::Trunk:
    return MeshShape::Box;
  default:
    return MeshShape::Tetrahedron;
  }
}

const std::array<PointLight, 4>& MaterialPalette::lightRig() {
  // Warm key, green fill, soft fill, blue rim
  static const std::array<PointLight, 4> rig = {{
      {Vector3D(0.0f, 15.0f, 30.0f), ColorRGB::fromHex(0xffaa55), 3.0f, 70.0f},
      {Vector3D(20.0f, 10.0f, 20.0f), ColorRGB::fromHex(0x66ff88), 3.0f, 60.0f},
      {Vector3D(-20.0f, 10.0f, 10.0f), ColorRGB::fromHex(0xffeeaa), 2.0f, 60.0f},
      {Vector3D(0.0f, 40.0f, -30.0f), ColorRGB::fromHex(0x8899ff), 1.5f, 0.0f},
  }};
  return rig;
}

} // namespace TinselEngine
