/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TreeLayoutGenerator.hpp"
#include "core/Logger.hpp"
#include "world/MaterialPalette.hpp"
#include <cmath>
#include <format>
#include <numbers>

namespace TinselEngine {

namespace {
constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;
constexpr float PI = std::numbers::pi_v<float>;

constexpr float TRUNK_SCALE = 0.3f;
constexpr float LIGHT_SCALE = 0.25f;
constexpr float STAR_SCALE = 2.5f;
constexpr float STAR_LIFT = 1.5f;
constexpr float SNOW_SCALE = 0.12f;

constexpr float ORNAMENT_SKIP_ABOVE = 0.98f;
constexpr float MAX_ROTATION_SPEED = 0.01f;

MeshInstance makeMesh(ParticleCategory category, Material material, float scale) {
  MeshInstance mesh;
  mesh.shape = MaterialPalette::shapeFor(category);
  mesh.material = material;
  mesh.scale = scale;
  return mesh;
}
} // namespace

TreeLayoutGenerator::TreeLayoutGenerator(const TreeSceneConfig &config)
    : TreeLayoutGenerator(config, std::random_device{}()) {}

TreeLayoutGenerator::TreeLayoutGenerator(const TreeSceneConfig &config,
                                         uint32_t seed)
    : m_config(config), m_rng(seed) {}

std::vector<TreeParticle> TreeLayoutGenerator::generate() {
  std::vector<TreeParticle> particles;
  particles.reserve(m_config.maxParticleCount());

  size_t trunk = placeTrunk(particles);
  size_t foliage = placeFoliage(particles);
  size_t ornaments = placeOrnaments(particles);
  size_t lights = placeLights(particles);
  size_t star = placeStar(particles);
  size_t snow = placeSnow(particles);

  LAYOUT_INFO(std::format("Generated {} particles (trunk {}, foliage {}, "
                          "ornament {}, light {}, star {}, snow {})",
                          particles.size(), trunk, foliage, ornaments, lights,
                          star, snow));
  return particles;
}

size_t TreeLayoutGenerator::placeTrunk(std::vector<TreeParticle> &out) {
  const int count = validCount(m_config.trunkCount, "trunk");

  for (int i = 0; i < count; ++i) {
    float h = uniform() * m_config.trunkHeight;
    float theta = uniform() * TWO_PI;
    float r = uniform() * m_config.trunkRadius;

    Vector3D pos(r * std::cos(theta),
                 m_config.yOffset + h - m_config.trunkHeight + 1.0f,
                 r * std::sin(theta));

    addParticle(out, ParticleCategory::Trunk,
                makeMesh(ParticleCategory::Trunk, MaterialPalette::trunk(),
                         TRUNK_SCALE),
                pos);
  }
  return static_cast<size_t>(count);
}

size_t TreeLayoutGenerator::placeFoliage(std::vector<TreeParticle> &out) {
  const int count = validCount(m_config.foliageCount, "foliage");

  for (int i = 0; i < count; ++i) {
    float t = static_cast<float>(i) / static_cast<float>(count);
    float h = t * m_config.treeHeight;
    float maxR = coneRadius(t);

    // Bias toward the core, then push the outer shell out in waves
    float rNorm = std::pow(uniform(), 0.8f);
    float branch = std::sin(h * 2.5f) * 0.2f;
    float r = maxR * rNorm * (1.0f + (rNorm > 0.6f ? branch : 0.0f));

    float theta = uniform() * TWO_PI;
    Vector3D pos(r * std::cos(theta), m_config.yOffset + h, r * std::sin(theta));

    auto variant = static_cast<size_t>(uniform() * MaterialPalette::LEAF_VARIANTS);
    float scale = (0.2f + uniform() * 0.3f) * (1.2f - t * 0.4f);

    MeshInstance mesh = makeMesh(ParticleCategory::Leaf,
                                 MaterialPalette::leaf(variant), scale);
    mesh.rotation = Vector3D(uniform() * PI, uniform() * PI, uniform() * PI);

    addParticle(out, ParticleCategory::Leaf, std::move(mesh), pos);
  }
  return static_cast<size_t>(count);
}

size_t TreeLayoutGenerator::placeOrnaments(std::vector<TreeParticle> &out) {
  const int count = validCount(m_config.ornamentCount, "ornament");
  size_t placed = 0;

  for (int i = 0; i < count; ++i) {
    float t = uniform();
    if (t > ORNAMENT_SKIP_ABOVE) {
      continue; // Tip is too narrow to hang anything
    }

    float h = t * m_config.treeHeight;
    float r = coneRadius(t) * (0.8f + uniform() * 0.3f);
    float theta = uniform() * TWO_PI;
    Vector3D pos(r * std::cos(theta), m_config.yOffset + h, r * std::sin(theta));

    auto variant = static_cast<size_t>(uniform() * MaterialPalette::ORNAMENT_VARIANTS);
    bool isLarge = uniform() > 0.7f;
    float scale = isLarge ? (0.6f + uniform() * 0.3f) : (0.3f + uniform() * 0.2f);

    addParticle(out, ParticleCategory::Ornament,
                makeMesh(ParticleCategory::Ornament,
                         MaterialPalette::ornament(variant), scale),
                pos);
    ++placed;
  }

  LAYOUT_DEBUG(std::format("Ornaments: {} placed, {} skipped near the tip",
                           placed, static_cast<size_t>(count) - placed));
  return placed;
}

size_t TreeLayoutGenerator::placeLights(std::vector<TreeParticle> &out) {
  const int count = validCount(m_config.lightCount, "light");

  for (int i = 0; i < count; ++i) {
    float t = static_cast<float>(i) / static_cast<float>(count);
    float h = t * m_config.treeHeight;
    float angle = t * TWO_PI * m_config.lightTurns;

    // Slightly outside the foliage, jittered so the spiral looks draped
    float r = (coneRadius(t) + 0.5f) * (0.95f + uniform() * 0.1f);
    Vector3D pos(r * std::cos(angle), m_config.yOffset + h, r * std::sin(angle));

    bool colored = uniform() > 0.8f;
    addParticle(out, ParticleCategory::Light,
                makeMesh(ParticleCategory::Light, MaterialPalette::light(colored),
                         LIGHT_SCALE),
                pos);
  }
  return static_cast<size_t>(count);
}

size_t TreeLayoutGenerator::placeStar(std::vector<TreeParticle> &out) {
  MeshInstance mesh =
      makeMesh(ParticleCategory::Star, MaterialPalette::star(), STAR_SCALE);
  for (const auto &halo : MaterialPalette::starHalos()) {
    mesh.halos.push_back(halo);
  }

  Vector3D pos(0.0f, m_config.yOffset + m_config.treeHeight + STAR_LIFT, 0.0f);
  addParticle(out, ParticleCategory::Star, std::move(mesh), pos);
  return 1;
}

size_t TreeLayoutGenerator::placeSnow(std::vector<TreeParticle> &out) {
  const int count = validCount(m_config.snowCount, "snow");
  const float field = m_config.snowFieldSize;

  for (int i = 0; i < count; ++i) {
    Vector3D pos((uniform() - 0.5f) * field,
                 (uniform() - 0.5f) * field + m_config.snowFieldLift,
                 (uniform() - 0.5f) * field);

    Vector3D scatter =
        scatterPosition(m_config.snowMinRadius, m_config.snowRadiusSpread);

    addParticle(out, ParticleCategory::Snow,
                makeMesh(ParticleCategory::Snow, MaterialPalette::snow(),
                         SNOW_SCALE),
                pos, scatter);
  }
  return static_cast<size_t>(count);
}

Vector3D TreeLayoutGenerator::scatterPosition(float minRadius, float spread) {
  float r = minRadius + uniform() * spread;
  float theta = uniform() * TWO_PI;
  float phi = std::acos(2.0f * uniform() - 1.0f);

  return Vector3D(r * std::sin(phi) * std::cos(theta),
                  r * std::sin(phi) * std::sin(theta), r * std::cos(phi));
}

void TreeLayoutGenerator::addParticle(std::vector<TreeParticle> &out,
                                      ParticleCategory category,
                                      MeshInstance mesh,
                                      const Vector3D &assembled) {
  Vector3D dispersed =
      scatterPosition(m_config.scatterMinRadius, m_config.scatterRadiusSpread);
  addParticle(out, category, std::move(mesh), assembled, dispersed);
}

void TreeLayoutGenerator::addParticle(std::vector<TreeParticle> &out,
                                      ParticleCategory category,
                                      MeshInstance mesh,
                                      const Vector3D &assembled,
                                      const Vector3D &dispersed) {
  mesh.position = assembled;

  Vector3D rotationSpeed((uniform() - 0.5f) * 2.0f * MAX_ROTATION_SPEED,
                         (uniform() - 0.5f) * 2.0f * MAX_ROTATION_SPEED,
                         (uniform() - 0.5f) * 2.0f * MAX_ROTATION_SPEED);
  float phase = uniform() * TWO_PI;

  out.emplace_back(category, std::move(mesh), assembled, dispersed,
                   rotationSpeed, phase);
}

int TreeLayoutGenerator::validCount(int count, const char *what) {
  if (count < 0) {
    LAYOUT_WARN(std::format("Negative {} count {} treated as 0", what, count));
  } else if (count > TreeSceneConfig::MAX_CATEGORY_COUNT) {
    LAYOUT_WARN(std::format("{} count {} capped at {}", what, count,
                            TreeSceneConfig::MAX_CATEGORY_COUNT));
  }
  return TreeSceneConfig::clampCount(count);
}

} // namespace TinselEngine
