/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ParticleManager.hpp"
#include "core/Logger.hpp"
#include "world/MaterialPalette.hpp"
#include "world/ParticleAnimator.hpp"
#include "world/TreeLayoutGenerator.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <format>
#include <numbers>

using namespace TinselEngine;

namespace {

constexpr float PI = std::numbers::pi_v<float>;
constexpr float TWO_PI = 2.0f * PI;

// Scales the point-light rig down to a contribution comparable to ambient
constexpr float DIFFUSE_SCALE = 0.25f;

// Glow disc radius relative to the particle's own radius
constexpr float GLOW_RADIUS = 3.0f;
constexpr float GLOW_ALPHA = 0.35f;
constexpr int GLOW_SIDES = 16;
constexpr int HALO_SIDES = 24;
constexpr float HALO_RIM_FALLOFF = 0.6f;

// Center/rim brightness of the flat polygon, a cheap stand-in for curvature
constexpr float CENTER_BRIGHTEN = 1.15f;
constexpr float RIM_DARKEN = 0.8f;

constexpr float MIN_PIXEL_RADIUS = 0.2f;

struct ShapeOutline {
  int sides;
  float radius;      // circumradius in mesh units
  float angleOffset;
};

ShapeOutline outlineFor(MeshShape shape) {
  switch (shape) {
  case MeshShape::Tetrahedron:
    return {3, 1.0f, PI / 2.0f};
  case MeshShape::Box:
    return {4, 0.7071f, PI / 4.0f};
  case MeshShape::Sphere:
    return {10, 1.0f, 0.0f};
  case MeshShape::Octahedron:
    return {4, 1.0f, 0.0f};
  }
  return {3, 1.0f, 0.0f};
}

float clamp01(float v) { return std::clamp(v, 0.0f, 1.0f); }

SDL_FColor toFColor(const ColorRGB &c, float scale, float alpha) {
  return SDL_FColor{clamp01(c.r * scale), clamp01(c.g * scale),
                    clamp01(c.b * scale), clamp01(alpha)};
}

ColorRGB applyFog(const ColorRGB &c, float fog) {
  static const ColorRGB fogColor = ColorRGB::fromHex(MaterialPalette::FOG_HEX);
  return ColorRGB{c.r + (fogColor.r - c.r) * fog, c.g + (fogColor.g - c.g) * fog,
                  c.b + (fogColor.b - c.b) * fog};
}

float emissiveStrength(const Material &material) {
  float peak = std::max({material.emissive.r, material.emissive.g, material.emissive.b});
  return peak * material.emissiveIntensity;
}

// Triangle fan: one center vertex and `sides` rim vertices
void appendFan(std::vector<SDL_Vertex> &vertices, std::vector<int> &indices,
               float cx, float cy, float radius, int sides, float angle,
               const SDL_FColor &center, const SDL_FColor &rim) {
  const int base = static_cast<int>(vertices.size());

  vertices.push_back(SDL_Vertex{SDL_FPoint{cx, cy}, center, SDL_FPoint{0.0f, 0.0f}});
  for (int i = 0; i < sides; ++i) {
    float a = angle + TWO_PI * static_cast<float>(i) / static_cast<float>(sides);
    // Screen y grows downward
    vertices.push_back(SDL_Vertex{
        SDL_FPoint{cx + radius * std::cos(a), cy - radius * std::sin(a)}, rim,
        SDL_FPoint{0.0f, 0.0f}});
  }

  for (int i = 0; i < sides; ++i) {
    indices.push_back(base);
    indices.push_back(base + 1 + i);
    indices.push_back(base + 1 + (i + 1) % sides);
  }
}

} // namespace

bool ParticleManager::init(const TreeSceneConfig &config,
                           std::optional<uint32_t> seed) {
  if (m_initialized) {
    PARTICLE_INFO("ParticleManager already initialized");
    return true;
  }

  try {
    TreeLayoutGenerator generator = seed ? TreeLayoutGenerator(config, *seed)
                                         : TreeLayoutGenerator(config);
    m_particles = generator.generate();

    m_categoryCounts.fill(0);
    for (const auto &particle : m_particles) {
      ++m_categoryCounts[static_cast<size_t>(particle.getCategory())];
    }

    m_elapsedTime = 0.0f;
    m_groupRotation = groupRotationAt(0.0f, TreeLayout::Assembled);
    m_renderErrorLogged = false;
    m_performanceStats.reset();

    // Worst case: every particle is a sphere with a glow
    m_drawList.reserve(m_particles.size());
    m_bodyVertices.reserve(m_particles.size() * 11);
    m_bodyIndices.reserve(m_particles.size() * 30);

    m_initialized = true;
    m_isShutdown = false;

    PARTICLE_INFO(std::format("ParticleManager initialized with {} particles",
                              m_particles.size()));
    return true;

  } catch (const std::exception &e) {
    PARTICLE_ERROR(std::format("Failed to initialize ParticleManager: {}", e.what()));
    m_particles.clear();
    return false;
  }
}

void ParticleManager::clean() {
  if (!m_initialized || m_isShutdown) {
    return;
  }

  PARTICLE_INFO("ParticleManager shutting down...");

  m_isShutdown = true;
  m_initialized = false;

  // Swap with empties to hand the memory back, not just the size
  std::vector<TreeParticle>().swap(m_particles);
  std::vector<DrawItem>().swap(m_drawList);
  std::vector<SDL_Vertex>().swap(m_bodyVertices);
  std::vector<int>().swap(m_bodyIndices);
  std::vector<SDL_Vertex>().swap(m_glowVertices);
  std::vector<int>().swap(m_glowIndices);
  m_categoryCounts.fill(0);

  PARTICLE_INFO("ParticleManager shutdown complete");
}

size_t ParticleManager::getParticleCount(ParticleCategory category) const {
  if (category == ParticleCategory::COUNT) {
    return 0;
  }
  return m_categoryCounts[static_cast<size_t>(category)];
}

Vector3D ParticleManager::groupRotationAt(float elapsedTime, TreeLayout layout) {
  float sway = layout == TreeLayout::Assembled
                   ? std::sin(elapsedTime * 0.5f) * 0.015f
                   : std::sin(elapsedTime * 0.2f) * 0.1f;
  return Vector3D(0.0f, elapsedTime * 0.1f, sway);
}

float ParticleManager::fogFactor(float depth) {
  float d = MaterialPalette::FOG_DENSITY * std::max(depth, 0.0f);
  return 1.0f - std::exp(-d * d);
}

ColorRGB ParticleManager::shade(const MeshInstance &mesh, const Vector3D &worldPos,
                                const Vector3D &normal) {
  const Material &material = mesh.material;
  if (!material.lit) {
    return material.color;
  }

  float r = MaterialPalette::AMBIENT_INTENSITY;
  float g = MaterialPalette::AMBIENT_INTENSITY;
  float b = MaterialPalette::AMBIENT_INTENSITY;

  for (const auto &light : MaterialPalette::lightRig()) {
    Vector3D toLight = light.position - worldPos;
    float distance = toLight.length();
    if (distance <= 0.0f) {
      continue;
    }

    float attenuation = 1.0f;
    if (light.range > 0.0f) {
      float falloff = std::max(0.0f, 1.0f - distance / light.range);
      attenuation = falloff * falloff;
    }

    // Flat facets are visible from both sides
    float lambert = std::fabs(normal.dot(toLight / distance));
    float amount = light.intensity * attenuation * lambert * DIFFUSE_SCALE;
    r += light.color.r * amount;
    g += light.color.g * amount;
    b += light.color.b * amount;
  }

  const float e = material.emissiveIntensity;
  return ColorRGB{clamp01(material.color.r * r + material.emissive.r * e),
                  clamp01(material.color.g * g + material.emissive.g * e),
                  clamp01(material.color.b * b + material.emissive.b * e)};
}

void ParticleManager::update(float deltaTime, TreeLayout layout) {
  if (!m_initialized) {
    return;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  m_elapsedTime += deltaTime;
  const FrameContext frame{deltaTime, m_elapsedTime, layout};

  for (auto &particle : m_particles) {
    ParticleAnimator::animate(particle, frame);
  }

  m_groupRotation = groupRotationAt(m_elapsedTime, layout);

  auto endTime = std::chrono::high_resolution_clock::now();
  m_performanceStats.addUpdateSample(
      std::chrono::duration<double, std::milli>(endTime - startTime).count(),
      m_particles.size());

#ifdef DEBUG
  // Periodic summary, roughly every 10 s at 60 Hz
  if (m_performanceStats.updateCount % 600 == 0) {
    PARTICLE_DEBUG(std::format("{} particles, update {:.3f}ms avg, render {:.3f}ms avg ({} drawn)",
                               m_particles.size(), m_performanceStats.averageUpdateMs(),
                               m_performanceStats.averageRenderMs(),
                               m_performanceStats.drawnParticles));
  }
#endif
}

void ParticleManager::render(SDL_Renderer *renderer, const Camera &camera) {
  if (!m_initialized || renderer == nullptr || m_particles.empty()) {
    return;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  buildDrawList(camera);

  m_bodyVertices.clear();
  m_bodyIndices.clear();
  m_glowVertices.clear();
  m_glowIndices.clear();

  for (const auto &item : m_drawList) {
    appendBody(item);
    appendGlow(item);
  }

  submit(renderer, m_bodyVertices, m_bodyIndices, SDL_BLENDMODE_BLEND);
  submit(renderer, m_glowVertices, m_glowIndices, SDL_BLENDMODE_ADD);
  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

  auto endTime = std::chrono::high_resolution_clock::now();
  m_performanceStats.addRenderSample(
      std::chrono::duration<double, std::milli>(endTime - startTime).count(),
      m_drawList.size());
}

void ParticleManager::buildDrawList(const Camera &camera) {
  m_drawList.clear();

  for (size_t i = 0; i < m_particles.size(); ++i) {
    const MeshInstance &mesh = m_particles[i].getMesh();
    Vector3D world = mesh.position.rotatedEuler(m_groupRotation);

    Camera::Projection projection = camera.worldToScreen(world);
    if (!projection.visible) {
      continue;
    }

    float ppu = camera.pixelsPerUnit(projection.depth);
    if (mesh.scale * ppu < MIN_PIXEL_RADIUS) {
      continue;
    }

    m_drawList.push_back(DrawItem{i, world, projection, ppu});
  }

  // Painter's order: farthest first
  std::sort(m_drawList.begin(), m_drawList.end(),
            [](const DrawItem &a, const DrawItem &b) {
              return a.projection.depth > b.projection.depth;
            });
}

void ParticleManager::appendBody(const DrawItem &item) {
  const MeshInstance &mesh = m_particles[item.index].getMesh();
  const ShapeOutline outline = outlineFor(mesh.shape);

  Vector3D normal = Vector3D(0.0f, 0.0f, 1.0f)
                        .rotatedEuler(mesh.rotation)
                        .rotatedEuler(m_groupRotation);
  ColorRGB lit = applyFog(shade(mesh, item.world, normal),
                          fogFactor(item.projection.depth));

  float radius = outline.radius * mesh.scale * item.pixelsPerUnit;
  float angle = outline.angleOffset + mesh.rotation.getZ() + m_groupRotation.getZ();
  float alpha = mesh.material.opacity;

  appendFan(m_bodyVertices, m_bodyIndices, item.projection.screenX,
            item.projection.screenY, radius, outline.sides, angle,
            toFColor(lit, CENTER_BRIGHTEN, alpha), toFColor(lit, RIM_DARKEN, alpha));
}

void ParticleManager::appendGlow(const DrawItem &item) {
  const TreeParticle &particle = m_particles[item.index];
  const MeshInstance &mesh = particle.getMesh();
  const float visibility = 1.0f - fogFactor(item.projection.depth);
  const float cx = item.projection.screenX;
  const float cy = item.projection.screenY;

  // Halos scale with their parent mesh
  for (const auto &halo : mesh.halos) {
    float radius = halo.radius * mesh.scale * item.pixelsPerUnit;
    float alpha = halo.opacity * visibility;
    appendFan(m_glowVertices, m_glowIndices, cx, cy, radius, HALO_SIDES, 0.0f,
              toFColor(halo.color, 1.0f, alpha),
              toFColor(halo.color, 1.0f, alpha * HALO_RIM_FALLOFF));
  }

  float strength = emissiveStrength(mesh.material);
  if (strength < GLOW_THRESHOLD) {
    return;
  }

  float radius = mesh.scale * item.pixelsPerUnit * GLOW_RADIUS;
  float alpha = std::min(1.0f, strength * GLOW_ALPHA) * visibility;
  appendFan(m_glowVertices, m_glowIndices, cx, cy, radius, GLOW_SIDES, 0.0f,
            toFColor(mesh.material.emissive, 1.0f, alpha),
            toFColor(mesh.material.emissive, 1.0f, 0.0f));
}

void ParticleManager::submit(SDL_Renderer *renderer,
                             const std::vector<SDL_Vertex> &vertices,
                             const std::vector<int> &indices,
                             SDL_BlendMode blendMode) {
  if (indices.empty()) {
    return;
  }

  // Untextured geometry uses the renderer's draw blend mode
  SDL_SetRenderDrawBlendMode(renderer, blendMode);
  if (!SDL_RenderGeometry(renderer, nullptr, vertices.data(),
                          static_cast<int>(vertices.size()), indices.data(),
                          static_cast<int>(indices.size()))) {
    if (!m_renderErrorLogged) {
      PARTICLE_ERROR(std::format("SDL_RenderGeometry failed: {}", SDL_GetError()));
      m_renderErrorLogged = true;
    }
  }
}
