/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_MANAGER_HPP
#define PARTICLE_MANAGER_HPP

/**
 * @file ParticleManager.hpp
 * @brief Owner of the tree's particles: generation, stepping and drawing
 *
 * The manager holds every TreeParticle in one contiguous vector, built once
 * by TreeLayoutGenerator in init(). update() runs ParticleAnimator over the
 * whole set and advances the group transform (the slow spin and sway that
 * applies to all particles). render() projects through a perspective Camera,
 * depth-sorts and submits everything with SDL_RenderGeometry:
 *
 * - body pass, alpha blended, back to front: one flat polygon per particle
 *   (triangle, square, octagon or diamond by shape) rotated by its z angle,
 *   lit by the ambient term and the point-light rig, plus emissive, then fogged
 * - glow pass, additive: soft discs behind bright emissive particles (lights,
 *   gold ornaments, the star) and the star's halo layers
 *
 * Vertex and index buffers are members and reused between frames.
 */

#include "utils/Camera.hpp"
#include "world/TreeParticle.hpp"
#include "world/TreeSceneConfig.hpp"
#include <SDL3/SDL.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/**
 * @brief Performance statistics for monitoring
 */
struct ParticlePerformanceStats {
  double totalUpdateTime{0.0};
  double totalRenderTime{0.0};
  uint64_t updateCount{0};
  uint64_t renderCount{0};
  size_t activeParticles{0};
  size_t drawnParticles{0};

  void addUpdateSample(double timeMs, size_t particleCount) {
    totalUpdateTime += timeMs;
    updateCount++;
    activeParticles = particleCount;
  }

  void addRenderSample(double timeMs, size_t drawn) {
    totalRenderTime += timeMs;
    renderCount++;
    drawnParticles = drawn;
  }

  double averageUpdateMs() const {
    return updateCount > 0 ? totalUpdateTime / static_cast<double>(updateCount) : 0.0;
  }

  double averageRenderMs() const {
    return renderCount > 0 ? totalRenderTime / static_cast<double>(renderCount) : 0.0;
  }

  void reset() { *this = ParticlePerformanceStats{}; }
};

class ParticleManager {
public:
  static ParticleManager &Instance() {
    static ParticleManager instance;
    return instance;
  }

  // Emissive strength above which a particle gets a glow sprite
  static constexpr float GLOW_THRESHOLD = 0.3f;

  /**
   * @brief Builds all particles from the config
   * @param seed fixed generator seed; random when empty
   * @return true on success or if already initialized
   */
  bool init(const TinselEngine::TreeSceneConfig &config,
            std::optional<uint32_t> seed = std::nullopt);

  bool isInitialized() const { return m_initialized; }
  bool isShutdown() const { return m_isShutdown; }

  /**
   * @brief Releases every particle at once; safe to call twice
   */
  void clean();

  /**
   * @brief Steps every particle toward the given layout
   * @param deltaTime fixed step in seconds
   * @param layout active layout, read from SceneState by the caller
   */
  void update(float deltaTime, TinselEngine::TreeLayout layout);

  /**
   * @brief Draws all particles through the camera
   */
  void render(SDL_Renderer *renderer, const TinselEngine::Camera &camera);

  size_t getParticleCount() const { return m_particles.size(); }
  size_t getParticleCount(TinselEngine::ParticleCategory category) const;
  const std::vector<TinselEngine::TreeParticle> &getParticles() const { return m_particles; }

  float getElapsedTime() const { return m_elapsedTime; }
  const Vector3D &getGroupRotation() const { return m_groupRotation; }

  /**
   * @brief Group rotation (Euler, radians) at a point in time
   *
   * Y spins at 0.1 rad/s. Z sways gently when assembled and wider when
   * dispersed.
   */
  static Vector3D groupRotationAt(float elapsedTime, TinselEngine::TreeLayout layout);

  /**
   * @brief Exponential-squared fog amount in [0, 1) at a view depth
   */
  static float fogFactor(float depth);

  /**
   * @brief Final body color of a mesh before fog
   * @param worldPos position after the group transform
   * @param normal facing direction after the group transform
   */
  static TinselEngine::ColorRGB shade(const TinselEngine::MeshInstance &mesh,
                                      const Vector3D &worldPos,
                                      const Vector3D &normal);

  ParticlePerformanceStats getPerformanceStats() const { return m_performanceStats; }
  void resetPerformanceStats() { m_performanceStats.reset(); }

private:
  ParticleManager() = default;
  ~ParticleManager() = default;
  ParticleManager(const ParticleManager &) = delete;
  ParticleManager &operator=(const ParticleManager &) = delete;

  struct DrawItem {
    size_t index;
    Vector3D world;
    TinselEngine::Camera::Projection projection;
    float pixelsPerUnit;
  };

  std::vector<TinselEngine::TreeParticle> m_particles;
  std::array<size_t, static_cast<size_t>(TinselEngine::ParticleCategory::COUNT)> m_categoryCounts{};

  float m_elapsedTime{0.0f};
  Vector3D m_groupRotation{};

  bool m_initialized{false};
  bool m_isShutdown{false};
  bool m_renderErrorLogged{false};

  ParticlePerformanceStats m_performanceStats;

  // Reused per frame
  std::vector<DrawItem> m_drawList;
  std::vector<SDL_Vertex> m_bodyVertices;
  std::vector<int> m_bodyIndices;
  std::vector<SDL_Vertex> m_glowVertices;
  std::vector<int> m_glowIndices;

  void buildDrawList(const TinselEngine::Camera &camera);
  void appendBody(const DrawItem &item);
  void appendGlow(const DrawItem &item);
  void submit(SDL_Renderer *renderer, const std::vector<SDL_Vertex> &vertices,
              const std::vector<int> &indices, SDL_BlendMode blendMode);
};

#endif // PARTICLE_MANAGER_HPP
