/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TREE_LAYOUT_GENERATOR_HPP
#define TREE_LAYOUT_GENERATOR_HPP

#include "world/TreeParticle.hpp"
#include "world/TreeSceneConfig.hpp"
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace TinselEngine {

/**
 * @brief Builds every particle of the scene with both layout targets
 *
 * Categories are placed in a fixed order: trunk, foliage, ornaments, lights,
 * star, snow. Each place* call appends to the output and returns how many
 * particles it added. Nothing here can fail; a negative count places zero.
 *
 * Each particle's mesh starts at its assembled target.
 */
class TreeLayoutGenerator {
public:
    // Seeded from std::random_device: every run looks different
    explicit TreeLayoutGenerator(const TreeSceneConfig& config);

    // Deterministic sequence, for tests
    TreeLayoutGenerator(const TreeSceneConfig& config, uint32_t seed);

    /**
     * @brief Runs every place* step in order into a fresh vector
     */
    std::vector<TreeParticle> generate();

    size_t placeTrunk(std::vector<TreeParticle>& out);
    size_t placeFoliage(std::vector<TreeParticle>& out);
    size_t placeOrnaments(std::vector<TreeParticle>& out);
    size_t placeLights(std::vector<TreeParticle>& out);
    size_t placeStar(std::vector<TreeParticle>& out);
    size_t placeSnow(std::vector<TreeParticle>& out);

    /**
     * @brief Uniform point on a spherical shell, radius in [minRadius, minRadius + spread)
     *
     * Polar angle is acos(2U - 1) so points are uniform over the sphere
     * surface rather than bunched at the poles.
     */
    Vector3D scatterPosition(float minRadius, float spread);

    const TreeSceneConfig& getConfig() const { return m_config; }

private:
    TreeSceneConfig m_config;
    std::mt19937 m_rng;
    std::uniform_real_distribution<float> m_unit{0.0f, 1.0f};

    float uniform() { return m_unit(m_rng); }

    // Cone radius at normalized height t in [0, 1]
    float coneRadius(float t) const { return m_config.baseRadius * (1.0f - t); }

    void addParticle(std::vector<TreeParticle>& out, ParticleCategory category,
                     MeshInstance mesh, const Vector3D& assembled);
    void addParticle(std::vector<TreeParticle>& out, ParticleCategory category,
                     MeshInstance mesh, const Vector3D& assembled,
                     const Vector3D& dispersed);

    static int validCount(int count, const char* what);
};

} // namespace TinselEngine

#endif // TREE_LAYOUT_GENERATOR_HPP
