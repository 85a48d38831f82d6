/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TREE_PARTICLE_HPP
#define TREE_PARTICLE_HPP

#include "utils/Vector3D.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <utility>

namespace TinselEngine {

/**
 * @brief Closed set of particle kinds. Per-category behavior is a switch.
 */
enum class ParticleCategory : uint8_t {
    Leaf = 0,
    Ornament = 1,
    Light = 2,
    Star = 3,
    Snow = 4,
    Trunk = 5,
    COUNT = 6
};

/**
 * @brief Which set of targets particles move toward
 */
enum class TreeLayout : uint8_t {
    Assembled = 0,    // Cone-shaped tree
    Dispersed = 1     // Spherical cloud
};

enum class MeshShape : uint8_t {
    Tetrahedron,
    Box,
    Sphere,
    Octahedron
};

inline const char* getCategoryName(ParticleCategory category) {
    switch (category) {
    case ParticleCategory::Leaf:     return "Leaf";
    case ParticleCategory::Ornament: return "Ornament";
    case ParticleCategory::Light:    return "Light";
    case ParticleCategory::Star:     return "Star";
    case ParticleCategory::Snow:     return "Snow";
    case ParticleCategory::Trunk:    return "Trunk";
    default:                         return "Unknown";
    }
}

inline const char* getLayoutName(TreeLayout layout) {
    return layout == TreeLayout::Assembled ? "Assembled" : "Dispersed";
}

/**
 * @brief Linear RGB in [0, 1]
 */
struct ColorRGB {
    float r{1.0f};
    float g{1.0f};
    float b{1.0f};

    static constexpr ColorRGB fromHex(uint32_t hex) {
        return ColorRGB{static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
                        static_cast<float>((hex >> 8) & 0xFF) / 255.0f,
                        static_cast<float>(hex & 0xFF) / 255.0f};
    }

    bool operator==(const ColorRGB& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

struct Material {
    ColorRGB color{};
    ColorRGB emissive{0.0f, 0.0f, 0.0f};
    float emissiveIntensity{0.0f};
    float opacity{1.0f};
    bool lit{true};          // false: flat color, no lighting or emissive term
    bool additive{false};
};

/**
 * @brief A translucent sphere drawn around a mesh (the star's glow)
 */
struct HaloLayer {
    float radius{1.0f};
    ColorRGB color{};
    float opacity{1.0f};
};

/**
 * @brief Render handle for one particle
 *
 * Owned by value by its particle. The material is a private copy so
 * per-particle emissive changes never leak into other particles.
 */
struct MeshInstance {
    Vector3D position{};
    Vector3D rotation{};     // Euler radians
    float scale{1.0f};
    MeshShape shape{MeshShape::Tetrahedron};
    Material material{};
    boost::container::small_vector<HaloLayer, 2> halos{};
};

/**
 * @brief One animated element of the tree
 *
 * Built once by TreeLayoutGenerator. Layout targets, initial scale, category,
 * phase and base color never change afterwards; only the mesh is mutated by
 * ParticleAnimator.
 */
class TreeParticle {
public:
    using TargetMap = boost::container::flat_map<TreeLayout, Vector3D>;

    TreeParticle(ParticleCategory category, MeshInstance mesh,
                 const Vector3D& assembledTarget, const Vector3D& dispersedTarget,
                 const Vector3D& rotationSpeed, float phase)
        : m_mesh(std::move(mesh))
        , m_rotationSpeed(rotationSpeed)
        , m_initialScale(m_mesh.scale)
        , m_phase(phase)
        , m_category(category)
        , m_baseColor(m_mesh.material.color)
    {
        m_targets.reserve(2);
        m_targets.emplace(TreeLayout::Assembled, assembledTarget);
        m_targets.emplace(TreeLayout::Dispersed, dispersedTarget);
    }

    const Vector3D& getTarget(TreeLayout layout) const { return m_targets.at(layout); }
    const TargetMap& getTargets() const { return m_targets; }

    MeshInstance& getMesh() { return m_mesh; }
    const MeshInstance& getMesh() const { return m_mesh; }

    const Vector3D& getRotationSpeed() const { return m_rotationSpeed; }
    float getInitialScale() const { return m_initialScale; }
    float getPhase() const { return m_phase; }
    ParticleCategory getCategory() const { return m_category; }
    const ColorRGB& getBaseColor() const { return m_baseColor; }

private:
    MeshInstance m_mesh;
    TargetMap m_targets;
    Vector3D m_rotationSpeed;
    float m_initialScale;
    float m_phase;
    ParticleCategory m_category;
    ColorRGB m_baseColor;
};

} // namespace TinselEngine

#endif // TREE_PARTICLE_HPP
