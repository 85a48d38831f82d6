/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MATERIAL_PALETTE_HPP
#define MATERIAL_PALETTE_HPP

#include "world/TreeParticle.hpp"
#include <array>
#include <cstddef>

namespace TinselEngine {

/**
 * @brief A point light of the scene rig (no shadows, linear falloff to range)
 */
struct PointLight {
    Vector3D position{};
    ColorRGB color{};
    float intensity{1.0f};
    float range{0.0f};       // 0 = infinite
};

/**
 * @brief Shared lookup tables: materials per category, mesh shapes, the
 * light rig and the atmosphere. Materials are returned by value and copied
 * into each MeshInstance.
 */
class MaterialPalette {
public:
    static constexpr size_t LEAF_VARIANTS = 4;
    static constexpr size_t ORNAMENT_VARIANTS = 4;

    static constexpr uint32_t BACKGROUND_HEX = 0x020202;
    static constexpr uint32_t FOG_HEX = 0x020202;
    static constexpr float FOG_DENSITY = 0.02f;
    static constexpr float AMBIENT_INTENSITY = 0.5f;

    // Index is taken modulo the variant count
    static Material leaf(size_t variant);
    static Material ornament(size_t variant);
    static Material trunk();
    static Material light(bool colored);
    static Material star();
    static Material snow();

    static const std::array<HaloLayer, 2>& starHalos();

    static MeshShape shapeFor(ParticleCategory category);

    static const std::array<PointLight, 4>& lightRig();
};

} // namespace TinselEngine

#endif // MATERIAL_PALETTE_HPP
