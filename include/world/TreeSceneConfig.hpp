/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TREE_SCENE_CONFIG_HPP
#define TREE_SCENE_CONFIG_HPP

#include <cstddef>

namespace TinselEngine {

/**
 * @brief Shape and population of the generated tree
 *
 * Defaults reproduce the reference look. Every field can be overridden from
 * the "tree", "counts", "scatter" and "snow" settings categories.
 */
struct TreeSceneConfig {
    // Ceiling for any single category count
    static constexpr int MAX_CATEGORY_COUNT{100000};

    // Cone geometry (world units)
    float treeHeight{30.0f};
    float baseRadius{14.0f};
    float trunkHeight{4.0f};
    float trunkRadius{1.8f};
    float yOffset{-18.0f};
    float lightTurns{10.0f};

    // Per-category population; the star is always exactly one
    int trunkCount{250};
    int foliageCount{8000};
    int ornamentCount{350};
    int lightCount{400};
    int snowCount{700};

    // Dispersed layout shells: radius in [min, min + spread)
    float scatterMinRadius{35.0f};
    float scatterRadiusSpread{30.0f};
    float snowMinRadius{80.0f};
    float snowRadiusSpread{20.0f};

    // Assembled snow field: cube of edge fieldSize centered fieldLift above origin
    float snowFieldSize{70.0f};
    float snowFieldLift{10.0f};

    /**
     * @brief Upper bound on the particle count (ornament skips make it inexact)
     */
    size_t maxParticleCount() const;

    // Count as placed: negatives become 0, large values stop at MAX_CATEGORY_COUNT
    static int clampCount(int count);

    /**
     * @brief Build from SettingsManager, falling back per field to the defaults
     */
    static TreeSceneConfig fromSettings();
};

} // namespace TinselEngine

#endif // TREE_SCENE_CONFIG_HPP
