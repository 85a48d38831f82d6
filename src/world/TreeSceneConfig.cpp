/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TreeSceneConfig.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>

namespace TinselEngine {

int TreeSceneConfig::clampCount(int count) {
  return std::clamp(count, 0, MAX_CATEGORY_COUNT);
}

size_t TreeSceneConfig::maxParticleCount() const {
  size_t total = 1; // star
  for (int count : {trunkCount, foliageCount, ornamentCount, lightCount, snowCount}) {
    total += static_cast<size_t>(clampCount(count));
  }
  return total;
}

TreeSceneConfig TreeSceneConfig::fromSettings() {
  const auto &settings = SettingsManager::Instance();
  TreeSceneConfig config;

  config.treeHeight = settings.get<float>("tree", "height", config.treeHeight);
  config.baseRadius = settings.get<float>("tree", "base_radius", config.baseRadius);
  config.trunkHeight = settings.get<float>("tree", "trunk_height", config.trunkHeight);
  config.trunkRadius = settings.get<float>("tree", "trunk_radius", config.trunkRadius);
  config.yOffset = settings.get<float>("tree", "y_offset", config.yOffset);
  config.lightTurns = settings.get<float>("tree", "light_turns", config.lightTurns);

  config.trunkCount = settings.get<int>("counts", "trunk", config.trunkCount);
  config.foliageCount = settings.get<int>("counts", "foliage", config.foliageCount);
  config.ornamentCount = settings.get<int>("counts", "ornament", config.ornamentCount);
  config.lightCount = settings.get<int>("counts", "light", config.lightCount);
  config.snowCount = settings.get<int>("counts", "snow", config.snowCount);

  config.scatterMinRadius =
      settings.get<float>("scatter", "min_radius", config.scatterMinRadius);
  config.scatterRadiusSpread =
      settings.get<float>("scatter", "radius_spread", config.scatterRadiusSpread);
  config.snowMinRadius =
      settings.get<float>("scatter", "snow_min_radius", config.snowMinRadius);
  config.snowRadiusSpread =
      settings.get<float>("scatter", "snow_radius_spread", config.snowRadiusSpread);

  config.snowFieldSize = settings.get<float>("snow", "field_size", config.snowFieldSize);
  config.snowFieldLift = settings.get<float>("snow", "field_lift", config.snowFieldLift);

  return config;
}

} // namespace TinselEngine
