/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ParticleManagerCoreTest
#include <boost/test/unit_test.hpp>

#include "managers/ParticleManager.hpp"
#include "utils/Camera.hpp"
#include "world/TreeSceneConfig.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace TinselEngine;

namespace {

constexpr uint32_t TEST_SEED = 42;

// Small tree so each test stays fast
TreeSceneConfig smallConfig() {
  TreeSceneConfig config;
  config.trunkCount = 20;
  config.foliageCount = 200;
  config.ornamentCount = 30;
  config.lightCount = 40;
  config.snowCount = 50;
  return config;
}

} // namespace

// Test fixture for ParticleManager core functionality
struct ParticleManagerCoreFixture {
  ParticleManagerCoreFixture() {
    manager = &ParticleManager::Instance();

    // Ensure clean state for each test
    if (manager->isInitialized()) {
      manager->clean();
    }
  }

  ~ParticleManagerCoreFixture() {
    if (manager->isInitialized()) {
      manager->clean();
    }
  }

  ParticleManager *manager;
};

// Test basic initialization
BOOST_FIXTURE_TEST_CASE(TestInitialization, ParticleManagerCoreFixture) {
  BOOST_CHECK(!manager->isInitialized());

  bool initResult = manager->init(smallConfig(), TEST_SEED);
  BOOST_CHECK(initResult);
  BOOST_CHECK(manager->isInitialized());
  BOOST_CHECK(!manager->isShutdown());

  BOOST_CHECK_EQUAL(manager->getParticleCount(ParticleCategory::Trunk), 20u);
  BOOST_CHECK_EQUAL(manager->getParticleCount(ParticleCategory::Leaf), 200u);
  BOOST_CHECK_EQUAL(manager->getParticleCount(ParticleCategory::Light), 40u);
  BOOST_CHECK_EQUAL(manager->getParticleCount(ParticleCategory::Star), 1u);
  BOOST_CHECK_EQUAL(manager->getParticleCount(ParticleCategory::Snow), 50u);
  BOOST_CHECK_LE(manager->getParticleCount(ParticleCategory::Ornament), 30u);
  BOOST_CHECK_EQUAL(manager->getParticleCount(ParticleCategory::COUNT), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestCategoryCountsSumToTotal, ParticleManagerCoreFixture) {
  BOOST_REQUIRE(manager->init(smallConfig(), TEST_SEED));

  size_t sum = 0;
  for (int c = 0; c < static_cast<int>(ParticleCategory::COUNT); ++c) {
    sum += manager->getParticleCount(static_cast<ParticleCategory>(c));
  }
  BOOST_CHECK_EQUAL(sum, manager->getParticleCount());
  BOOST_CHECK_EQUAL(manager->getParticles().size(), manager->getParticleCount());
}

// Test double initialization handling
BOOST_FIXTURE_TEST_CASE(TestDoubleInitialization, ParticleManagerCoreFixture) {
  BOOST_CHECK(manager->init(smallConfig(), TEST_SEED));
  size_t count = manager->getParticleCount();

  // Second init keeps the existing particles
  TreeSceneConfig bigger = smallConfig();
  bigger.foliageCount = 1000;
  BOOST_CHECK(manager->init(bigger, TEST_SEED));
  BOOST_CHECK(manager->isInitialized());
  BOOST_CHECK_EQUAL(manager->getParticleCount(), count);
}

// Test cleanup functionality
BOOST_FIXTURE_TEST_CASE(TestCleanup, ParticleManagerCoreFixture) {
  manager->init(smallConfig(), TEST_SEED);
  BOOST_CHECK(manager->isInitialized());

  manager->clean();
  BOOST_CHECK(!manager->isInitialized());
  BOOST_CHECK(manager->isShutdown());
  BOOST_CHECK_EQUAL(manager->getParticleCount(), 0u);
  BOOST_CHECK_EQUAL(manager->getParticleCount(ParticleCategory::Leaf), 0u);

  // Second clean is a no-op
  BOOST_CHECK_NO_THROW(manager->clean());
  BOOST_CHECK(manager->isShutdown());

  // Re-init after shutdown works
  BOOST_CHECK(manager->init(smallConfig(), TEST_SEED));
  BOOST_CHECK(!manager->isShutdown());
  BOOST_CHECK_GT(manager->getParticleCount(), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestUpdateBeforeInitIsIgnored, ParticleManagerCoreFixture) {
  BOOST_CHECK_NO_THROW(manager->update(1.0f / 60.0f, TreeLayout::Dispersed));
  BOOST_CHECK_EQUAL(manager->getParticleCount(), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestUpdateAdvancesTime, ParticleManagerCoreFixture) {
  BOOST_REQUIRE(manager->init(smallConfig(), TEST_SEED));
  BOOST_CHECK_EQUAL(manager->getElapsedTime(), 0.0f);

  for (int i = 0; i < 60; ++i) {
    manager->update(1.0f / 60.0f, TreeLayout::Assembled);
  }
  BOOST_CHECK_CLOSE(manager->getElapsedTime(), 1.0f, 0.01f);
  BOOST_CHECK_CLOSE(manager->getGroupRotation().getY(), 0.1f, 0.1f);

  ParticlePerformanceStats stats = manager->getPerformanceStats();
  BOOST_CHECK_EQUAL(stats.updateCount, 60u);
  BOOST_CHECK_EQUAL(stats.activeParticles, manager->getParticleCount());
}

BOOST_FIXTURE_TEST_CASE(TestDisperseMovesEveryParticle, ParticleManagerCoreFixture) {
  BOOST_REQUIRE(manager->init(smallConfig(), TEST_SEED));

  // Five seconds at 60 Hz
  for (int i = 0; i < 300; ++i) {
    manager->update(1.0f / 60.0f, TreeLayout::Dispersed);
  }
  for (const auto &particle : manager->getParticles()) {
    float distance = Vector3D::distance(particle.getMesh().position,
                                        particle.getTarget(TreeLayout::Dispersed));
    BOOST_CHECK_LT(distance, 0.5f);
  }
}

BOOST_FIXTURE_TEST_CASE(TestDistanceShrinksForEveryCategory, ParticleManagerCoreFixture) {
  BOOST_REQUIRE(manager->init(smallConfig(), TEST_SEED));
  for (size_t c = 0; c < static_cast<size_t>(ParticleCategory::COUNT); ++c) {
    BOOST_REQUIRE_GT(manager->getParticleCount(static_cast<ParticleCategory>(c)), 0u);
  }

  const auto &particles = manager->getParticles();
  std::vector<float> previous;
  previous.reserve(particles.size());
  for (const auto &particle : particles) {
    previous.push_back(Vector3D::distance(particle.getMesh().position,
                                          particle.getTarget(TreeLayout::Dispersed)));
  }

  for (int frame = 0; frame < 60; ++frame) {
    manager->update(1.0f / 60.0f, TreeLayout::Dispersed);
    for (size_t i = 0; i < particles.size(); ++i) {
      float current = Vector3D::distance(particles[i].getMesh().position,
                                         particles[i].getTarget(TreeLayout::Dispersed));
      BOOST_CHECK_LT(current, previous[i]);
      previous[i] = current;
    }
  }
}

BOOST_FIXTURE_TEST_CASE(TestRenderWithoutRendererIsSafe, ParticleManagerCoreFixture) {
  BOOST_REQUIRE(manager->init(smallConfig(), TEST_SEED));
  Camera camera;
  BOOST_CHECK_NO_THROW(manager->render(nullptr, camera));
  BOOST_CHECK_EQUAL(manager->getPerformanceStats().renderCount, 0u);
}

BOOST_AUTO_TEST_SUITE(GroupTransformTests)

BOOST_AUTO_TEST_CASE(TestGroupSpinRate) {
  Vector3D rotation = ParticleManager::groupRotationAt(10.0f, TreeLayout::Assembled);
  BOOST_CHECK_EQUAL(rotation.getX(), 0.0f);
  BOOST_CHECK_CLOSE(rotation.getY(), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSwayAmplitudeByLayout) {
  float assembledMax = 0.0f;
  float dispersedMax = 0.0f;
  for (int i = 0; i < 4000; ++i) {
    float t = static_cast<float>(i) * 0.01f;
    assembledMax = std::max(assembledMax,
        std::abs(ParticleManager::groupRotationAt(t, TreeLayout::Assembled).getZ()));
    dispersedMax = std::max(dispersedMax,
        std::abs(ParticleManager::groupRotationAt(t, TreeLayout::Dispersed).getZ()));
  }
  BOOST_CHECK_LE(assembledMax, 0.015f + 1e-6f);
  BOOST_CHECK_GT(assembledMax, 0.014f);
  BOOST_CHECK_LE(dispersedMax, 0.1f + 1e-6f);
  BOOST_CHECK_GT(dispersedMax, 0.09f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ShadingTests)

BOOST_AUTO_TEST_CASE(TestFogGrowsWithDepth) {
  BOOST_CHECK_EQUAL(ParticleManager::fogFactor(0.0f), 0.0f);
  BOOST_CHECK_EQUAL(ParticleManager::fogFactor(-5.0f), 0.0f);

  float nearFog = ParticleManager::fogFactor(10.0f);
  float mid = ParticleManager::fogFactor(50.0f);
  float farFog = ParticleManager::fogFactor(200.0f);
  BOOST_CHECK_LT(nearFog, mid);
  BOOST_CHECK_LT(mid, farFog);
  BOOST_CHECK_LE(farFog, 1.0f);

  // exp2 fog: 1 - exp(-(0.02 * 50)^2)
  BOOST_CHECK_CLOSE(mid, 1.0f - std::exp(-1.0f), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestUnlitMaterialKeepsColor) {
  MeshInstance mesh;
  mesh.material.color = ColorRGB{0.2f, 0.4f, 0.6f};
  mesh.material.lit = false;
  mesh.material.emissive = ColorRGB{1.0f, 1.0f, 1.0f};
  mesh.material.emissiveIntensity = 5.0f;

  ColorRGB shaded = ParticleManager::shade(mesh, Vector3D(0.0f, 0.0f, 0.0f),
                                           Vector3D(0.0f, 0.0f, 1.0f));
  BOOST_CHECK(shaded == mesh.material.color);
}

BOOST_AUTO_TEST_CASE(TestEmissiveBrightens) {
  MeshInstance mesh;
  mesh.material.color = ColorRGB{0.1f, 0.1f, 0.1f};
  mesh.material.emissive = ColorRGB{1.0f, 0.8f, 0.0f};

  mesh.material.emissiveIntensity = 0.0f;
  ColorRGB dark = ParticleManager::shade(mesh, Vector3D(0.0f, 0.0f, 0.0f),
                                         Vector3D(0.0f, 0.0f, 1.0f));
  mesh.material.emissiveIntensity = 0.5f;
  ColorRGB bright = ParticleManager::shade(mesh, Vector3D(0.0f, 0.0f, 0.0f),
                                           Vector3D(0.0f, 0.0f, 1.0f));

  BOOST_CHECK_GT(bright.r, dark.r);
  BOOST_CHECK_GT(bright.g, dark.g);
  BOOST_CHECK_CLOSE(bright.b, dark.b, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestShadeClampsToUnitRange) {
  MeshInstance mesh;
  mesh.material.color = ColorRGB{1.0f, 1.0f, 1.0f};
  mesh.material.emissive = ColorRGB{1.0f, 1.0f, 1.0f};
  mesh.material.emissiveIntensity = 10.0f;

  ColorRGB shaded = ParticleManager::shade(mesh, Vector3D(0.0f, 10.0f, 0.0f),
                                           Vector3D(0.0f, 1.0f, 0.0f));
  BOOST_CHECK_EQUAL(shaded.r, 1.0f);
  BOOST_CHECK_EQUAL(shaded.g, 1.0f);
  BOOST_CHECK_EQUAL(shaded.b, 1.0f);
}

BOOST_AUTO_TEST_CASE(TestAmbientFloor) {
  // Ambient alone gives at least half the base color
  MeshInstance mesh;
  mesh.material.color = ColorRGB{0.4f, 0.4f, 0.4f};
  ColorRGB shaded = ParticleManager::shade(mesh, Vector3D(0.0f, 0.0f, 0.0f),
                                           Vector3D(0.0f, 0.0f, 1.0f));
  BOOST_CHECK_GE(shaded.r, 0.2f - 1e-5f);
  BOOST_CHECK_GE(shaded.g, 0.2f - 1e-5f);
}

BOOST_AUTO_TEST_SUITE_END()
