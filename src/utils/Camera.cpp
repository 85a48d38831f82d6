/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/Camera.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>
#include <numbers>

namespace TinselEngine {

Camera::Camera() {
    rebuildBasis();
}

Camera::Camera(const Config& config) : m_config(config) {
    if (!m_config.isValid()) {
        CAMERA_WARN("Invalid camera config provided, using defaults");
        m_config = Config{};
    }
    rebuildBasis();
}

Camera::Camera(const Config& config, float viewportWidth, float viewportHeight)
    : Camera(config) {
    setViewport(viewportWidth, viewportHeight);
}

bool Camera::setViewport(float width, float height) {
    Viewport viewport{width, height};
    if (!viewport.isValid()) {
        CAMERA_WARN(std::format("Ignoring invalid viewport {}x{}", width, height));
        return false;
    }
    m_viewport = viewport;
    CAMERA_DEBUG(std::format("Viewport set to {}x{} (aspect {:.3f})", width, height, getAspect()));
    return true;
}

bool Camera::setPosition(const Vector3D& position) {
    Config candidate = m_config;
    candidate.position = position;
    if (!candidate.isValid()) {
        return false;
    }
    m_config = candidate;
    rebuildBasis();
    return true;
}

bool Camera::lookAt(const Vector3D& target) {
    Config candidate = m_config;
    candidate.target = target;
    if (!candidate.isValid()) {
        return false;
    }
    m_config = candidate;
    rebuildBasis();
    return true;
}

Vector3D Camera::toViewSpace(const Vector3D& world) const {
    Vector3D rel = world - m_config.position;
    return Vector3D(rel.dot(m_right), rel.dot(m_up), rel.dot(m_forward));
}

Camera::Projection Camera::worldToScreen(const Vector3D& world) const {
    Vector3D view = toViewSpace(world);

    Projection result;
    result.depth = view.getZ();
    result.visible = result.depth > m_config.nearPlane && result.depth < m_config.farPlane;
    if (result.depth <= 0.0f) {
        return result;
    }

    // Vertical fov: half the viewport height spans tan(fov/2) at depth 1.
    // halfWidth / aspect == halfHeight so both axes share the same scale.
    float scale = pixelsPerUnit(result.depth);
    result.screenX = m_viewport.halfWidth() + view.getX() * scale;
    result.screenY = m_viewport.halfHeight() - view.getY() * scale;
    return result;
}

float Camera::pixelsPerUnit(float depth) const {
    if (depth <= 0.0f) {
        return 0.0f;
    }
    return m_focalLength * m_viewport.halfHeight() / depth;
}

void Camera::rebuildBasis() {
    m_forward = (m_config.target - m_config.position).normalized();

    // World up is +Y; fall back to +Z when looking straight up or down
    Vector3D worldUp(0.0f, 1.0f, 0.0f);
    if (std::fabs(m_forward.dot(worldUp)) > 0.999f) {
        worldUp = Vector3D(0.0f, 0.0f, 1.0f);
    }
    m_right = m_forward.cross(worldUp).normalized();
    m_up = m_right.cross(m_forward);

    float halfFov = m_config.fovDegrees * std::numbers::pi_v<float> / 360.0f;
    m_focalLength = 1.0f / std::tan(halfFov);
}

} // namespace TinselEngine
