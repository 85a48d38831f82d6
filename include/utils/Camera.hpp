/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CAMERA_HPP
#define CAMERA_HPP

#include "utils/Vector3D.hpp"

namespace TinselEngine {

/**
 * @brief Perspective camera for projecting the scene onto the SDL renderer
 *
 * The camera is a plain value type: a position, a look-at target and a
 * vertical field of view. It holds no renderer state. The viewport is the
 * logical render size and drives the aspect ratio.
 */
class Camera {
public:
    /**
     * @brief Camera configuration structure
     */
    struct Config {
        Vector3D position{0.0f, 5.0f, 50.0f};
        Vector3D target{0.0f, -5.0f, 0.0f};
        float fovDegrees{50.0f};       // Vertical field of view
        float nearPlane{0.1f};
        float farPlane{1000.0f};

        bool isValid() const {
            if (fovDegrees <= 0.0f || fovDegrees >= 180.0f) {
                return false;
            }
            if (nearPlane <= 0.0f || farPlane <= nearPlane) {
                return false;
            }
            return Vector3D::distanceSquared(position, target) > 0.0f;
        }
    };

    /**
     * @brief Viewport structure for rendering calculations
     */
    struct Viewport {
        float width{1280.0f};
        float height{720.0f};

        bool isValid() const {
            return width > 0.0f && height > 0.0f;
        }

        float halfWidth() const { return width * 0.5f; }
        float halfHeight() const { return height * 0.5f; }
    };

    /**
     * @brief Result of projecting a world point
     */
    struct Projection {
        float screenX{0.0f};
        float screenY{0.0f};
        float depth{0.0f};       // Distance along the view direction
        bool visible{false};     // Between the near and far planes
    };

    Camera();
    explicit Camera(const Config& config);
    Camera(const Config& config, float viewportWidth, float viewportHeight);

    ~Camera() = default;

    Camera(const Camera&) = default;
    Camera& operator=(const Camera&) = default;
    Camera(Camera&&) = default;
    Camera& operator=(Camera&&) = default;

    /**
     * @brief Sets the viewport size, updating the aspect ratio
     * @return false if the size was rejected (zero or negative)
     */
    bool setViewport(float width, float height);
    const Viewport& getViewport() const { return m_viewport; }
    float getAspect() const { return m_viewport.width / m_viewport.height; }

    /**
     * @brief Moves the camera, keeping its look-at target
     * @return false if the configuration would be degenerate
     */
    bool setPosition(const Vector3D& position);
    bool lookAt(const Vector3D& target);

    const Vector3D& getPosition() const { return m_config.position; }
    const Vector3D& getTarget() const { return m_config.target; }
    const Config& getConfig() const { return m_config; }

    /**
     * @brief Transforms a world point into camera space
     * @return (right, up, forward) coordinates; forward is the depth
     */
    Vector3D toViewSpace(const Vector3D& world) const;

    /**
     * @brief Projects a world point to logical screen coordinates
     */
    Projection worldToScreen(const Vector3D& world) const;

    /**
     * @brief On-screen size in pixels of one world unit at the given depth
     */
    float pixelsPerUnit(float depth) const;

private:
    Config m_config{};
    Viewport m_viewport{};

    // Orthonormal view basis, rebuilt when position or target change
    Vector3D m_forward{0.0f, 0.0f, -1.0f};
    Vector3D m_right{1.0f, 0.0f, 0.0f};
    Vector3D m_up{0.0f, 1.0f, 0.0f};
    float m_focalLength{1.0f};   // 1 / tan(fov / 2)

    void rebuildBasis();
};

} // namespace TinselEngine

#endif // CAMERA_HPP
