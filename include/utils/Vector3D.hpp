/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>

// A simple 3D vector class, also used for Euler angles (radians, XYZ order)
class Vector3D {
public:
    Vector3D() : m_x(0.0f), m_y(0.0f), m_z(0.0f) {}
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    Vector3D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 0.0001f) return Vector3D(0.0f, 0.0f, 1.0f); // Default direction
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector3D(m_x * invLen, m_y * invLen, m_z * invLen);
    }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    Vector3D cross(const Vector3D& v2) const {
        return Vector3D(m_y * v2.m_z - m_z * v2.m_y,
                        m_z * v2.m_x - m_x * v2.m_z,
                        m_x * v2.m_y - m_y * v2.m_x);
    }

    bool isFinite() const {
        return std::isfinite(m_x) && std::isfinite(m_y) && std::isfinite(m_z);
    }

    // Operator overloads
    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    friend Vector3D& operator+=(Vector3D& v1, const Vector3D& v2) {
        v1.m_x += v2.m_x;
        v1.m_y += v2.m_y;
        v1.m_z += v2.m_z;
        return v1;
    }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    Vector3D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    friend Vector3D& operator-=(Vector3D& v1, const Vector3D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_y -= v2.m_y;
        v1.m_z -= v2.m_z;
        return v1;
    }

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    // Rotations about a single axis, right-handed
    Vector3D rotatedX(float angle) const {
        float c = std::cos(angle), s = std::sin(angle);
        return Vector3D(m_x, m_y * c - m_z * s, m_y * s + m_z * c);
    }

    Vector3D rotatedY(float angle) const {
        float c = std::cos(angle), s = std::sin(angle);
        return Vector3D(m_x * c + m_z * s, m_y, -m_x * s + m_z * c);
    }

    Vector3D rotatedZ(float angle) const {
        float c = std::cos(angle), s = std::sin(angle);
        return Vector3D(m_x * c - m_y * s, m_x * s + m_y * c, m_z);
    }

    // Applies Euler angles in XYZ order (matrix Rx * Ry * Rz)
    Vector3D rotatedEuler(const Vector3D& euler) const {
        return rotatedZ(euler.m_z).rotatedY(euler.m_y).rotatedX(euler.m_x);
    }

    static float distanceSquared(const Vector3D& a, const Vector3D& b) {
        return (a - b).lengthSquared();
    }

    static float distance(const Vector3D& a, const Vector3D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    // a + (b - a) * t
    static Vector3D lerp(const Vector3D& a, const Vector3D& b, float t) {
        return Vector3D(a.m_x + (b.m_x - a.m_x) * t,
                        a.m_y + (b.m_y - a.m_y) * t,
                        a.m_z + (b.m_z - a.m_z) * t);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

#endif  // VECTOR_3D_HPP
