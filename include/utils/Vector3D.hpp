/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>
#include <ostream>

// A simple 3D vector for hit points, hit directions and force vectors.
// Y is up; locomotion happens on the XZ plane.
class Vector3D {
public:
    Vector3D() = default;
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    // Zero vector stays zero; callers that need a direction check isZero() first
    Vector3D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < EPSILON_SQ) return Vector3D();
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector3D(m_x * invLen, m_y * invLen, m_z * invLen);
    }

    bool isZero() const { return lengthSquared() < EPSILON_SQ; }

    bool isFinite() const {
        return std::isfinite(m_x) && std::isfinite(m_y) && std::isfinite(m_z);
    }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    // Flattened onto the ground plane
    Vector3D horizontal() const { return Vector3D(m_x, 0.0f, m_z); }

    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    Vector3D& operator+=(const Vector3D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        m_z += v2.m_z;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    Vector3D operator-() const { return Vector3D(-m_x, -m_y, -m_z); }

    Vector3D& operator-=(const Vector3D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        m_z -= v2.m_z;
        return *this;
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

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }

    static float distance(const Vector3D& a, const Vector3D& b) {
        return (a - b).length();
    }

    // Stream operator for Boost.Test diagnostics
    friend std::ostream& operator<<(std::ostream& os, const Vector3D& v) {
        return os << '(' << v.m_x << ", " << v.m_y << ", " << v.m_z << ')';
    }

private:
    static constexpr float EPSILON_SQ{1e-8f};

    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

#endif  // VECTOR_3D_HPP
