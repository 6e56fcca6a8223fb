#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

namespace loom {

// Object TRS. Rotation is Euler XYZ in radians: points are scaled, then rotated
// about Z, Y and X in that order, then translated.
class Transform {
public:
    Transform() = default;
    Transform(const glm::vec3& position, const glm::vec3& rotation, const glm::vec3& scale)
        : m_position(position), m_rotation(rotation), m_scale(scale) {}

    void setPosition(const glm::vec3& pos) { m_position = pos; }
    void setRotation(const glm::vec3& eulerRadians) { m_rotation = eulerRadians; }
    void setScale(const glm::vec3& scale) { m_scale = scale; }
    void setScale(float uniform) { setScale({uniform, uniform, uniform}); }

    const glm::vec3& getPosition() const { return m_position; }
    const glm::vec3& getRotation() const { return m_rotation; }
    const glm::vec3& getScale() const { return m_scale; }

    glm::mat4 getRotationMatrix() const {
        glm::mat4 r(1.0f);
        r = glm::rotate(r, m_rotation.x, glm::vec3(1.0f, 0.0f, 0.0f));
        r = glm::rotate(r, m_rotation.y, glm::vec3(0.0f, 1.0f, 0.0f));
        r = glm::rotate(r, m_rotation.z, glm::vec3(0.0f, 0.0f, 1.0f));
        return r;
    }

    glm::mat4 getMatrix() const {
        return glm::translate(glm::mat4(1.0f), m_position)
             * getRotationMatrix()
             * glm::scale(glm::mat4(1.0f), m_scale);
    }

    glm::vec3 localToWorld(const glm::vec3& p) const {
        return glm::vec3(getMatrix() * glm::vec4(p, 1.0f));
    }

    // Offset from world into local space: inverse rotation, then division by
    // scale (magnitudes below 1e-6 are clamped, sign kept)
    glm::vec3 worldToLocalDelta(const glm::vec3& delta) const {
        glm::vec3 unrotated = glm::vec3(glm::transpose(getRotationMatrix()) * glm::vec4(delta, 0.0f));
        glm::vec3 s = m_scale;
        for (int i = 0; i < 3; ++i) {
            if (std::abs(s[i]) < 1e-6f) s[i] = s[i] < 0.0f ? -1e-6f : 1e-6f;
        }
        return unrotated / s;
    }

    bool operator==(const Transform& other) const {
        return m_position == other.m_position && m_rotation == other.m_rotation && m_scale == other.m_scale;
    }
    bool operator!=(const Transform& other) const { return !(*this == other); }

private:
    glm::vec3 m_position{0.0f};
    glm::vec3 m_rotation{0.0f};
    glm::vec3 m_scale{1.0f};
};

} // namespace loom
