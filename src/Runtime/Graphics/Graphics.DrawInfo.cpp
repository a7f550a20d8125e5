module;
#include <array>
#include <cmath>
#include <cstdint>
#include <type_traits>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

module Graphics:DrawInfo.Impl;

import :DrawInfo;

namespace Graphics
{
    namespace
    {
        // Overload set for std::visit over the two transform shapes.
        template <class... Ts>
        struct Overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

        uint8_t ToU8(float v)
        {
            const float scaled = v * 255.0f;
            if (!(scaled > 0.0f)) return 0; // also catches NaN
            if (scaled >= 255.0f) return 255;
            return static_cast<uint8_t>(scaled);
        }
    }

    // -------------------------------------------------------------------------
    // Transform
    // -------------------------------------------------------------------------

    Transform Transform::FromComponents(const TransformComponents& components)
    {
        return Transform(Shape{components});
    }

    Transform Transform::FromMatrix(const glm::mat4& matrix)
    {
        return Transform(Shape{matrix});
    }

    glm::mat4 Transform::AsMatrix() const
    {
        return std::visit(Overloaded{
            [](const glm::mat4& m) { return m; },
            [](const TransformComponents& c)
            {
                const float sinR = std::sin(c.Rotation);
                const float cosR = std::cos(c.Rotation);

                // glm is column-major: m[column][row].
                glm::mat4 m(1.0f);
                m[0][0] = cosR * c.Scale.x;
                m[1][0] = -sinR * c.Scale.y;
                m[0][1] = sinR * c.Scale.x;
                m[1][1] = cosR * c.Scale.y;
                m[2][2] = c.Scale.z;

                m[3][0] = c.Offset.x * (1.0f - m[0][0]) - c.Offset.y * m[1][0] + c.Position.x;
                m[3][1] = c.Offset.y * (1.0f - m[1][1]) - c.Offset.x * m[0][1] + c.Position.y;
                m[3][2] = c.Offset.z * (1.0f - c.Scale.z) + c.Position.z;
                return m;
            }
        }, m_Shape);
    }

    Transform& Transform::Translate(float x, float y, float z)
    {
        std::visit(Overloaded{
            [&](glm::mat4& m) { m = glm::translate(glm::mat4(1.0f), glm::vec3(x, y, z)) * m; },
            [&](TransformComponents& c) { c.Position += glm::vec3(x, y, z); }
        }, m_Shape);
        return *this;
    }

    Transform& Transform::Destination(float x, float y, float z)
    {
        std::visit(Overloaded{
            [&](glm::mat4& m) { m[3] = glm::vec4(x, y, z, m[3][3]); },
            [&](TransformComponents& c) { c.Position = glm::vec3(x, y, z); }
        }, m_Shape);
        return *this;
    }

    Transform& Transform::NonUniformScale(float x, float y, float z)
    {
        std::visit(Overloaded{
            [&](glm::mat4& m) { m = glm::scale(glm::mat4(1.0f), glm::vec3(x, y, z)) * m; },
            [&](TransformComponents& c) { c.Scale = glm::vec3(x, y, z); }
        }, m_Shape);
        return *this;
    }

    Transform& Transform::Rotate(float x, float y, float z)
    {
        std::visit(Overloaded{
            [&](glm::mat4& m)
            {
                glm::mat4 r = glm::rotate(glm::mat4(1.0f), z, glm::vec3(0.0f, 0.0f, 1.0f));
                r = glm::rotate(r, y, glm::vec3(0.0f, 1.0f, 0.0f));
                r = glm::rotate(r, x, glm::vec3(1.0f, 0.0f, 0.0f));
                m = r * m;
            },
            [&](TransformComponents& c) { c.Rotation += z; }
        }, m_Shape);
        return *this;
    }

    Transform& Transform::RotateValue(float radians)
    {
        std::visit(Overloaded{
            [](glm::mat4&) {},
            [&](TransformComponents& c) { c.Rotation = radians; }
        }, m_Shape);
        return *this;
    }

    // -------------------------------------------------------------------------
    // Color
    // -------------------------------------------------------------------------

    std::array<uint8_t, 4> Color::AsU8Array() const
    {
        return {ToU8(R), ToU8(G), ToU8(B), ToU8(A)};
    }

    std::vector<uint8_t> Color::AsU8Vector() const
    {
        const auto bytes = AsU8Array();
        return {bytes.begin(), bytes.end()};
    }

    // -------------------------------------------------------------------------
    // DrawInfo
    // -------------------------------------------------------------------------

    DrawInfo DrawInfo::WithRect(const Rect& rect)
    {
        DrawInfo info;
        info.SourceRect = rect;
        return info;
    }

    DrawInfo DrawInfo::WithTransform(const Transform& transform)
    {
        DrawInfo info;
        info.Pose = transform;
        return info;
    }

    DrawInfo DrawInfo::WithColor(const Color& color)
    {
        DrawInfo info;
        info.Tint = color;
        return info;
    }

    DrawInfo& DrawInfo::Reset()
    {
        *this = DrawInfo{};
        return *this;
    }

    DrawInfo& DrawInfo::Translate(float x, float y, float z)
    {
        Pose.Translate(x, y, z);
        return *this;
    }

    DrawInfo& DrawInfo::Rotate(float x, float y, float z)
    {
        Pose.Rotate(x, y, z);
        return *this;
    }

    DrawInfo& DrawInfo::RotateValue(float radians)
    {
        Pose.RotateValue(radians);
        return *this;
    }

    DrawInfo& DrawInfo::NonUniformScale(float x, float y, float z)
    {
        Pose.NonUniformScale(x, y, z);
        return *this;
    }

    DrawInfo& DrawInfo::Scale(float s)
    {
        Pose.NonUniformScale(s, s, s);
        return *this;
    }

    DrawInfo& DrawInfo::Destination(float x, float y, float z)
    {
        Pose.Destination(x, y, z);
        return *this;
    }
}
