module;
#include <array>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:DrawInfo;

export namespace Graphics
{
    // Pose expressed as parts. Rotation is about +Z (radians), pivoting around Offset.
    struct TransformComponents
    {
        glm::vec3 Position{0.0f};
        float Rotation = 0.0f;
        glm::vec3 Scale{1.0f};
        glm::vec3 Offset{0.0f};

        bool operator==(const TransformComponents&) const = default;
    };

    // Affine transform in one of two shapes. Mutators keep the shape:
    //  - Components: edit the matching field.
    //  - Matrix:     left-multiply an elementary matrix.
    // No validation; NaN/Inf propagate into AsMatrix().
    class Transform
    {
    public:
        using Shape = std::variant<TransformComponents, glm::mat4>;

        Transform() = default;

        [[nodiscard]] static Transform Identity() { return Transform{}; }
        [[nodiscard]] static Transform FromComponents(const TransformComponents& components);
        [[nodiscard]] static Transform FromMatrix(const glm::mat4& matrix);

        // Column-vector convention: T(Position) * T(Offset) * Rz(Rotation) * S(Scale) * T(-Offset).
        [[nodiscard]] glm::mat4 AsMatrix() const;

        Transform& Translate(float x, float y, float z);
        Transform& Destination(float x, float y, float z);
        Transform& NonUniformScale(float x, float y, float z);
        // Components: z is added to the angle (x/y have no 2D meaning). Matrix: Rz * Ry * Rx * M.
        Transform& Rotate(float x, float y, float z);
        // Components: sets the angle. Matrix: no stored angle, left unchanged.
        Transform& RotateValue(float radians);

        [[nodiscard]] bool IsMatrix() const { return std::holds_alternative<glm::mat4>(m_Shape); }
        [[nodiscard]] const Shape& GetShape() const { return m_Shape; }

        bool operator==(const Transform&) const = default;

    private:
        explicit Transform(Shape shape) : m_Shape(std::move(shape)) {}

        Shape m_Shape{TransformComponents{}};
    };

    // Linear RGBA tint, nominally [0,1]. Values outside that range are kept as-is.
    struct Color
    {
        float R = 1.0f;
        float G = 1.0f;
        float B = 1.0f;
        float A = 1.0f;

        [[nodiscard]] static constexpr Color Rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
        {
            return {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
        }

        [[nodiscard]] static constexpr Color Black() { return {0.0f, 0.0f, 0.0f, 1.0f}; }
        [[nodiscard]] static constexpr Color Grey() { return {0.25f, 0.25f, 0.25f, 1.0f}; }
        [[nodiscard]] static constexpr Color White() { return {1.0f, 1.0f, 1.0f, 1.0f}; }
        [[nodiscard]] static constexpr Color Red() { return {1.0f, 0.05f, 0.05f, 1.0f}; }
        [[nodiscard]] static constexpr Color Transparent() { return {0.0f, 0.0f, 0.0f, 0.0f}; }

        [[nodiscard]] constexpr std::array<float, 4> AsArray() const { return {R, G, B, A}; }

        // v * 255 truncated toward zero; saturates at 0/255, NaN maps to 0.
        [[nodiscard]] std::array<uint8_t, 4> AsU8Array() const;
        [[nodiscard]] std::vector<uint8_t> AsU8Vector() const;

        bool operator==(const Color&) const = default;
    };

    // Sub-region of the bound texture in normalized UV space.
    struct Rect
    {
        float X = 0.0f;
        float Y = 0.0f;
        float W = 1.0f;
        float H = 1.0f;

        [[nodiscard]] constexpr std::array<float, 4> AsArray() const { return {X, Y, W, H}; }

        bool operator==(const Rect&) const = default;
    };

    // Everything needed to place one sprite instance. Mutators chain.
    struct DrawInfo
    {
        Rect SourceRect{};
        Color Tint = Color::White();
        Transform Pose{};

        [[nodiscard]] static DrawInfo WithRect(const Rect& rect);
        [[nodiscard]] static DrawInfo WithTransform(const Transform& transform);
        [[nodiscard]] static DrawInfo WithColor(const Color& color);

        DrawInfo& Reset();
        DrawInfo& Translate(float x, float y, float z);
        DrawInfo& Rotate(float x, float y, float z);
        DrawInfo& RotateValue(float radians);
        DrawInfo& NonUniformScale(float x, float y, float z);
        DrawInfo& Scale(float s);
        DrawInfo& Destination(float x, float y, float z);

        bool operator==(const DrawInfo&) const = default;
    };
}
