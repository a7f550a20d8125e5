module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <glm/glm.hpp>

export module Graphics:SpriteVertex;

import RHI;
import :DrawInfo;

export namespace Graphics
{
    // Per-vertex stream (binding 0).
    struct QuadVertex
    {
        std::array<float, 3> Position;
        std::array<float, 2> UV;
        std::array<float, 4> Color;
    };

    // Per-instance stream (binding 1). Layout must match shaders/sprite.vert.
    struct InstanceData
    {
        std::array<float, 4> Source;  // normalized (x, y, w, h) into the texture
        std::array<float, 4> Color;
        glm::mat4 Transform;          // column-major, consumed as 4 vec4 attributes
    };

    static_assert(std::is_standard_layout_v<QuadVertex> && std::is_trivially_copyable_v<QuadVertex>);
    static_assert(sizeof(QuadVertex) == 9 * sizeof(float), "QuadVertex must be tightly packed");
    static_assert(sizeof(InstanceData) == 24 * sizeof(float), "InstanceData must be tightly packed");

    inline constexpr uint32_t kQuadBinding = 0;
    inline constexpr uint32_t kInstanceBinding = 1;
    inline constexpr uint32_t kQuadVertexCount = 4;

    // Unit quad as a triangle strip, shared by every batch and every frame.
    inline constexpr std::array<QuadVertex, kQuadVertexCount> kQuadVertices = {{
        {{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{0.0f, 1.0f, 0.0f}, {0.0f, 1.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{1.0f, 0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{1.0f, 1.0f, 0.0f}, {1.0f, 1.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
    }};

    [[nodiscard]] RHI::VertexInputDescription GetSpriteVertexInput();

    // The one per-instance call site of Transform::AsMatrix().
    [[nodiscard]] InstanceData ToInstanceData(const DrawInfo& info);
}
