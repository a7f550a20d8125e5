module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>

module Graphics:SpriteVertex.Impl;

import RHI;
import :SpriteVertex;
import :DrawInfo;

namespace Graphics
{
    RHI::VertexInputDescription GetSpriteVertexInput()
    {
        RHI::VertexInputDescription input;

        input.Bindings = {
            {kQuadBinding, sizeof(QuadVertex), VK_VERTEX_INPUT_RATE_VERTEX},
            {kInstanceBinding, sizeof(InstanceData), VK_VERTEX_INPUT_RATE_INSTANCE},
        };

        input.Attributes = {
            // Quad
            {0, kQuadBinding, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>(offsetof(QuadVertex, Position))},
            {1, kQuadBinding, VK_FORMAT_R32G32_SFLOAT, static_cast<uint32_t>(offsetof(QuadVertex, UV))},
            {2, kQuadBinding, VK_FORMAT_R32G32B32A32_SFLOAT, static_cast<uint32_t>(offsetof(QuadVertex, Color))},
            // Instance
            {3, kInstanceBinding, VK_FORMAT_R32G32B32A32_SFLOAT, static_cast<uint32_t>(offsetof(InstanceData, Source))},
            {4, kInstanceBinding, VK_FORMAT_R32G32B32A32_SFLOAT, static_cast<uint32_t>(offsetof(InstanceData, Color))},
        };

        // mat4 takes four consecutive locations, one per column.
        const auto transformOffset = static_cast<uint32_t>(offsetof(InstanceData, Transform));
        for (uint32_t column = 0; column < 4; ++column)
        {
            input.Attributes.push_back({5 + column, kInstanceBinding, VK_FORMAT_R32G32B32A32_SFLOAT,
                                        transformOffset + column * static_cast<uint32_t>(sizeof(glm::vec4))});
        }

        return input;
    }

    InstanceData ToInstanceData(const DrawInfo& info)
    {
        return InstanceData{
            .Source = info.SourceRect.AsArray(),
            .Color = info.Tint.AsArray(),
            .Transform = info.Pose.AsMatrix(),
        };
    }
}
