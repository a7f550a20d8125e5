module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

export module RHI:CommandStream;

import :Pipeline;
import Core;

export namespace RHI
{
    // One resource write into a descriptor set. Which handles are meaningful depends on Type.
    struct DescriptorWrite
    {
        enum class Kind : uint8_t
        {
            CombinedImageSampler,
            UniformBuffer,
            StorageBuffer,
        };

        uint32_t Binding = 0;
        Kind Type = Kind::CombinedImageSampler;

        VkImageView View = VK_NULL_HANDLE;
        VkSampler Sampler = VK_NULL_HANDLE;

        VkBuffer Buffer = VK_NULL_HANDLE;
        VkDeviceSize Offset = 0;
        VkDeviceSize Range = VK_WHOLE_SIZE;
    };

    // The narrow slice of a command buffer the sprite draw path records into.
    // Implementations own where vertex bytes live for the lifetime of the frame.
    // Not thread-safe: one stream per recording thread.
    class ICommandStream
    {
    public:
        virtual ~ICommandStream() = default;

        virtual void BindPipeline(const GraphicsPipeline& pipeline) = 0;

        // Allocates a set compatible with pipeline.GetSetLayout(setIndex), writes it and binds it.
        [[nodiscard]] virtual Core::Result BindDescriptors(const GraphicsPipeline& pipeline,
                                                           uint32_t setIndex,
                                                           std::span<const DescriptorWrite> writes) = 0;

        // streams[i] goes to binding firstBinding + i. The bytes only need to outlive the call.
        [[nodiscard]] virtual Core::Result BindVertexStreams(uint32_t firstBinding,
                                                             std::span<const std::span<const std::byte>> streams) = 0;

        virtual void Draw(uint32_t vertexCount, uint32_t instanceCount,
                          uint32_t firstVertex, uint32_t firstInstance) = 0;
    };
}
