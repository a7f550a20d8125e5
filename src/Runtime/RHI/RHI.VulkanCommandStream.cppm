module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

export module RHI:VulkanCommandStream;

import :CommandStream;
import :Descriptors;
import :Device;
import :Pipeline;
import :TransientAllocator;
import Core;

export namespace RHI
{
    // ICommandStream over a command buffer that is already recording inside a dynamic-rendering scope.
    // Vertex bytes are copied into `transient`; descriptor sets come from `descriptors`.
    // Both allocators must not be reset before the recorded work completes.
    class VulkanCommandStream final : public ICommandStream
    {
    public:
        VulkanCommandStream(VulkanDevice& device,
                            VkCommandBuffer cmd,
                            TransientAllocator& transient,
                            DescriptorAllocator& descriptors);

        void BindPipeline(const GraphicsPipeline& pipeline) override;

        [[nodiscard]] Core::Result BindDescriptors(const GraphicsPipeline& pipeline,
                                                   uint32_t setIndex,
                                                   std::span<const DescriptorWrite> writes) override;

        [[nodiscard]] Core::Result BindVertexStreams(uint32_t firstBinding,
                                                     std::span<const std::span<const std::byte>> streams) override;

        void Draw(uint32_t vertexCount, uint32_t instanceCount,
                  uint32_t firstVertex, uint32_t firstInstance) override;

        [[nodiscard]] VkCommandBuffer GetHandle() const { return m_Cmd; }

    private:
        VulkanDevice& m_Device;
        VkCommandBuffer m_Cmd = VK_NULL_HANDLE;
        TransientAllocator& m_Transient;
        DescriptorAllocator& m_Descriptors;
    };
}
