module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

module RHI:VulkanCommandStream.Impl;

import :VulkanCommandStream;
import :CommandStream;
import :Descriptors;
import :Device;
import :Pipeline;
import :TransientAllocator;
import Core;

namespace RHI
{
    namespace
    {
        VkDescriptorType ToVkDescriptorType(DescriptorWrite::Kind kind)
        {
            switch (kind)
            {
                case DescriptorWrite::Kind::CombinedImageSampler: return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
                case DescriptorWrite::Kind::UniformBuffer:        return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
                case DescriptorWrite::Kind::StorageBuffer:        return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            }
            return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        }
    }

    VulkanCommandStream::VulkanCommandStream(VulkanDevice& device,
                                             VkCommandBuffer cmd,
                                             TransientAllocator& transient,
                                             DescriptorAllocator& descriptors)
        : m_Device(device), m_Cmd(cmd), m_Transient(transient), m_Descriptors(descriptors)
    {
    }

    void VulkanCommandStream::BindPipeline(const GraphicsPipeline& pipeline)
    {
        vkCmdBindPipeline(m_Cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.GetHandle());
    }

    Core::Result VulkanCommandStream::BindDescriptors(const GraphicsPipeline& pipeline,
                                                      uint32_t setIndex,
                                                      std::span<const DescriptorWrite> writes)
    {
        VkDescriptorSetLayout setLayout = pipeline.GetSetLayout(setIndex);
        if (setLayout == VK_NULL_HANDLE)
        {
            Core::Log::Error("BindDescriptors: pipeline has no layout for set {} ({} layouts).",
                             setIndex, pipeline.GetSetLayoutCount());
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        VkDescriptorSet set = m_Descriptors.Allocate(setLayout);
        if (set == VK_NULL_HANDLE)
        {
            return Core::Err(Core::ErrorCode::DescriptorAllocationFailed);
        }

        // Info structs must stay put until vkUpdateDescriptorSets; reserve up front.
        std::vector<VkDescriptorImageInfo> imageInfos;
        std::vector<VkDescriptorBufferInfo> bufferInfos;
        imageInfos.reserve(writes.size());
        bufferInfos.reserve(writes.size());

        std::vector<VkWriteDescriptorSet> vkWrites;
        vkWrites.reserve(writes.size());

        for (const DescriptorWrite& write : writes)
        {
            VkWriteDescriptorSet w{};
            w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            w.dstSet = set;
            w.dstBinding = write.Binding;
            w.descriptorCount = 1;
            w.descriptorType = ToVkDescriptorType(write.Type);

            if (write.Type == DescriptorWrite::Kind::CombinedImageSampler)
            {
                if (write.View == VK_NULL_HANDLE || write.Sampler == VK_NULL_HANDLE)
                {
                    Core::Log::Error("BindDescriptors: binding {} has a null image view or sampler.", write.Binding);
                    return Core::Err(Core::ErrorCode::InvalidResource);
                }
                imageInfos.push_back({write.Sampler, write.View, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL});
                w.pImageInfo = &imageInfos.back();
            }
            else
            {
                if (write.Buffer == VK_NULL_HANDLE)
                {
                    Core::Log::Error("BindDescriptors: binding {} has a null buffer.", write.Binding);
                    return Core::Err(Core::ErrorCode::InvalidResource);
                }
                bufferInfos.push_back({write.Buffer, write.Offset, write.Range});
                w.pBufferInfo = &bufferInfos.back();
            }

            vkWrites.push_back(w);
        }

        if (!vkWrites.empty())
        {
            vkUpdateDescriptorSets(m_Device.GetLogicalDevice(), static_cast<uint32_t>(vkWrites.size()),
                                   vkWrites.data(), 0, nullptr);
        }

        vkCmdBindDescriptorSets(m_Cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.GetLayout(),
                                setIndex, 1, &set, 0, nullptr);
        return Core::Ok();
    }

    Core::Result VulkanCommandStream::BindVertexStreams(uint32_t firstBinding,
                                                        std::span<const std::span<const std::byte>> streams)
    {
        std::vector<VkBuffer> buffers;
        std::vector<VkDeviceSize> offsets;
        buffers.reserve(streams.size());
        offsets.reserve(streams.size());

        for (const auto& stream : streams)
        {
            auto allocation = m_Transient.Upload(stream);
            if (!allocation)
            {
                Core::Log::Error("BindVertexStreams: failed to stage {} bytes for binding {}: {}",
                                 stream.size(), firstBinding + buffers.size(),
                                 Core::ErrorCodeToString(allocation.error()));
                return Core::Err(allocation.error());
            }
            buffers.push_back(allocation->Buffer);
            offsets.push_back(allocation->Offset);
        }

        if (!buffers.empty())
        {
            vkCmdBindVertexBuffers(m_Cmd, firstBinding, static_cast<uint32_t>(buffers.size()),
                                   buffers.data(), offsets.data());
        }
        return Core::Ok();
    }

    void VulkanCommandStream::Draw(uint32_t vertexCount, uint32_t instanceCount,
                                   uint32_t firstVertex, uint32_t firstInstance)
    {
        vkCmdDraw(m_Cmd, vertexCount, instanceCount, firstVertex, firstInstance);
    }
}
