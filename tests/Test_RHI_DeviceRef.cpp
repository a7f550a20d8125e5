#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <type_traits>

#include "RHI.Vulkan.hpp"

import RHI;
import Graphics;

// Every GPU resource borrows the device by reference; none can be handed a shared owner.

TEST(RHIDeviceRef, BufferTakesDeviceByRef)
{
    static_assert(std::is_constructible_v<RHI::VulkanBuffer, RHI::VulkanDevice&, size_t, VkBufferUsageFlags, VmaMemoryUsage>);
    static_assert(!std::is_constructible_v<RHI::VulkanBuffer, std::shared_ptr<RHI::VulkanDevice>, size_t, VkBufferUsageFlags, VmaMemoryUsage>);
    SUCCEED();
}

TEST(RHIDeviceRef, ShaderTakesDeviceByRef)
{
    static_assert(std::is_constructible_v<RHI::ShaderModule, RHI::VulkanDevice&, const std::string&, RHI::ShaderStage>);
    static_assert(std::is_constructible_v<RHI::ShaderModule, RHI::VulkanDevice&, std::span<const uint32_t>, RHI::ShaderStage>);
    static_assert(!std::is_constructible_v<RHI::ShaderModule, std::shared_ptr<RHI::VulkanDevice>, const std::string&, RHI::ShaderStage>);
    SUCCEED();
}

TEST(RHIDeviceRef, TextureUploadsThroughDeviceOrAdoptsBinding)
{
    static_assert(std::is_constructible_v<RHI::Texture, RHI::VulkanDevice&, std::span<const uint8_t>, uint32_t, uint32_t>);
    static_assert(std::is_constructible_v<RHI::Texture, const RHI::Texture::ExternalBinding&>);
    static_assert(!std::is_convertible_v<RHI::Texture::ExternalBinding, RHI::Texture>);
    static_assert(!std::is_copy_constructible_v<RHI::Texture>);
    SUCCEED();
}

TEST(RHIDeviceRef, DescriptorsAndUploadsTakeDeviceByRef)
{
    static_assert(std::is_constructible_v<RHI::DescriptorAllocator, RHI::VulkanDevice&>);
    static_assert(!std::is_constructible_v<RHI::DescriptorAllocator, std::shared_ptr<RHI::VulkanDevice>>);
    static_assert(std::is_constructible_v<RHI::TransientAllocator, RHI::VulkanDevice&>);
    static_assert(!std::is_constructible_v<RHI::TransientAllocator, std::shared_ptr<RHI::VulkanDevice>>);
    SUCCEED();
}

TEST(RHIDeviceRef, PipelineOwnershipIsUnique)
{
    static_assert(!std::is_copy_constructible_v<RHI::GraphicsPipeline>);
    static_assert(std::is_constructible_v<RHI::GraphicsPipeline, RHI::VulkanDevice*, VkPipeline, VkPipelineLayout>);
    static_assert(std::is_constructible_v<RHI::PipelineBuilder, RHI::VulkanDevice&>);
    SUCCEED();
}

TEST(RHIDeviceRef, ShaderProgramIsNotCopyable)
{
    static_assert(!std::is_copy_constructible_v<Graphics::ShaderProgram>);
    static_assert(!std::is_copy_assignable_v<Graphics::ShaderProgram>);
    static_assert(std::is_abstract_v<Graphics::IPipelineFactory>);
    static_assert(std::is_abstract_v<Graphics::IRenderContext>);
    static_assert(std::is_abstract_v<RHI::ICommandStream>);
    SUCCEED();
}
