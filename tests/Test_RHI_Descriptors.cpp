#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <vector>

#include "RHI.Vulkan.hpp"

import RHI;
import Core;

namespace {

class DeviceResourceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        RHI::ContextConfig config{
            .AppName = "DeviceResourceTest",
            .EnableValidation = true,
            .Headless = true,
        };

        m_Context = std::make_unique<RHI::VulkanContext>(config);
        if (!m_Context->IsValid())
        {
            GTEST_SKIP() << "No Vulkan instance available";
        }

        m_Device = std::make_unique<RHI::VulkanDevice>(*m_Context);
        if (!m_Device->IsValid())
        {
            GTEST_SKIP() << "No Vulkan 1.3 device available";
        }

        VkDescriptorSetLayoutBinding binding{};
        binding.binding = 0;
        binding.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        binding.descriptorCount = 1;
        binding.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;

        m_Layout = std::make_unique<RHI::DescriptorLayout>(*m_Device, std::span(&binding, 1));
        ASSERT_TRUE(m_Layout->IsValid());

        m_Allocator = std::make_unique<RHI::DescriptorAllocator>(*m_Device, 64);
        ASSERT_TRUE(m_Allocator->IsValid());
    }

    void TearDown() override
    {
        if (m_Device && m_Device->IsValid()) m_Device->WaitIdle();
        m_Allocator.reset();
        m_Layout.reset();
        m_Device.reset();
        m_Context.reset();
    }

    std::unique_ptr<RHI::VulkanContext> m_Context;
    std::unique_ptr<RHI::VulkanDevice> m_Device;

    std::unique_ptr<RHI::DescriptorLayout> m_Layout;
    std::unique_ptr<RHI::DescriptorAllocator> m_Allocator;
};

} // namespace

TEST_F(DeviceResourceTest, DescriptorAllocatorGrowsPools)
{
    // More sets than one pool holds: the allocator must chain additional pools.
    constexpr uint32_t kAllocCount = 1'000;

    for (uint32_t i = 0; i < kAllocCount; ++i)
    {
        VkDescriptorSet set = m_Allocator->Allocate(m_Layout->GetHandle());
        ASSERT_NE(set, VK_NULL_HANDLE) << "Allocation failed at i=" << i;
    }
}

TEST_F(DeviceResourceTest, DescriptorAllocatorResetRecyclesPools)
{
    constexpr uint32_t kAllocCount = 500;

    for (uint32_t i = 0; i < kAllocCount; ++i)
    {
        ASSERT_NE(m_Allocator->Allocate(m_Layout->GetHandle()), VK_NULL_HANDLE) << "Pre-reset i=" << i;
    }

    m_Allocator->Reset();

    for (uint32_t i = 0; i < kAllocCount; ++i)
    {
        ASSERT_NE(m_Allocator->Allocate(m_Layout->GetHandle()), VK_NULL_HANDLE) << "Post-reset i=" << i;
    }
}

TEST_F(DeviceResourceTest, EmptyDescriptorLayoutIsValid)
{
    RHI::DescriptorLayout empty(*m_Device, std::span<const VkDescriptorSetLayoutBinding>{});
    EXPECT_TRUE(empty.IsValid());
    EXPECT_NE(empty.GetHandle(), VK_NULL_HANDLE);
}

TEST_F(DeviceResourceTest, TransientAllocatorBumpsAlignsAndResets)
{
    RHI::TransientAllocator uploads(*m_Device, 1024);

    const auto a = uploads.Allocate(10, 16);
    const auto b = uploads.Allocate(10, 64);
    ASSERT_TRUE(a.IsValid());
    ASSERT_TRUE(b.IsValid());
    EXPECT_EQ(a.Buffer, b.Buffer);
    EXPECT_EQ(a.Offset, 0u);
    EXPECT_EQ(b.Offset, 64u);
    EXPECT_EQ(uploads.GetPageCount(), 1u);

    // Larger than a page: a dedicated page sized to fit.
    const auto big = uploads.Allocate(4096, 16);
    ASSERT_TRUE(big.IsValid());
    EXPECT_NE(big.Buffer, a.Buffer);
    EXPECT_EQ(uploads.GetPageCount(), 2u);

    uploads.Reset();
    const auto again = uploads.Allocate(10, 16);
    EXPECT_EQ(again.Buffer, a.Buffer);
    EXPECT_EQ(again.Offset, 0u);
    EXPECT_EQ(uploads.GetPageCount(), 2u);
}

TEST_F(DeviceResourceTest, TransientAllocatorUploadCopiesBytes)
{
    RHI::TransientAllocator uploads(*m_Device, 256);
    const std::array<std::byte, 4> bytes{std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4}};

    auto uploaded = uploads.Upload(bytes);
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_EQ(std::memcmp(uploaded->MappedPtr, bytes.data(), bytes.size()), 0);

    auto empty = uploads.Upload({});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), Core::ErrorCode::InvalidArgument);

    EXPECT_FALSE(uploads.Allocate(16, 3).IsValid()); // non power-of-two alignment
}

TEST_F(DeviceResourceTest, PipelineBuilderRejectsMissingShadersAndFormats)
{
    RHI::PipelineBuilder builder(*m_Device);
    auto noShaders = builder.SetColorFormats({VK_FORMAT_R8G8B8A8_UNORM}).Build();
    ASSERT_FALSE(noShaders.has_value());
    EXPECT_EQ(noShaders.error(), Core::ErrorCode::ShaderModuleInvalid);

    RHI::ShaderModule empty(*m_Device, std::span<const uint32_t>{}, RHI::ShaderStage::Vertex);
    EXPECT_FALSE(empty.IsValid());
    auto invalidShaders = builder.SetShaders(&empty, &empty).Build();
    ASSERT_FALSE(invalidShaders.has_value());
    EXPECT_EQ(invalidShaders.error(), Core::ErrorCode::ShaderModuleInvalid);
}

TEST_F(DeviceResourceTest, ExecuteImmediateRunsAndWaits)
{
    bool recorded = false;
    auto result = RHI::CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
    {
        recorded = (cmd != VK_NULL_HANDLE);
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(recorded);
}

TEST_F(DeviceResourceTest, ExecuteImmediateSurvivesDeviceRecreation)
{
    ASSERT_TRUE(RHI::CommandUtils::ExecuteImmediate(*m_Device, [](VkCommandBuffer) {}).has_value());
    const uint64_t firstId = m_Device->GetUniqueId();

    // Replacement devices may land at the freed address; the cached pool must not follow them.
    for (int generation = 0; generation < 3; ++generation)
    {
        m_Allocator.reset();
        m_Layout.reset();
        m_Device.reset();

        m_Device = std::make_unique<RHI::VulkanDevice>(*m_Context);
        ASSERT_TRUE(m_Device->IsValid()) << "generation " << generation;
        EXPECT_NE(m_Device->GetUniqueId(), firstId);

        const std::vector<uint8_t> pixel = {10, 20, 30, 255};
        RHI::Texture texture(*m_Device, pixel, 1u, 1u);
        EXPECT_TRUE(texture.IsValid()) << "generation " << generation;

        bool recorded = false;
        auto result = RHI::CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
        {
            recorded = (cmd != VK_NULL_HANDLE);
        });
        ASSERT_TRUE(result.has_value()) << "generation " << generation;
        EXPECT_TRUE(recorded);
    }
}
