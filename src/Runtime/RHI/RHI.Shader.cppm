module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

export module RHI:Shader;

import :Device;

export namespace RHI
{
    enum class ShaderStage { Vertex, Fragment };

    // Pre-built SPIR-V module. Compiling GLSL is the shader provider's job, not ours.
    class ShaderModule
    {
    public:
        ShaderModule(VulkanDevice& device, std::span<const uint32_t> spirv, ShaderStage stage);
        ShaderModule(VulkanDevice& device, const std::string& spirvPath, ShaderStage stage);
        ~ShaderModule();

        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] ShaderStage GetStage() const { return m_Stage; }
        [[nodiscard]] bool IsValid() const { return m_Module != VK_NULL_HANDLE; }
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo() const;

    private:
        VulkanDevice& m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        ShaderStage m_Stage;

        void Create(std::span<const uint32_t> spirv);
        [[nodiscard]] static std::vector<uint32_t> ReadFile(const std::string& filename);
    };
}
