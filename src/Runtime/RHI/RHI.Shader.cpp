module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <vector>

module RHI:Shader.Impl;

import :Shader;
import :Device;
import Core;

namespace RHI
{
    ShaderModule::ShaderModule(VulkanDevice& device, std::span<const uint32_t> spirv, ShaderStage stage)
        : m_Device(device), m_Stage(stage)
    {
        Create(spirv);
    }

    ShaderModule::ShaderModule(VulkanDevice& device, const std::string& spirvPath, ShaderStage stage)
        : m_Device(device), m_Stage(stage)
    {
        const std::vector<uint32_t> code = ReadFile(spirvPath);
        if (code.empty())
        {
            Core::Log::Error("Failed to load shader module: {}", spirvPath);
            return;
        }
        Create(code);
    }

    ShaderModule::~ShaderModule()
    {
        if (m_Module) vkDestroyShaderModule(m_Device.GetLogicalDevice(), m_Module, nullptr);
    }

    void ShaderModule::Create(std::span<const uint32_t> spirv)
    {
        if (spirv.empty()) return;

        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = spirv.size_bytes();
        createInfo.pCode = spirv.data();

        if (vkCreateShaderModule(m_Device.GetLogicalDevice(), &createInfo, nullptr, &m_Module) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create shader module ({} words).", spirv.size());
            m_Module = VK_NULL_HANDLE;
        }
    }

    VkPipelineShaderStageCreateInfo ShaderModule::GetStageInfo() const
    {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = (m_Stage == ShaderStage::Vertex) ? VK_SHADER_STAGE_VERTEX_BIT : VK_SHADER_STAGE_FRAGMENT_BIT;
        info.module = m_Module;
        info.pName = "main";
        return info;
    }

    std::vector<uint32_t> ShaderModule::ReadFile(const std::string& filename)
    {
        std::ifstream file(filename, std::ios::ate | std::ios::binary);
        if (!file.is_open())
        {
            Core::Log::Error("Failed to open shader file: {}", filename);
            return {};
        }

        const auto fileSize = static_cast<size_t>(file.tellg());
        if (fileSize == 0 || fileSize % sizeof(uint32_t) != 0)
        {
            Core::Log::Error("Shader file {} is not SPIR-V ({} bytes).", filename, fileSize);
            return {};
        }

        std::vector<uint32_t> buffer(fileSize / sizeof(uint32_t));
        file.seekg(0);
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(fileSize));
        return buffer;
    }
}
