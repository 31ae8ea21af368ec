#pragma once
#include "core/Base.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <volk.h>

namespace DotObjViewer
{
    // Enum representing the type of resource extracted via SPIR-V reflection
    enum class ShaderResourceType
    {
        UNIFORM_BUFFER,
        STORAGE_BUFFER,
        SAMPLED_IMAGE,
        PUSH_CONSTANT,
        UNKNOWN,
    };

    // Structure describing a single shader resource (binding or constant)
    struct ShaderResource
    {
        std::string        name;
        uint32_t           set        = 0;
        uint32_t           binding    = 0;
        uint32_t           size       = 0; // Size in bytes (for buffers)
        uint32_t           arraySize  = 1; // Element count (for descriptor arrays)
        VkShaderStageFlags stageFlags = 0; // Stages that reference this resource
        ShaderResourceType type       = ShaderResourceType::UNKNOWN;
    };

    // Map: Shader Variable Name -> Resource Information
    using ShaderReflectionData = std::unordered_map<std::string, ShaderResource>;

    class Shader
    {
    public:
        /**
         * @brief Compiles GLSL to SPIR-V (or loads the .spv cache) and reflects resources.
         * Check IsValid() afterwards, a missing file or a compile error leaves the module null.
         * @param device Vulkan logical device handle.
         * @param api Device function table (volk).
         * @param filepath Path to the GLSL source (.vert, .frag).
         */
        Shader( VkDevice device, const VolkDeviceTable* api, const std::string& filepath );

        ~Shader();

        Shader( const Shader& )            = delete;
        Shader& operator=( const Shader& ) = delete;

        bool_t                                  IsValid() const { return m_module != VK_NULL_HANDLE; }
        VkShaderModule                          GetModule() const { return m_module; }
        VkShaderStageFlagBits                   GetStage() const { return m_stage; }
        const std::string&                      GetPath() const { return m_path; }
        const ShaderReflectionData&             GetReflectionData() const { return m_reflectionData; }
        const std::vector<VkPushConstantRange>& GetPushConstantRanges() const { return m_pushConstantRanges; }

        // Debug helper - logs detected resources
        void LogResources() const;

        static VkShaderStageFlagBits InferStageFromPath( const std::string& filepath );

    private:
        std::vector<uint32_t> CompileOrGetCache( const std::string& source );
        Result                Reflect( const std::vector<uint32_t>& spirv );
        static Result         ReadFile( const std::string& filepath, std::string& outContents );

    private:
        VkDevice               m_deviceHandle = VK_NULL_HANDLE;
        const VolkDeviceTable* m_api          = nullptr;
        std::string            m_path;

        VkShaderModule        m_module = VK_NULL_HANDLE;
        VkShaderStageFlagBits m_stage  = VK_SHADER_STAGE_FLAG_BITS_MAX_ENUM;

        ShaderReflectionData             m_reflectionData;
        std::vector<VkPushConstantRange> m_pushConstantRanges;
    };
} // namespace DotObjViewer
