#pragma once
#include "core/Base.hpp"
#include "rhi/Shader.hpp"
#include <map>
#include <vector>
#include <volk.h>

namespace DotObjViewer
{
    struct VertexAttribute
    {
        uint32_t location = 0;
        VkFormat format   = VK_FORMAT_R32G32B32_SFLOAT;
        uint32_t offset   = 0;
    };

    // Single interleaved per-vertex binding
    struct VertexInputLayout
    {
        uint32_t                     stride = 0;
        std::vector<VertexAttribute> attributes;
    };

    /**
     * @brief Descriptor set layouts plus pipeline layout built from shader reflection.
     * Several pipelines may share one instance so their descriptor sets stay interchangeable.
     */
    class PipelineLayout
    {
    public:
        PipelineLayout( VkDevice device, const VolkDeviceTable* api, const std::vector<Ref<Shader>>& shaders );
        ~PipelineLayout();

        PipelineLayout( const PipelineLayout& )            = delete;
        PipelineLayout& operator=( const PipelineLayout& ) = delete;

        bool_t                      IsValid() const { return m_layout != VK_NULL_HANDLE; }
        VkPipelineLayout            GetHandle() const { return m_layout; }
        const ShaderReflectionData& GetReflectionData() const { return m_reflectionData; }
        VkDescriptorSetLayout       GetDescriptorSetLayout( uint32_t set ) const;

        // Merges reflection maps, OR-ing stage flags of resources visible in several stages
        static ShaderReflectionData MergeReflectionData( const std::vector<Ref<Shader>>& shaders );

    private:
        VkDevice                                  m_device;
        const VolkDeviceTable*                    m_api;
        VkPipelineLayout                          m_layout = VK_NULL_HANDLE;
        std::map<uint32_t, VkDescriptorSetLayout> m_setLayouts;
        ShaderReflectionData                      m_reflectionData;
    };

    struct GraphicsPipelineDesc
    {
        Ref<Shader>         vertexShader;
        Ref<Shader>         fragmentShader;
        Ref<PipelineLayout> layout; // Optional, built from the shaders when null

        VertexInputLayout vertexLayout;

        // Input Assembly
        VkPrimitiveTopology topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

        // Rasterization
        VkPolygonMode   polygonMode = VK_POLYGON_MODE_FILL;
        VkCullModeFlags cullMode    = VK_CULL_MODE_BACK_BIT;
        VkFrontFace     frontFace   = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        float           lineWidth   = 1.0f;

        // Depth Stencil
        bool        depthTestEnable  = true;
        bool        depthWriteEnable = true;
        VkCompareOp depthCompareOp   = VK_COMPARE_OP_LESS;

        // Dynamic Rendering Formats (Vulkan 1.3)
        std::vector<VkFormat> colorAttachmentFormats = { VK_FORMAT_B8G8R8A8_SRGB };
        VkFormat              depthAttachmentFormat  = VK_FORMAT_D32_SFLOAT;
    };

    class GraphicsPipeline
    {
    public:
        GraphicsPipeline( VkDevice device, const VolkDeviceTable* api, const GraphicsPipelineDesc& desc, VkPipelineCache cache = VK_NULL_HANDLE );
        ~GraphicsPipeline();

        GraphicsPipeline( const GraphicsPipeline& )            = delete;
        GraphicsPipeline& operator=( const GraphicsPipeline& ) = delete;

        bool_t           IsValid() const { return m_pipeline != VK_NULL_HANDLE; }
        VkPipeline       GetHandle() const { return m_pipeline; }
        VkPipelineLayout GetLayout() const { return m_layout ? m_layout->GetHandle() : VK_NULL_HANDLE; }
        VkPolygonMode    GetPolygonMode() const { return m_polygonMode; }

    private:
        VkDevice               m_device;
        const VolkDeviceTable* m_api;
        VkPipeline             m_pipeline = VK_NULL_HANDLE;
        Ref<PipelineLayout>    m_layout;
        VkPolygonMode          m_polygonMode;
    };
} // namespace DotObjViewer
