#include "rhi/Pipeline.hpp"

namespace DotObjViewer
{

    static VkDescriptorType MapResourceTypeToVulkan( ShaderResourceType type )
    {
        switch( type )
        {
            case ShaderResourceType::UNIFORM_BUFFER:
                return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            case ShaderResourceType::STORAGE_BUFFER:
                return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            case ShaderResourceType::SAMPLED_IMAGE:
                return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            default:
                return VK_DESCRIPTOR_TYPE_MAX_ENUM;
        }
    }

    PipelineLayout::PipelineLayout( VkDevice device, const VolkDeviceTable* api, const std::vector<Ref<Shader>>& shaders )
        : m_device( device )
        , m_api( api )
    {
        m_reflectionData = MergeReflectionData( shaders );

        // Set -> Binding -> Resource
        std::map<uint32_t, std::map<uint32_t, ShaderResource>> bySet;
        for( const auto& [ name, res ]: m_reflectionData )
        {
            if( res.type == ShaderResourceType::PUSH_CONSTANT || res.type == ShaderResourceType::UNKNOWN )
                continue;
            bySet[ res.set ][ res.binding ] = res;
        }

        std::vector<VkPushConstantRange> pushConstants;
        for( const auto& shader: shaders )
        {
            if( !shader )
                continue;
            const auto& pcs = shader->GetPushConstantRanges();
            pushConstants.insert( pushConstants.end(), pcs.begin(), pcs.end() );
        }

        // Contiguous [0, maxSet], gaps get empty layouts
        uint32_t setCount = bySet.empty() ? 0 : bySet.rbegin()->first + 1;
        for( uint32_t setIndex = 0; setIndex < setCount; ++setIndex )
        {
            std::vector<VkDescriptorSetLayoutBinding> vkBindings;
            auto                                      it = bySet.find( setIndex );
            if( it != bySet.end() )
            {
                for( const auto& [ bindingIndex, res ]: it->second )
                {
                    VkDescriptorSetLayoutBinding b{};
                    b.binding         = bindingIndex;
                    b.descriptorType  = MapResourceTypeToVulkan( res.type );
                    b.descriptorCount = res.arraySize;
                    b.stageFlags      = res.stageFlags;
                    vkBindings.push_back( b );
                }
            }

            VkDescriptorSetLayoutCreateInfo layoutInfo = { VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO };
            layoutInfo.bindingCount                    = static_cast<uint32_t>( vkBindings.size() );
            layoutInfo.pBindings                       = vkBindings.data();

            VkDescriptorSetLayout layout = VK_NULL_HANDLE;
            if( m_api->vkCreateDescriptorSetLayout( m_device, &layoutInfo, nullptr, &layout ) != VK_SUCCESS )
            {
                DOV_CORE_ERROR( "Failed to create descriptor set layout for set {}", setIndex );
                return;
            }
            m_setLayouts[ setIndex ] = layout;
        }

        std::vector<VkDescriptorSetLayout> contiguousLayouts;
        contiguousLayouts.reserve( m_setLayouts.size() );
        for( const auto& [ set, layout ]: m_setLayouts )
        {
            contiguousLayouts.push_back( layout );
        }

        VkPipelineLayoutCreateInfo pipelineLayoutInfo = { VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO };
        pipelineLayoutInfo.setLayoutCount             = static_cast<uint32_t>( contiguousLayouts.size() );
        pipelineLayoutInfo.pSetLayouts                = contiguousLayouts.data();
        pipelineLayoutInfo.pushConstantRangeCount     = static_cast<uint32_t>( pushConstants.size() );
        pipelineLayoutInfo.pPushConstantRanges        = pushConstants.data();

        if( m_api->vkCreatePipelineLayout( m_device, &pipelineLayoutInfo, nullptr, &m_layout ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create pipeline layout!" );
            m_layout = VK_NULL_HANDLE;
        }
    }

    PipelineLayout::~PipelineLayout()
    {
        if( m_layout != VK_NULL_HANDLE )
        {
            m_api->vkDestroyPipelineLayout( m_device, m_layout, nullptr );
        }
        for( auto& [ set, layout ]: m_setLayouts )
        {
            m_api->vkDestroyDescriptorSetLayout( m_device, layout, nullptr );
        }
    }

    VkDescriptorSetLayout PipelineLayout::GetDescriptorSetLayout( uint32_t set ) const
    {
        auto it = m_setLayouts.find( set );
        return ( it != m_setLayouts.end() ) ? it->second : VK_NULL_HANDLE;
    }

    ShaderReflectionData PipelineLayout::MergeReflectionData( const std::vector<Ref<Shader>>& shaders )
    {
        ShaderReflectionData merged;

        for( const auto& shader: shaders )
        {
            if( !shader )
                continue;

            for( const auto& [ name, resource ]: shader->GetReflectionData() )
            {
                auto it = merged.find( name );
                if( it == merged.end() )
                {
                    merged[ name ] = resource;
                    continue;
                }

                if( it->second.set != resource.set || it->second.binding != resource.binding )
                {
                    DOV_CORE_WARN( "Resource '{}' declared at different slots across stages ({}:{} vs {}:{})", name, it->second.set,
                                   it->second.binding, resource.set, resource.binding );
                }
                it->second.stageFlags |= resource.stageFlags;
            }
        }
        return merged;
    }

    GraphicsPipeline::GraphicsPipeline( VkDevice device, const VolkDeviceTable* api, const GraphicsPipelineDesc& desc, VkPipelineCache cache )
        : m_device( device )
        , m_api( api )
        , m_polygonMode( desc.polygonMode )
    {
        if( !desc.vertexShader || !desc.vertexShader->IsValid() )
        {
            DOV_CORE_ERROR( "GraphicsPipeline requires a valid vertex shader!" );
            return;
        }

        std::vector<Ref<Shader>> shaders = { desc.vertexShader };
        if( desc.fragmentShader )
            shaders.push_back( desc.fragmentShader );

        m_layout = desc.layout ? desc.layout : CreateRef<PipelineLayout>( m_device, m_api, shaders );
        if( !m_layout->IsValid() )
        {
            DOV_CORE_ERROR( "GraphicsPipeline has no valid pipeline layout!" );
            return;
        }

        // 1. Shader Stages
        std::vector<VkPipelineShaderStageCreateInfo> shaderStages;
        for( const auto& shader: shaders )
        {
            VkPipelineShaderStageCreateInfo stage = { VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO };
            stage.stage                           = shader->GetStage();
            stage.module                          = shader->GetModule();
            stage.pName                           = "main";
            shaderStages.push_back( stage );
        }

        // 2. Vertex Input
        VkVertexInputBindingDescription                binding = {};
        std::vector<VkVertexInputAttributeDescription> attributes;
        binding.binding   = 0;
        binding.stride    = desc.vertexLayout.stride;
        binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
        for( const auto& attr: desc.vertexLayout.attributes )
        {
            VkVertexInputAttributeDescription a = {};
            a.location                          = attr.location;
            a.binding                           = 0;
            a.format                            = attr.format;
            a.offset                            = attr.offset;
            attributes.push_back( a );
        }

        VkPipelineVertexInputStateCreateInfo vertexInputInfo = { VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO };
        if( desc.vertexLayout.stride > 0 )
        {
            vertexInputInfo.vertexBindingDescriptionCount   = 1;
            vertexInputInfo.pVertexBindingDescriptions      = &binding;
            vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>( attributes.size() );
            vertexInputInfo.pVertexAttributeDescriptions    = attributes.data();
        }

        // 3. Input Assembly
        VkPipelineInputAssemblyStateCreateInfo inputAssembly = { VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO };
        inputAssembly.topology                               = desc.topology;
        inputAssembly.primitiveRestartEnable                 = VK_FALSE;

        // 4. Viewport & Scissor (Dynamic State)
        VkPipelineViewportStateCreateInfo viewportState = { VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO };
        viewportState.viewportCount                     = 1;
        viewportState.scissorCount                      = 1;

        // 5. Rasterizer
        VkPipelineRasterizationStateCreateInfo rasterizer = { VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO };
        rasterizer.depthClampEnable                       = VK_FALSE;
        rasterizer.rasterizerDiscardEnable                = VK_FALSE;
        rasterizer.polygonMode                            = desc.polygonMode;
        rasterizer.lineWidth                              = desc.lineWidth;
        rasterizer.cullMode                               = desc.cullMode;
        rasterizer.frontFace                              = desc.frontFace;
        rasterizer.depthBiasEnable                        = VK_FALSE;

        // 6. Multisampling
        VkPipelineMultisampleStateCreateInfo multisampling = { VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO };
        multisampling.rasterizationSamples                 = VK_SAMPLE_COUNT_1_BIT;

        // 7. Depth Stencil
        VkPipelineDepthStencilStateCreateInfo depthStencil = { VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO };
        depthStencil.depthTestEnable                       = desc.depthTestEnable;
        depthStencil.depthWriteEnable                      = desc.depthWriteEnable;
        depthStencil.depthCompareOp                        = desc.depthCompareOp;

        // 8. Color Blending, opaque
        std::vector<VkPipelineColorBlendAttachmentState> colorBlendAttachments( desc.colorAttachmentFormats.size() );
        for( auto& attachment: colorBlendAttachments )
        {
            attachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
            attachment.blendEnable    = VK_FALSE;
        }

        VkPipelineColorBlendStateCreateInfo colorBlending = { VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO };
        colorBlending.attachmentCount                     = static_cast<uint32_t>( colorBlendAttachments.size() );
        colorBlending.pAttachments                        = colorBlendAttachments.data();

        // 9. Dynamic States
        std::vector<VkDynamicState>      dynamicStates = { VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR };
        VkPipelineDynamicStateCreateInfo dynamicState  = { VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO };
        dynamicState.dynamicStateCount                 = static_cast<uint32_t>( dynamicStates.size() );
        dynamicState.pDynamicStates                    = dynamicStates.data();

        // 10. Dynamic Rendering Info
        VkPipelineRenderingCreateInfo renderingInfo = { VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO };
        renderingInfo.colorAttachmentCount          = static_cast<uint32_t>( desc.colorAttachmentFormats.size() );
        renderingInfo.pColorAttachmentFormats       = desc.colorAttachmentFormats.data();
        renderingInfo.depthAttachmentFormat         = desc.depthAttachmentFormat;

        VkGraphicsPipelineCreateInfo pipelineInfo = { VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO };
        pipelineInfo.pNext                        = &renderingInfo;
        pipelineInfo.stageCount                   = static_cast<uint32_t>( shaderStages.size() );
        pipelineInfo.pStages                      = shaderStages.data();
        pipelineInfo.pVertexInputState            = &vertexInputInfo;
        pipelineInfo.pInputAssemblyState          = &inputAssembly;
        pipelineInfo.pViewportState               = &viewportState;
        pipelineInfo.pRasterizationState          = &rasterizer;
        pipelineInfo.pMultisampleState            = &multisampling;
        pipelineInfo.pDepthStencilState           = &depthStencil;
        pipelineInfo.pColorBlendState             = &colorBlending;
        pipelineInfo.pDynamicState                = &dynamicState;
        pipelineInfo.layout                       = m_layout->GetHandle();
        pipelineInfo.renderPass                   = VK_NULL_HANDLE;

        if( m_api->vkCreateGraphicsPipelines( m_device, cache, 1, &pipelineInfo, nullptr, &m_pipeline ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create graphics pipeline!" );
            m_pipeline = VK_NULL_HANDLE;
        }
    }

    GraphicsPipeline::~GraphicsPipeline()
    {
        if( m_pipeline )
            m_api->vkDestroyPipeline( m_device, m_pipeline, nullptr );
    }

} // namespace DotObjViewer
