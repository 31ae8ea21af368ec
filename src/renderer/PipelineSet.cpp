#include "renderer/PipelineSet.hpp"

#include "core/FileSystem.hpp"
#include <cstddef>
#include "resources/Mesh.hpp"
#include "rhi/Device.hpp"

namespace DotObjViewer
{
    PipelineSet::PipelineSet( Device& device )
        : m_device( device )
    {
    }

    VertexInputLayout PipelineSet::GetVertexLayout()
    {
        VertexInputLayout layout;
        layout.stride     = sizeof( Vertex );
        layout.attributes = { { 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>( offsetof( Vertex, position ) ) },
                              { 1, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>( offsetof( Vertex, normal ) ) },
                              { 2, VK_FORMAT_R32G32B32_SFLOAT, static_cast<uint32_t>( offsetof( Vertex, color ) ) } };
        return layout;
    }

    Result PipelineSet::Init( VkFormat colorFormat, VkFormat depthFormat )
    {
        Ref<Shader> vertexShader   = m_device.CreateShader( FileSystem::GetPath( "shaders/mesh.vert" ).string() );
        Ref<Shader> fragmentShader = m_device.CreateShader( FileSystem::GetPath( "shaders/mesh.frag" ).string() );
        if( !vertexShader || !fragmentShader )
        {
            return Result::FAIL;
        }

        // One layout so the camera/light set binds to either pipeline
        m_layout = m_device.CreatePipelineLayout( { vertexShader, fragmentShader } );
        if( !m_layout )
        {
            return Result::FAIL;
        }

        GraphicsPipelineDesc desc;
        desc.vertexShader           = vertexShader;
        desc.fragmentShader         = fragmentShader;
        desc.layout                 = m_layout;
        desc.vertexLayout           = GetVertexLayout();
        desc.topology               = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        desc.polygonMode            = VK_POLYGON_MODE_FILL;
        desc.cullMode               = VK_CULL_MODE_BACK_BIT;
        desc.frontFace              = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        desc.depthTestEnable        = true;
        desc.depthWriteEnable       = true;
        desc.depthCompareOp         = VK_COMPARE_OP_LESS;
        desc.colorAttachmentFormats = { colorFormat };
        desc.depthAttachmentFormat  = depthFormat;

        m_solid = m_device.CreateGraphicsPipeline( desc );
        if( !m_solid )
        {
            return Result::FAIL;
        }

        if( m_device.GetFeatures().fillModeNonSolid )
        {
            // Same depth state as solid so edges stay occluded by nearer geometry
            desc.polygonMode = VK_POLYGON_MODE_LINE;
            desc.cullMode    = VK_CULL_MODE_NONE;
            m_wireframe      = m_device.CreateGraphicsPipeline( desc );
            if( !m_wireframe )
            {
                DOV_CORE_WARN( "Wireframe pipeline could not be built, wireframe mode will render solid." );
            }
        }
        else
        {
            DOV_CORE_WARN( "Device does not support fillModeNonSolid, wireframe mode will render solid." );
        }

        DOV_CORE_INFO( "Mesh pipelines ready (wireframe: {})", SupportsWireframe() );
        return Result::SUCCESS;
    }

    const Ref<GraphicsPipeline>& PipelineSet::Select( bool_t wireframe ) const
    {
        return ResolveWireframe( wireframe, SupportsWireframe() ) ? m_wireframe : m_solid;
    }
} // namespace DotObjViewer
