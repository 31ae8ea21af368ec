#include "renderer/DeviceContext.hpp"

#include "renderer/PipelineSet.hpp"

namespace DotObjViewer
{
    DeviceContext::DeviceContext( Ref<Device> device, void* windowHandle, uint32_t width, uint32_t height, bool vsync )
        : m_device( device )
        , m_windowHandle( windowHandle )
        , m_vsync( vsync )
    {
        m_surface.width  = width;
        m_surface.height = height;
    }

    DeviceContext::~DeviceContext()
    {
        Shutdown();
    }

    Result DeviceContext::Init()
    {
        SwapchainDesc swapDesc;
        swapDesc.windowHandle = m_windowHandle;
        swapDesc.width        = m_surface.width;
        swapDesc.height       = m_surface.height;
        swapDesc.vsync        = m_vsync;

        m_swapchain = m_device->CreateSwapchain( swapDesc );
        if( !m_swapchain )
        {
            return Result::FAIL;
        }

        // The presentation engine may clamp the requested size
        VkExtent2D extent = m_swapchain->GetExtent();
        m_surface.width   = extent.width;
        m_surface.height  = extent.height;
        m_surface.format  = m_swapchain->GetFormat();

        m_depthFormat = PipelineSet::DEPTH_FORMAT;
        Result res    = CreateDepthBuffer();
        if( res != Result::SUCCESS )
        {
            return res;
        }

        m_frameUniforms = m_device->CreateBuffer( { sizeof( FrameUniforms ), BufferType::UNIFORM } );
        m_lightUniforms = m_device->CreateBuffer( { sizeof( LightUniforms ), BufferType::UNIFORM } );
        m_frameCmd      = m_device->CreateCommandBuffer();
        if( !m_frameUniforms || !m_lightUniforms || !m_frameCmd )
        {
            return Result::OUT_OF_MEMORY;
        }

        DOV_CORE_INFO( "Device context ready: {}x{}, format {}", m_surface.width, m_surface.height, ( int )m_surface.format );
        return Result::SUCCESS;
    }

    void DeviceContext::Shutdown()
    {
        if( !m_device )
            return;

        m_device->WaitIdle();

        m_bindings.reset();
        m_frameUniforms.reset();
        m_lightUniforms.reset();
        m_frameCmd.reset();
        m_depth.reset();
        m_swapchain.reset();
        m_device.reset();
    }

    Result DeviceContext::CreateBindings( const PipelineSet& pipelines )
    {
        m_bindings = CreateScope<BindingGroup>( *m_device, pipelines.GetLayout(), 0 );
        if( !m_bindings->IsValid() )
        {
            DOV_CORE_ERROR( "Failed to allocate the frame descriptor set!" );
            return Result::FAIL;
        }

        Result res = m_bindings->Set( "camera", *m_frameUniforms );
        if( res != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Shader has no 'camera' uniform block!" );
            return res;
        }

        // Lighting is optional in the shaders
        if( m_bindings->Set( "light", *m_lightUniforms ) != Result::SUCCESS )
        {
            DOV_CORE_WARN( "Shader has no 'light' uniform block, rendering unlit." );
        }

        m_bindings->Build();
        return Result::SUCCESS;
    }

    Result DeviceContext::CreateDepthBuffer()
    {
        TextureDesc depthDesc = {};
        depthDesc.width       = m_surface.width;
        depthDesc.height      = m_surface.height;
        depthDesc.format      = m_depthFormat;
        depthDesc.usage       = TextureUsage::DEPTH_ATTACHMENT;

        m_depth = m_device->CreateTexture( depthDesc );
        return m_depth ? Result::SUCCESS : Result::OUT_OF_MEMORY;
    }

    bool_t DeviceContext::Resize( uint32_t width, uint32_t height )
    {
        if( width == 0 || height == 0 )
        {
            DOV_CORE_TRACE( "Ignoring zero-area resize ({}x{})", width, height );
            return false;
        }

        if( !m_surface.NeedsResize( width, height ) )
            return false;

        // Size-dependent resources may still be in use by the last frame
        m_device->WaitIdle();
        if( m_swapchain->Recreate( width, height ) != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to reconfigure the surface at {}x{}", width, height );
            return false;
        }

        VkExtent2D extent = m_swapchain->GetExtent();
        m_surface.width   = extent.width;
        m_surface.height  = extent.height;
        m_surface.format  = m_swapchain->GetFormat();

        if( CreateDepthBuffer() != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to recreate the depth buffer at {}x{}", m_surface.width, m_surface.height );
            return false;
        }

        DOV_CORE_TRACE( "Surface reconfigured to {}x{}", m_surface.width, m_surface.height );
        return true;
    }

    Result DeviceContext::Reconfigure( SurfaceStatus status )
    {
        m_device->WaitIdle();

        Result res = status == SurfaceStatus::LOST ? m_swapchain->RecreateSurface()
                                                   : m_swapchain->Recreate( m_surface.width, m_surface.height );
        if( res != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Surface reconfiguration failed ({}), retrying next frame.", toString( res ) );
            return res;
        }

        VkExtent2D extent = m_swapchain->GetExtent();
        if( extent.width != m_surface.width || extent.height != m_surface.height )
        {
            m_surface.width  = extent.width;
            m_surface.height = extent.height;
            res              = CreateDepthBuffer();
        }
        m_surface.format = m_swapchain->GetFormat();
        return res;
    }

    void DeviceContext::WriteUniforms( const FrameUniforms& frame, const LightUniforms& light )
    {
        if( m_frameUniforms->Write( &frame, sizeof( FrameUniforms ) ) != Result::SUCCESS ||
            m_lightUniforms->Write( &light, sizeof( LightUniforms ) ) != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to write frame uniforms, the frame shows stale camera data." );
        }
    }

    Result DeviceContext::WaitForLastFrame()
    {
        if( m_lastSubmittedValue == 0 )
            return Result::SUCCESS;
        return m_device->WaitForQueue( m_device->GetGraphicsQueue(), m_lastSubmittedValue );
    }
} // namespace DotObjViewer
