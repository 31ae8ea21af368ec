#include "renderer/FrameCompositor.hpp"

#include "renderer/OverlayLayer.hpp"

namespace DotObjViewer
{
    FrameCompositor::FrameCompositor( DeviceContext& context, const PipelineSet& pipelines )
        : m_context( context )
        , m_pipelines( pipelines )
    {
    }

    Mesh FrameCompositor::CreatePlaceholderMesh()
    {
        const glm::vec3 normal( 0.0f, 0.0f, 1.0f );

        Mesh mesh;
        mesh.vertices  = { { glm::vec3( 0.0f, 0.5f, 0.0f ), normal, glm::vec3( 1.0f, 0.0f, 0.0f ) },
                           { glm::vec3( -0.5f, -0.5f, 0.0f ), normal, glm::vec3( 0.0f, 1.0f, 0.0f ) },
                           { glm::vec3( 0.5f, -0.5f, 0.0f ), normal, glm::vec3( 0.0f, 0.0f, 1.0f ) } };
        mesh.indices   = { 0, 1, 2 };
        mesh.boundsMin = glm::vec3( -0.5f, -0.5f, 0.0f );
        mesh.boundsMax = glm::vec3( 0.5f, 0.5f, 0.0f );
        return mesh;
    }

    Result FrameCompositor::Init()
    {
        Result res = m_placeholder.Upload( m_context.GetDevice(), CreatePlaceholderMesh() );
        if( res != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to upload the placeholder triangle!" );
        }
        return res;
    }

    FrameUniforms FrameCompositor::BuildFrameUniforms( const Camera& camera )
    {
        FrameUniforms uniforms;
        uniforms.viewProjection = camera.GetViewProjection();
        uniforms.view           = camera.GetView();
        uniforms.cameraPosition = glm::vec4( camera.GetPosition(), 1.0f );
        return uniforms;
    }

    LightUniforms FrameCompositor::BuildLightUniforms( const Camera& camera )
    {
        LightUniforms light;
        light.position = glm::vec4( camera.GetPosition(), 1.0f );
        light.color    = glm::vec4( 1.0f, 1.0f, 1.0f, 1.0f );
        return light;
    }

    SurfaceStatus FrameCompositor::RenderFrame( const Camera& camera, const MeshBuffer* mesh, const RenderSettings& settings,
                                                OverlayLayer* overlay )
    {
        // --- CPU WAIT FOR GPU (Timeline Semaphore) ---
        // One frame in flight: the command buffer and uniforms are reused every frame
        Result waitRes = m_context.WaitForLastFrame();
        if( waitRes != Result::SUCCESS )
        {
            DOV_CORE_ERROR( "Waiting for the previous frame failed: {}", toString( waitRes ) );
            return waitRes == Result::OUT_OF_MEMORY ? SurfaceStatus::OUT_OF_MEMORY : SurfaceStatus::FAILED;
        }

        Swapchain&  swapchain  = m_context.GetSwapchain();
        uint32_t    imageIndex = 0;
        VkSemaphore available  = VK_NULL_HANDLE;

        SurfaceStatus status = swapchain.AcquireNextImage( imageIndex, available );
        if( status != SurfaceStatus::READY && status != SurfaceStatus::SUBOPTIMAL )
        {
            return status;
        }

        // Recomputed every frame, even for a still camera
        m_context.WriteUniforms( BuildFrameUniforms( camera ), BuildLightUniforms( camera ) );

        CommandBuffer& cmd = m_context.GetFrameCommandBuffer();
        if( cmd.Begin( VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT ) != Result::SUCCESS )
        {
            return SurfaceStatus::FAILED;
        }

        const MeshBuffer& drawMesh = ( mesh && mesh->IsLoaded() ) ? *mesh : m_placeholder;
        RecordScenePass( cmd, imageIndex, drawMesh, settings );

        if( overlay )
        {
            RecordOverlayPass( cmd, imageIndex, *overlay );
        }

        // Hand the image over to the presentation engine
        cmd.TransitionImageLayout( swapchain.GetImage( imageIndex ), VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR );

        if( cmd.End() != Result::SUCCESS )
        {
            return SurfaceStatus::FAILED;
        }

        SubmitInfo submitInfo = {};
        submitInfo.commandBuffers.push_back( cmd.GetHandle() );

        QueueWaitInfo waitInfo = {};
        waitInfo.semaphore     = available;
        waitInfo.value         = 0; // Binary semaphore
        waitInfo.stageMask     = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;
        submitInfo.waitSemaphores.push_back( waitInfo );

        QueueSignalInfo signalInfo = {};
        signalInfo.semaphore       = swapchain.GetRenderFinishedSemaphore( imageIndex );
        signalInfo.value           = 0; // Binary
        signalInfo.stageMask       = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        submitInfo.signalSemaphores.push_back( signalInfo );

        uint64_t signalValue = 0;
        Result   submitRes   = m_context.GetDevice().GetGraphicsQueue()->Submit( submitInfo, &signalValue );
        if( submitRes != Result::SUCCESS )
        {
            return submitRes == Result::OUT_OF_MEMORY ? SurfaceStatus::OUT_OF_MEMORY : SurfaceStatus::FAILED;
        }
        m_context.SetLastSubmittedValue( signalValue );

        return swapchain.Present( signalInfo.semaphore );
    }

    void FrameCompositor::RecordScenePass( CommandBuffer& cmd, uint32_t imageIndex, const MeshBuffer& mesh, const RenderSettings& settings )
    {
        Swapchain&     swapchain = m_context.GetSwapchain();
        const Texture& depth     = m_context.GetDepthTexture();
        VkExtent2D     extent    = swapchain.GetExtent();

        // Both attachments are cleared, their previous contents can be discarded
        cmd.TransitionImageLayout( swapchain.GetImage( imageIndex ), VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL );
        cmd.TransitionImageLayout( depth.GetImage(), VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL, depth.GetAspect() );

        RenderingAttachmentInfo colorAtt;
        colorAtt.imageView  = swapchain.GetImageView( imageIndex );
        colorAtt.layout     = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        colorAtt.loadOp     = VK_ATTACHMENT_LOAD_OP_CLEAR;
        colorAtt.storeOp    = VK_ATTACHMENT_STORE_OP_STORE;
        colorAtt.clearValue = { { { CLEAR_COLOR.r, CLEAR_COLOR.g, CLEAR_COLOR.b, CLEAR_COLOR.a } } };

        RenderingAttachmentInfo depthAtt;
        depthAtt.imageView               = depth.GetView();
        depthAtt.layout                  = VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL;
        depthAtt.loadOp                  = VK_ATTACHMENT_LOAD_OP_CLEAR;
        depthAtt.storeOp                 = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        depthAtt.clearValue.depthStencil = { 1.0f, 0 };

        RenderingInfo renderInfo     = {};
        renderInfo.renderArea.extent = extent;
        renderInfo.renderArea.offset = { 0, 0 };
        renderInfo.colorAttachments.push_back( colorAtt );
        renderInfo.depthAttachment = depthAtt;
        renderInfo.useDepth        = true;

        cmd.BeginRendering( renderInfo );

        cmd.SetViewport( 0.0f, 0.0f, static_cast<float>( extent.width ), static_cast<float>( extent.height ), 0.0f, 1.0f );
        cmd.SetScissor( 0, 0, extent.width, extent.height );

        const GraphicsPipeline& pipeline = *m_pipelines.Select( settings.wireframe );
        cmd.BindGraphicsPipeline( pipeline );
        cmd.BindDescriptorSets( VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.GetLayout(), 0, { m_context.GetBindings().GetHandle() } );

        cmd.BindVertexBuffer( *mesh.GetVertexBuffer() );
        cmd.BindIndexBuffer( *mesh.GetIndexBuffer(), 0, VK_INDEX_TYPE_UINT32 );
        cmd.DrawIndexed( mesh.GetIndexCount(), 1, 0, 0, 0 );

        cmd.EndRendering();
    }

    void FrameCompositor::RecordOverlayPass( CommandBuffer& cmd, uint32_t imageIndex, OverlayLayer& overlay )
    {
        Swapchain& swapchain = m_context.GetSwapchain();

        // The 3D pass ended before this barrier, the overlay reads its output through LOAD
        VkImageMemoryBarrier barrier            = { VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER };
        barrier.srcAccessMask                   = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
        barrier.dstAccessMask                   = VK_ACCESS_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
        barrier.oldLayout                       = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        barrier.newLayout                       = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        barrier.srcQueueFamilyIndex             = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex             = VK_QUEUE_FAMILY_IGNORED;
        barrier.image                           = swapchain.GetImage( imageIndex );
        barrier.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
        barrier.subresourceRange.levelCount     = 1;
        barrier.subresourceRange.layerCount     = 1;
        cmd.PipelineBarrier( VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT, VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT, 0, {}, {}, { barrier } );

        RenderingAttachmentInfo colorAtt;
        colorAtt.imageView = swapchain.GetImageView( imageIndex );
        colorAtt.layout    = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        colorAtt.loadOp    = VK_ATTACHMENT_LOAD_OP_LOAD;
        colorAtt.storeOp   = VK_ATTACHMENT_STORE_OP_STORE;

        RenderingInfo renderInfo     = {};
        renderInfo.renderArea.extent = swapchain.GetExtent();
        renderInfo.renderArea.offset = { 0, 0 };
        renderInfo.colorAttachments.push_back( colorAtt );
        renderInfo.useDepth = false;

        cmd.BeginRendering( renderInfo );
        overlay.Render( cmd );
        cmd.EndRendering();
    }
} // namespace DotObjViewer
