#include "rhi/CommandBuffer.hpp"

#include "rhi/Buffer.hpp"
#include "rhi/Pipeline.hpp"

namespace DotObjViewer
{
    CommandBuffer::CommandBuffer( VkDevice device, const VolkDeviceTable* api, VkCommandPool pool, VkCommandBuffer buffer )
        : m_device( device )
        , m_api( api )
        , m_pool( pool )
        , m_commandBuffer( buffer )
    {
    }

    CommandBuffer::~CommandBuffer()
    {
        if( m_commandBuffer != VK_NULL_HANDLE )
        {
            m_api->vkFreeCommandBuffers( m_device, m_pool, 1, &m_commandBuffer );
        }
    }

    Result CommandBuffer::Begin( VkCommandBufferUsageFlags flags )
    {
        // Pool is created with RESET_COMMAND_BUFFER, so begin implicitly resets
        VkCommandBufferBeginInfo beginInfo = { VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO };
        beginInfo.flags                    = flags;
        if( m_api->vkBeginCommandBuffer( m_commandBuffer, &beginInfo ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "vkBeginCommandBuffer failed!" );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    Result CommandBuffer::End()
    {
        VkResult result = m_api->vkEndCommandBuffer( m_commandBuffer );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "vkEndCommandBuffer failed! Error: {}", ( int )result );
            return result == VK_ERROR_OUT_OF_DEVICE_MEMORY || result == VK_ERROR_OUT_OF_HOST_MEMORY ? Result::OUT_OF_MEMORY : Result::FAIL;
        }
        return Result::SUCCESS;
    }

    void CommandBuffer::BeginRendering( const RenderingInfo& info )
    {
        std::vector<VkRenderingAttachmentInfo> colorAttachments;
        colorAttachments.reserve( info.colorAttachments.size() );
        for( const auto& att: info.colorAttachments )
        {
            VkRenderingAttachmentInfo vkAtt = { VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO };
            vkAtt.imageView                 = att.imageView;
            vkAtt.imageLayout               = att.layout;
            vkAtt.loadOp                    = att.loadOp;
            vkAtt.storeOp                   = att.storeOp;
            vkAtt.clearValue                = att.clearValue;
            colorAttachments.push_back( vkAtt );
        }

        VkRenderingInfo renderInfo      = { VK_STRUCTURE_TYPE_RENDERING_INFO };
        renderInfo.renderArea           = info.renderArea;
        renderInfo.layerCount           = 1;
        renderInfo.colorAttachmentCount = static_cast<uint32_t>( colorAttachments.size() );
        renderInfo.pColorAttachments    = colorAttachments.data();

        VkRenderingAttachmentInfo depthAtt = { VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO };
        if( info.useDepth )
        {
            depthAtt.imageView          = info.depthAttachment.imageView;
            depthAtt.imageLayout        = info.depthAttachment.layout;
            depthAtt.loadOp             = info.depthAttachment.loadOp;
            depthAtt.storeOp            = info.depthAttachment.storeOp;
            depthAtt.clearValue         = info.depthAttachment.clearValue;
            renderInfo.pDepthAttachment = &depthAtt;
        }

        m_api->vkCmdBeginRendering( m_commandBuffer, &renderInfo );
    }

    void CommandBuffer::EndRendering()
    {
        m_api->vkCmdEndRendering( m_commandBuffer );
    }

    void CommandBuffer::SetViewport( float x, float y, float width, float height, float minDepth, float maxDepth )
    {
        VkViewport viewport{};
        viewport.x        = x;
        viewport.y        = y;
        viewport.width    = width;
        viewport.height   = height;
        viewport.minDepth = minDepth;
        viewport.maxDepth = maxDepth;
        m_api->vkCmdSetViewport( m_commandBuffer, 0, 1, &viewport );
    }

    void CommandBuffer::SetScissor( int32_t x, int32_t y, uint32_t width, uint32_t height )
    {
        VkRect2D scissor{};
        scissor.offset = { x, y };
        scissor.extent = { width, height };
        m_api->vkCmdSetScissor( m_commandBuffer, 0, 1, &scissor );
    }

    void CommandBuffer::BindGraphicsPipeline( const GraphicsPipeline& pipeline )
    {
        m_api->vkCmdBindPipeline( m_commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.GetHandle() );
    }

    void CommandBuffer::BindDescriptorSets( VkPipelineBindPoint bindPoint, VkPipelineLayout layout, uint32_t firstSet,
                                            const std::vector<VkDescriptorSet>& sets )
    {
        if( !sets.empty() )
        {
            m_api->vkCmdBindDescriptorSets( m_commandBuffer, bindPoint, layout, firstSet, static_cast<uint32_t>( sets.size() ), sets.data(), 0,
                                            nullptr );
        }
    }

    void CommandBuffer::BindVertexBuffer( const Buffer& buffer, VkDeviceSize offset )
    {
        VkBuffer handle = buffer.GetHandle();
        m_api->vkCmdBindVertexBuffers( m_commandBuffer, 0, 1, &handle, &offset );
    }

    void CommandBuffer::BindIndexBuffer( const Buffer& buffer, VkDeviceSize offset, VkIndexType indexType )
    {
        m_api->vkCmdBindIndexBuffer( m_commandBuffer, buffer.GetHandle(), offset, indexType );
    }

    void CommandBuffer::DrawIndexed( uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex, int32_t vertexOffset, uint32_t firstInstance )
    {
        m_api->vkCmdDrawIndexed( m_commandBuffer, indexCount, instanceCount, firstIndex, vertexOffset, firstInstance );
    }

    void CommandBuffer::CopyBuffer( const Buffer& src, const Buffer& dst, VkDeviceSize size, VkDeviceSize srcOffset, VkDeviceSize dstOffset )
    {
        VkBufferCopy region = {};
        region.srcOffset    = srcOffset;
        region.dstOffset    = dstOffset;
        region.size         = size;
        m_api->vkCmdCopyBuffer( m_commandBuffer, src.GetHandle(), dst.GetHandle(), 1, &region );
    }

    void CommandBuffer::PipelineBarrier( VkPipelineStageFlags srcStage, VkPipelineStageFlags dstStage, VkDependencyFlags dependencyFlags,
                                         const std::vector<VkMemoryBarrier>& memoryBarriers, const std::vector<VkBufferMemoryBarrier>& bufferBarriers,
                                         const std::vector<VkImageMemoryBarrier>& imageBarriers )
    {
        m_api->vkCmdPipelineBarrier( m_commandBuffer, srcStage, dstStage, dependencyFlags, static_cast<uint32_t>( memoryBarriers.size() ),
                                     memoryBarriers.data(), static_cast<uint32_t>( bufferBarriers.size() ), bufferBarriers.data(),
                                     static_cast<uint32_t>( imageBarriers.size() ), imageBarriers.data() );
    }

    void CommandBuffer::TransitionImageLayout( VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout, VkImageAspectFlags aspectMask )
    {
        VkImageMemoryBarrier barrier            = { VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER };
        barrier.oldLayout                       = oldLayout;
        barrier.newLayout                       = newLayout;
        barrier.srcQueueFamilyIndex             = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex             = VK_QUEUE_FAMILY_IGNORED;
        barrier.image                           = image;
        barrier.subresourceRange.aspectMask     = aspectMask;
        barrier.subresourceRange.baseMipLevel   = 0;
        barrier.subresourceRange.levelCount     = 1;
        barrier.subresourceRange.baseArrayLayer = 0;
        barrier.subresourceRange.layerCount     = 1;

        VkPipelineStageFlags sourceStage      = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
        VkPipelineStageFlags destinationStage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;

        if( oldLayout == VK_IMAGE_LAYOUT_UNDEFINED && newLayout == VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL )
        {
            // Source stage matches the acquire semaphore wait stage
            barrier.srcAccessMask = 0;
            barrier.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
            sourceStage           = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
            destinationStage      = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        }
        else if( oldLayout == VK_IMAGE_LAYOUT_UNDEFINED && newLayout == VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL )
        {
            // Previous frame's depth writes must land before the clear
            barrier.srcAccessMask = VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
            barrier.dstAccessMask = VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
            sourceStage           = VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
            destinationStage      = VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
        }
        else if( oldLayout == VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL && newLayout == VK_IMAGE_LAYOUT_PRESENT_SRC_KHR )
        {
            barrier.srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
            barrier.dstAccessMask = 0;
            sourceStage           = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
            destinationStage      = VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT;
        }
        // General fallback
        else
        {
            barrier.srcAccessMask = VK_ACCESS_MEMORY_WRITE_BIT;
            barrier.dstAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
        }

        m_api->vkCmdPipelineBarrier( m_commandBuffer, sourceStage, destinationStage, 0, 0, nullptr, 0, nullptr, 1, &barrier );
    }
} // namespace DotObjViewer
