#pragma once
#include "core/Base.hpp"
#include <vector>
#include <volk.h>

namespace DotObjViewer
{
    class GraphicsPipeline;
    class Buffer;

    struct RenderingAttachmentInfo
    {
        VkImageView         imageView  = VK_NULL_HANDLE;
        VkAttachmentLoadOp  loadOp     = VK_ATTACHMENT_LOAD_OP_CLEAR;
        VkAttachmentStoreOp storeOp    = VK_ATTACHMENT_STORE_OP_STORE;
        VkClearValue        clearValue = { { { 0.0f, 0.0f, 0.0f, 1.0f } } };
        VkImageLayout       layout     = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    };

    struct RenderingInfo
    {
        VkRect2D                             renderArea;
        std::vector<RenderingAttachmentInfo> colorAttachments;
        bool                                 useDepth = false;
        RenderingAttachmentInfo              depthAttachment;
    };

    /**
     * @brief Primary command buffer recorded with dynamic rendering.
     * Frees itself back to its pool on destruction.
     */
    class CommandBuffer
    {
    public:
        CommandBuffer( VkDevice device, const VolkDeviceTable* api, VkCommandPool pool, VkCommandBuffer buffer );
        ~CommandBuffer();

        // --- Lifecycle ---
        Result Begin( VkCommandBufferUsageFlags flags = 0 );
        Result End();

        // --- Dynamic Rendering ---
        void BeginRendering( const RenderingInfo& info );
        void EndRendering();

        // --- State Setup ---
        void SetViewport( float x, float y, float width, float height, float minDepth = 0.0f, float maxDepth = 1.0f );
        void SetScissor( int32_t x, int32_t y, uint32_t width, uint32_t height );

        // --- Pipelines & Binding ---
        void BindGraphicsPipeline( const GraphicsPipeline& pipeline );
        void BindDescriptorSets( VkPipelineBindPoint bindPoint, VkPipelineLayout layout, uint32_t firstSet,
                                 const std::vector<VkDescriptorSet>& sets );
        void BindVertexBuffer( const Buffer& buffer, VkDeviceSize offset = 0 );
        void BindIndexBuffer( const Buffer& buffer, VkDeviceSize offset, VkIndexType indexType );

        // --- Draw ---
        void DrawIndexed( uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex, int32_t vertexOffset, uint32_t firstInstance );

        // --- Transfer ---
        void CopyBuffer( const Buffer& src, const Buffer& dst, VkDeviceSize size, VkDeviceSize srcOffset = 0, VkDeviceSize dstOffset = 0 );

        // --- Synchronization ---
        void PipelineBarrier( VkPipelineStageFlags srcStage, VkPipelineStageFlags dstStage, VkDependencyFlags dependencyFlags,
                              const std::vector<VkMemoryBarrier>& memoryBarriers, const std::vector<VkBufferMemoryBarrier>& bufferBarriers,
                              const std::vector<VkImageMemoryBarrier>& imageBarriers );

        void TransitionImageLayout( VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout,
                                    VkImageAspectFlags aspectMask = VK_IMAGE_ASPECT_COLOR_BIT );

        VkCommandBuffer GetHandle() const { return m_commandBuffer; }

    public:
        // --- Disable Copying (RAII) ---
        CommandBuffer( const CommandBuffer& )            = delete;
        CommandBuffer& operator=( const CommandBuffer& ) = delete;

    private:
        VkDevice               m_device;
        const VolkDeviceTable* m_api;
        VkCommandPool          m_pool;
        VkCommandBuffer        m_commandBuffer;
    };
} // namespace DotObjViewer
