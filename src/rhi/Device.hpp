#pragma once
#include "core/Base.hpp"
#include "rhi/Buffer.hpp"
#include "rhi/CommandBuffer.hpp"
#include "rhi/DescriptorAllocator.hpp"
#include "rhi/Pipeline.hpp"
#include "rhi/Queue.hpp"
#include "rhi/Shader.hpp"
#include "rhi/Swapchain.hpp"
#include "rhi/Texture.hpp"
#include <string>
#include <volk.h>
#include <vk_mem_alloc.h>

namespace DotObjViewer
{
    struct DeviceDesc
    {
        bool_t headless = false;
    };

    // Optional rasterization features, probed once at device creation
    struct DeviceFeatures
    {
        bool_t fillModeNonSolid = false; // VK_POLYGON_MODE_LINE
    };

    /**
     * @brief Logical device with one graphics/present queue, a VMA allocator,
     * a command pool and a descriptor allocator.
     */
    class Device
    {
    public:
        Device( VkPhysicalDevice physicalDevice );
        ~Device();

        Result Init( DeviceDesc desc );
        void   Shutdown();

        // Factories return nullptr on failure, the reason is logged
        Ref<CommandBuffer>    CreateCommandBuffer();
        Ref<Buffer>           CreateBuffer( const BufferDesc& desc );
        Ref<Texture>          CreateTexture( const TextureDesc& desc );
        Ref<Shader>           CreateShader( const std::string& filepath );
        Ref<PipelineLayout>   CreatePipelineLayout( const std::vector<Ref<Shader>>& shaders );
        Ref<GraphicsPipeline> CreateGraphicsPipeline( const GraphicsPipelineDesc& desc );
        Ref<Swapchain>        CreateSwapchain( const SwapchainDesc& desc );

        Result AllocateDescriptor( VkDescriptorSetLayout layout, VkDescriptorSet& outSet );

        /**
         * @brief Creates a raw Vulkan Descriptor Pool.
         * Useful for middleware like ImGui that manages its own descriptor sets.
         */
        VkDescriptorPool CreateDescriptorPool( uint32_t maxSets, const std::vector<VkDescriptorPoolSize>& poolSizes,
                                               VkDescriptorPoolCreateFlags flags = 0 );
        void             DestroyDescriptorPool( VkDescriptorPool pool );

        // Wraps vkUpdateDescriptorSets
        void UpdateDescriptorSets( const std::vector<VkWriteDescriptorSet>& writes );

        /**
         * @brief Records, submits and waits for a one-off command buffer.
         * Blocks the calling thread until the GPU has finished it.
         */
        template<typename Fn>
        Result ImmediateSubmit( Fn&& record )
        {
            Ref<CommandBuffer> cmd = CreateCommandBuffer();
            if( !cmd )
                return Result::FAIL;

            Result res = cmd->Begin( VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT );
            if( res != Result::SUCCESS )
                return res;
            record( *cmd );
            res = cmd->End();
            if( res != Result::SUCCESS )
                return res;

            uint64_t signalValue = 0;
            res                  = m_graphicsQueue->Submit( cmd->GetHandle(), signalValue );
            if( res != Result::SUCCESS )
                return res;
            return WaitForQueue( m_graphicsQueue, signalValue );
        }

        /**
         * @brief Waits for a specific value on the queue's timeline semaphore.
         * @return Result::SUCCESS, Result::TIMEOUT, or Result::FAIL.
         */
        Result WaitForQueue( const Ref<Queue>& queue, uint64_t waitValue, uint64_t timeout = UINT64_MAX );

        /**
         * @brief Blocks until the GPU has finished all submitted work.
         * Call before destroying resources that may still be in use.
         */
        void WaitIdle();

        // Sums VMA heap budgets over device-local heaps
        void QueryMemoryBudget( uint64_t& outUsedBytes, uint64_t& outBudgetBytes ) const;

        Ref<Queue>             GetGraphicsQueue() const { return m_graphicsQueue; }
        const DeviceFeatures&  GetFeatures() const { return m_features; }
        const std::string&     GetName() const { return m_name; }
        VkDevice               GetHandle() const { return m_device; }
        VkPhysicalDevice       GetPhysicalDevice() const { return m_physicalDevice; }
        VmaAllocator           GetAllocator() const { return m_allocator; }

    private:
        static int32_t FindGraphicsQueueFamily( VkPhysicalDevice device );

        Result InitAllocator();

    private:
        VkPhysicalDevice m_physicalDevice;
        VkDevice         m_device      = VK_NULL_HANDLE;
        VmaAllocator     m_allocator   = VK_NULL_HANDLE;
        VkCommandPool    m_commandPool = VK_NULL_HANDLE;
        VolkDeviceTable  m_api         = {};
        DeviceDesc       m_desc;
        DeviceFeatures   m_features;
        std::string      m_name;

        Ref<Queue> m_graphicsQueue;

        Scope<DescriptorAllocator> m_descriptorAllocator;
    };
} // namespace DotObjViewer
