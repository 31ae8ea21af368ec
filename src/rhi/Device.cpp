#include "rhi/Device.hpp"

#include "rhi/RHI.hpp"

namespace DotObjViewer
{
    Device::Device( VkPhysicalDevice physicalDevice )
        : m_physicalDevice( physicalDevice )
    {
    }

    Device::~Device()
    {
        Shutdown();
    }

    Result Device::Init( DeviceDesc desc )
    {
        m_desc = desc;

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties( m_physicalDevice, &props );
        m_name = props.deviceName;

        if( props.apiVersion < VK_API_VERSION_1_3 )
        {
            DOV_CORE_ERROR( "{} only supports Vulkan {}.{}, 1.3 is required.", m_name, VK_API_VERSION_MAJOR( props.apiVersion ),
                            VK_API_VERSION_MINOR( props.apiVersion ) );
            return Result::FAIL;
        }

        int32_t graphicsFamily = FindGraphicsQueueFamily( m_physicalDevice );
        if( graphicsFamily < 0 )
        {
            DOV_CORE_ERROR( "No graphics queue family on {}!", m_name );
            return Result::FAIL;
        }

        // Probe optional features once, the renderer degrades on what is missing
        VkPhysicalDeviceFeatures supported = {};
        vkGetPhysicalDeviceFeatures( m_physicalDevice, &supported );
        m_features.fillModeNonSolid = supported.fillModeNonSolid == VK_TRUE;

        float                   queuePriority   = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo = { VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
        queueCreateInfo.queueFamilyIndex        = static_cast<uint32_t>( graphicsFamily );
        queueCreateInfo.queueCount              = 1;
        queueCreateInfo.pQueuePriorities        = &queuePriority;

        VkPhysicalDeviceFeatures deviceFeatures = {};
        deviceFeatures.fillModeNonSolid         = m_features.fillModeNonSolid ? VK_TRUE : VK_FALSE;

        VkPhysicalDeviceVulkan12Features features12 = { VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES };
        features12.timelineSemaphore                = VK_TRUE;

        VkPhysicalDeviceVulkan13Features features13 = { VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES };
        features13.pNext                            = &features12;
        features13.synchronization2                 = VK_TRUE;
        features13.dynamicRendering                 = VK_TRUE;

        VkPhysicalDeviceFeatures2 deviceFeatures2 = { VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2 };
        deviceFeatures2.features                  = deviceFeatures;
        deviceFeatures2.pNext                     = &features13;

        std::vector<const char*> extensions;
        if( !m_desc.headless )
        {
            extensions.push_back( VK_KHR_SWAPCHAIN_EXTENSION_NAME );
        }

        VkDeviceCreateInfo createInfo      = { VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
        createInfo.pNext                   = &deviceFeatures2;
        createInfo.queueCreateInfoCount    = 1;
        createInfo.pQueueCreateInfos       = &queueCreateInfo;
        createInfo.pEnabledFeatures        = nullptr;
        createInfo.enabledExtensionCount   = static_cast<uint32_t>( extensions.size() );
        createInfo.ppEnabledExtensionNames = extensions.data();

        VkResult result = vkCreateDevice( m_physicalDevice, &createInfo, nullptr, &m_device );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create logical device on {}! Error: {}", m_name, ( int )result );
            m_device = VK_NULL_HANDLE;
            return Result::FAIL;
        }

        volkLoadDeviceTable( &m_api, m_device );

        m_graphicsQueue = CreateRef<Queue>( m_device, m_api, static_cast<uint32_t>( graphicsFamily ) );
        if( !m_graphicsQueue->IsValid() )
        {
            return Result::FAIL;
        }

        VkCommandPoolCreateInfo poolInfo = { VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO };
        poolInfo.queueFamilyIndex        = static_cast<uint32_t>( graphicsFamily );
        poolInfo.flags                   = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        if( m_api.vkCreateCommandPool( m_device, &poolInfo, nullptr, &m_commandPool ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create command pool!" );
            m_commandPool = VK_NULL_HANDLE;
            return Result::FAIL;
        }

        if( InitAllocator() != Result::SUCCESS )
        {
            return Result::FAIL;
        }

        m_descriptorAllocator = CreateScope<DescriptorAllocator>( m_device, &m_api );

        DOV_CORE_INFO( "Logical device initialized on {} (graphics family {}, fillModeNonSolid: {})", m_name, graphicsFamily,
                       m_features.fillModeNonSolid );

        return Result::SUCCESS;
    }

    Result Device::InitAllocator()
    {
        // VMA_STATIC_VULKAN_FUNCTIONS is 0, every entry point comes from volk
        VmaVulkanFunctions vmaVulkanFunctions                      = {};
        vmaVulkanFunctions.vkGetInstanceProcAddr                   = vkGetInstanceProcAddr;
        vmaVulkanFunctions.vkGetDeviceProcAddr                     = vkGetDeviceProcAddr;
        vmaVulkanFunctions.vkGetPhysicalDeviceProperties           = vkGetPhysicalDeviceProperties;
        vmaVulkanFunctions.vkGetPhysicalDeviceMemoryProperties     = vkGetPhysicalDeviceMemoryProperties;
        vmaVulkanFunctions.vkGetPhysicalDeviceMemoryProperties2KHR = vkGetPhysicalDeviceMemoryProperties2;

        vmaVulkanFunctions.vkAllocateMemory               = m_api.vkAllocateMemory;
        vmaVulkanFunctions.vkFreeMemory                   = m_api.vkFreeMemory;
        vmaVulkanFunctions.vkMapMemory                    = m_api.vkMapMemory;
        vmaVulkanFunctions.vkUnmapMemory                  = m_api.vkUnmapMemory;
        vmaVulkanFunctions.vkFlushMappedMemoryRanges      = m_api.vkFlushMappedMemoryRanges;
        vmaVulkanFunctions.vkInvalidateMappedMemoryRanges = m_api.vkInvalidateMappedMemoryRanges;

        vmaVulkanFunctions.vkBindBufferMemory            = m_api.vkBindBufferMemory;
        vmaVulkanFunctions.vkBindImageMemory             = m_api.vkBindImageMemory;
        vmaVulkanFunctions.vkGetBufferMemoryRequirements = m_api.vkGetBufferMemoryRequirements;
        vmaVulkanFunctions.vkGetImageMemoryRequirements  = m_api.vkGetImageMemoryRequirements;

        vmaVulkanFunctions.vkCreateBuffer  = m_api.vkCreateBuffer;
        vmaVulkanFunctions.vkDestroyBuffer = m_api.vkDestroyBuffer;
        vmaVulkanFunctions.vkCreateImage   = m_api.vkCreateImage;
        vmaVulkanFunctions.vkDestroyImage  = m_api.vkDestroyImage;
        vmaVulkanFunctions.vkCmdCopyBuffer = m_api.vkCmdCopyBuffer;

        vmaVulkanFunctions.vkGetBufferMemoryRequirements2KHR = m_api.vkGetBufferMemoryRequirements2;
        vmaVulkanFunctions.vkGetImageMemoryRequirements2KHR  = m_api.vkGetImageMemoryRequirements2;
        vmaVulkanFunctions.vkBindBufferMemory2KHR            = m_api.vkBindBufferMemory2;
        vmaVulkanFunctions.vkBindImageMemory2KHR             = m_api.vkBindImageMemory2;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.physicalDevice         = m_physicalDevice;
        allocatorInfo.device                 = m_device;
        allocatorInfo.instance               = RHI::GetInstance();
        allocatorInfo.vulkanApiVersion       = VK_API_VERSION_1_3;
        allocatorInfo.pVulkanFunctions       = &vmaVulkanFunctions;

        if( vmaCreateAllocator( &allocatorInfo, &m_allocator ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create VMA allocator!" );
            m_allocator = VK_NULL_HANDLE;
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    void Device::Shutdown()
    {
        if( m_device == VK_NULL_HANDLE )
            return;

        m_api.vkDeviceWaitIdle( m_device );

        if( m_descriptorAllocator )
        {
            m_descriptorAllocator->Shutdown();
            m_descriptorAllocator.reset();
        }

        if( m_commandPool != VK_NULL_HANDLE )
        {
            m_api.vkDestroyCommandPool( m_device, m_commandPool, nullptr );
            m_commandPool = VK_NULL_HANDLE;
        }

        m_graphicsQueue.reset();

        if( m_allocator != VK_NULL_HANDLE )
        {
            vmaDestroyAllocator( m_allocator );
            m_allocator = VK_NULL_HANDLE;
        }

        m_api.vkDestroyDevice( m_device, nullptr );
        m_device = VK_NULL_HANDLE;
        DOV_CORE_INFO( "Logical device on {} destroyed.", m_name );
    }

    Ref<CommandBuffer> Device::CreateCommandBuffer()
    {
        VkCommandBufferAllocateInfo allocInfo = { VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
        allocInfo.commandPool                 = m_commandPool;
        allocInfo.level                       = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount          = 1;

        VkCommandBuffer cmdBuffer = VK_NULL_HANDLE;
        if( m_api.vkAllocateCommandBuffers( m_device, &allocInfo, &cmdBuffer ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to allocate command buffer!" );
            return nullptr;
        }

        return CreateRef<CommandBuffer>( m_device, &m_api, m_commandPool, cmdBuffer );
    }

    Ref<Buffer> Device::CreateBuffer( const BufferDesc& desc )
    {
        auto buffer = CreateRef<Buffer>( m_allocator, m_device, &m_api );
        if( buffer->Create( desc ) != Result::SUCCESS )
        {
            DOV_CORE_CRITICAL( "Failed to create buffer of {} bytes!", desc.size );
            return nullptr;
        }
        return buffer;
    }

    Ref<Texture> Device::CreateTexture( const TextureDesc& desc )
    {
        auto texture = CreateRef<Texture>( m_allocator, m_device, &m_api );
        if( texture->Create( desc ) != Result::SUCCESS )
        {
            DOV_CORE_CRITICAL( "Failed to create texture {}x{}!", desc.width, desc.height );
            return nullptr;
        }
        return texture;
    }

    Ref<Shader> Device::CreateShader( const std::string& filepath )
    {
        auto shader = CreateRef<Shader>( m_device, &m_api, filepath );
        if( !shader->IsValid() )
        {
            DOV_CORE_CRITICAL( "Failed to create shader '{}'!", filepath );
            return nullptr;
        }
        shader->LogResources();
        return shader;
    }

    Ref<PipelineLayout> Device::CreatePipelineLayout( const std::vector<Ref<Shader>>& shaders )
    {
        auto layout = CreateRef<PipelineLayout>( m_device, &m_api, shaders );
        if( !layout->IsValid() )
        {
            DOV_CORE_CRITICAL( "Failed to create pipeline layout!" );
            return nullptr;
        }
        return layout;
    }

    Ref<GraphicsPipeline> Device::CreateGraphicsPipeline( const GraphicsPipelineDesc& desc )
    {
        auto pipeline = CreateRef<GraphicsPipeline>( m_device, &m_api, desc );
        if( !pipeline->IsValid() )
        {
            DOV_CORE_CRITICAL( "Failed to create graphics pipeline!" );
            return nullptr;
        }
        return pipeline;
    }

    Ref<Swapchain> Device::CreateSwapchain( const SwapchainDesc& desc )
    {
        if( m_desc.headless )
        {
            DOV_CORE_ERROR( "Cannot create a swapchain on a headless device!" );
            return nullptr;
        }

        auto swapchain = CreateRef<Swapchain>( m_device, m_physicalDevice, RHI::GetInstance(), m_graphicsQueue->GetHandle(),
                                               m_graphicsQueue->GetFamilyIndex(), &m_api, desc );
        if( swapchain->Create() != Result::SUCCESS )
        {
            DOV_CORE_CRITICAL( "Failed to create swapchain!" );
            return nullptr;
        }
        return swapchain;
    }

    Result Device::AllocateDescriptor( VkDescriptorSetLayout layout, VkDescriptorSet& outSet )
    {
        if( !m_descriptorAllocator )
        {
            return Result::FAIL;
        }
        return m_descriptorAllocator->Allocate( layout, outSet );
    }

    VkDescriptorPool Device::CreateDescriptorPool( uint32_t maxSets, const std::vector<VkDescriptorPoolSize>& poolSizes,
                                                   VkDescriptorPoolCreateFlags flags )
    {
        VkDescriptorPoolCreateInfo poolInfo = { VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO };
        poolInfo.flags                      = flags;
        poolInfo.maxSets                    = maxSets;
        poolInfo.poolSizeCount              = static_cast<uint32_t>( poolSizes.size() );
        poolInfo.pPoolSizes                 = poolSizes.data();

        VkDescriptorPool pool = VK_NULL_HANDLE;
        if( m_api.vkCreateDescriptorPool( m_device, &poolInfo, nullptr, &pool ) != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create descriptor pool!" );
            return VK_NULL_HANDLE;
        }
        return pool;
    }

    void Device::DestroyDescriptorPool( VkDescriptorPool pool )
    {
        if( pool != VK_NULL_HANDLE )
        {
            m_api.vkDestroyDescriptorPool( m_device, pool, nullptr );
        }
    }

    void Device::UpdateDescriptorSets( const std::vector<VkWriteDescriptorSet>& writes )
    {
        if( writes.empty() )
            return;
        m_api.vkUpdateDescriptorSets( m_device, static_cast<uint32_t>( writes.size() ), writes.data(), 0, nullptr );
    }

    Result Device::WaitForQueue( const Ref<Queue>& queue, uint64_t waitValue, uint64_t timeout )
    {
        if( !queue )
            return Result::FAIL;

        VkSemaphore timelineSem = queue->GetTimelineSemaphore();

        VkSemaphoreWaitInfo waitInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO };
        waitInfo.semaphoreCount      = 1;
        waitInfo.pSemaphores         = &timelineSem;
        waitInfo.pValues             = &waitValue;

        VkResult result = m_api.vkWaitSemaphores( m_device, &waitInfo, timeout );

        if( result == VK_SUCCESS )
            return Result::SUCCESS;
        if( result == VK_TIMEOUT )
            return Result::TIMEOUT;

        DOV_CORE_ERROR( "WaitForQueue failed for value {}! Error: {}", waitValue, ( int )result );
        return result == VK_ERROR_OUT_OF_DEVICE_MEMORY || result == VK_ERROR_OUT_OF_HOST_MEMORY ? Result::OUT_OF_MEMORY : Result::FAIL;
    }

    void Device::WaitIdle()
    {
        if( m_device != VK_NULL_HANDLE )
        {
            VkResult result = m_api.vkDeviceWaitIdle( m_device );
            if( result != VK_SUCCESS )
            {
                DOV_CORE_ERROR( "vkDeviceWaitIdle failed! Error: {}", ( int )result );
            }
        }
    }

    void Device::QueryMemoryBudget( uint64_t& outUsedBytes, uint64_t& outBudgetBytes ) const
    {
        outUsedBytes   = 0;
        outBudgetBytes = 0;
        if( m_allocator == VK_NULL_HANDLE )
            return;

        const VkPhysicalDeviceMemoryProperties* memProps = nullptr;
        vmaGetMemoryProperties( m_allocator, &memProps );

        std::vector<VmaBudget> budgets( memProps->memoryHeapCount );
        vmaGetHeapBudgets( m_allocator, budgets.data() );

        for( uint32_t i = 0; i < memProps->memoryHeapCount; ++i )
        {
            if( memProps->memoryHeaps[ i ].flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT )
            {
                outUsedBytes += budgets[ i ].usage;
                outBudgetBytes += budgets[ i ].budget;
            }
        }
    }

    int32_t Device::FindGraphicsQueueFamily( VkPhysicalDevice device )
    {
        uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties( device, &queueFamilyCount, nullptr );

        std::vector<VkQueueFamilyProperties> queueFamilies( queueFamilyCount );
        vkGetPhysicalDeviceQueueFamilyProperties( device, &queueFamilyCount, queueFamilies.data() );

        // Graphics families implicitly support transfer, which mesh uploads need
        for( uint32_t i = 0; i < queueFamilyCount; ++i )
        {
            if( queueFamilies[ i ].queueFlags & VK_QUEUE_GRAPHICS_BIT )
            {
                return static_cast<int32_t>( i );
            }
        }
        return -1;
    }
} // namespace DotObjViewer
