#include "rhi/DescriptorAllocator.hpp"

namespace DotObjViewer
{
    // Camera and light blocks are the only descriptors, a pool rarely fills up
    static constexpr uint32_t SETS_PER_POOL     = 16;
    static constexpr uint32_t UNIFORMS_PER_POOL = SETS_PER_POOL * 2;

    DescriptorAllocator::DescriptorAllocator( VkDevice device, const VolkDeviceTable* api )
        : m_device( device )
        , m_api( api )
    {
        DOV_CORE_ASSERT( m_api, "VolkDeviceTable is null!" );
    }

    DescriptorAllocator::~DescriptorAllocator()
    {
        Shutdown();
    }

    void DescriptorAllocator::Shutdown()
    {
        for( VkDescriptorPool pool: m_pools )
        {
            m_api->vkDestroyDescriptorPool( m_device, pool, nullptr );
        }
        m_pools.clear();
    }

    Result DescriptorAllocator::Allocate( VkDescriptorSetLayout layout, VkDescriptorSet& outSet )
    {
        if( m_pools.empty() && OpenPool() != Result::SUCCESS )
            return Result::OUT_OF_MEMORY;

        VkDescriptorSetAllocateInfo allocInfo = { VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO };
        allocInfo.descriptorPool              = m_pools.back();
        allocInfo.descriptorSetCount          = 1;
        allocInfo.pSetLayouts                 = &layout;

        VkResult result = m_api->vkAllocateDescriptorSets( m_device, &allocInfo, &outSet );
        if( result == VK_ERROR_OUT_OF_POOL_MEMORY || result == VK_ERROR_FRAGMENTED_POOL )
        {
            if( OpenPool() != Result::SUCCESS )
                return Result::OUT_OF_MEMORY;

            allocInfo.descriptorPool = m_pools.back();
            result                   = m_api->vkAllocateDescriptorSets( m_device, &allocInfo, &outSet );
        }

        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to allocate descriptor set! Error: {}", ( int )result );
            return Result::OUT_OF_MEMORY;
        }
        return Result::SUCCESS;
    }

    Result DescriptorAllocator::OpenPool()
    {
        VkDescriptorPoolSize poolSize = { VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, UNIFORMS_PER_POOL };

        VkDescriptorPoolCreateInfo poolInfo = { VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO };
        poolInfo.maxSets                    = SETS_PER_POOL;
        poolInfo.poolSizeCount              = 1;
        poolInfo.pPoolSizes                 = &poolSize;

        VkDescriptorPool pool   = VK_NULL_HANDLE;
        VkResult         result = m_api->vkCreateDescriptorPool( m_device, &poolInfo, nullptr, &pool );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create descriptor pool! Error: {}", ( int )result );
            return Result::OUT_OF_MEMORY;
        }

        DOV_CORE_TRACE( "Descriptor pool #{} opened.", m_pools.size() + 1 );
        m_pools.push_back( pool );
        return Result::SUCCESS;
    }
} // namespace DotObjViewer
