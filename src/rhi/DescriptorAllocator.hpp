#pragma once
#include "core/Base.hpp"
#include <vector>
#include <volk.h>

namespace DotObjViewer
{
    /**
     * @brief Hands out uniform-buffer descriptor sets from a growing list of pools.
     * Sets live as long as the allocator, all pools are destroyed together.
     */
    class DescriptorAllocator
    {
    public:
        DescriptorAllocator( VkDevice device, const VolkDeviceTable* api );
        ~DescriptorAllocator();

        DescriptorAllocator( const DescriptorAllocator& )            = delete;
        DescriptorAllocator& operator=( const DescriptorAllocator& ) = delete;

        void Shutdown();

        /**
         * @brief Allocates a descriptor set, opening a new pool when the current one is full.
         * @return Result::SUCCESS or Result::OUT_OF_MEMORY
         */
        Result Allocate( VkDescriptorSetLayout layout, VkDescriptorSet& outSet );

    private:
        Result OpenPool();

    private:
        VkDevice               m_device;
        const VolkDeviceTable* m_api;

        std::vector<VkDescriptorPool> m_pools; // back() is the one allocated from
    };
} // namespace DotObjViewer
