#pragma once
#include "core/Base.hpp"
#include "rhi/Buffer.hpp"
#include "rhi/Pipeline.hpp"
#include <deque>
#include <vector>
#include <volk.h>

namespace DotObjViewer
{
    class Device;

    /**
     * @brief One descriptor set of a pipeline layout, addressed by shader variable name.
     * Configure once with Set(), commit with Build(), then bind every frame.
     */
    class BindingGroup
    {
    public:
        /**
         * @brief Allocates descriptor set 'setIndex' of the given layout.
         * Check IsValid() afterwards.
         */
        BindingGroup( Device& device, Ref<PipelineLayout> layout, uint32_t setIndex );
        ~BindingGroup() = default;

        BindingGroup( const BindingGroup& )            = delete;
        BindingGroup& operator=( const BindingGroup& ) = delete;

        /**
         * @brief Binds a buffer to a named resource slot.
         * @return Result::NOT_FOUND if no resource of that name lives in this set.
         */
        Result Set( const std::string& name, const Buffer& buffer );

        // Flushes pending writes through vkUpdateDescriptorSets
        void Build();

        bool_t          IsValid() const { return m_set != VK_NULL_HANDLE; }
        VkDescriptorSet GetHandle() const { return m_set; }
        uint32_t        GetSetIndex() const { return m_setIndex; }

    private:
        Device&             m_device;
        Ref<PipelineLayout> m_layout;
        uint32_t            m_setIndex;
        VkDescriptorSet     m_set = VK_NULL_HANDLE;

        std::vector<VkWriteDescriptorSet>  m_pendingWrites;
        std::deque<VkDescriptorBufferInfo> m_bufferInfos; // Stable addresses for pending writes
    };
} // namespace DotObjViewer
