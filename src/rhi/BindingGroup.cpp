#include "rhi/BindingGroup.hpp"

#include "rhi/Device.hpp"

namespace DotObjViewer
{
    static VkDescriptorType MapResourceTypeToVulkan( ShaderResourceType type )
    {
        switch( type )
        {
            case ShaderResourceType::UNIFORM_BUFFER:
                return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            case ShaderResourceType::STORAGE_BUFFER:
                return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            default:
                return VK_DESCRIPTOR_TYPE_MAX_ENUM;
        }
    }

    BindingGroup::BindingGroup( Device& device, Ref<PipelineLayout> layout, uint32_t setIndex )
        : m_device( device )
        , m_layout( std::move( layout ) )
        , m_setIndex( setIndex )
    {
        VkDescriptorSetLayout setLayout = m_layout ? m_layout->GetDescriptorSetLayout( setIndex ) : VK_NULL_HANDLE;
        if( setLayout == VK_NULL_HANDLE )
        {
            DOV_CORE_ERROR( "[BindingGroup] Pipeline layout has no descriptor set {}", setIndex );
            return;
        }

        if( m_device.AllocateDescriptor( setLayout, m_set ) != Result::SUCCESS )
        {
            m_set = VK_NULL_HANDLE;
        }
    }

    Result BindingGroup::Set( const std::string& name, const Buffer& buffer )
    {
        const ShaderReflectionData& layoutMap = m_layout->GetReflectionData();

        auto it = layoutMap.find( name );
        if( it == layoutMap.end() || it->second.set != m_setIndex )
        {
            DOV_CORE_WARN( "[BindingGroup] Set {} does not contain a resource named '{}'. Ignored.", m_setIndex, name );
            return Result::NOT_FOUND;
        }

        const ShaderResource& resourceInfo = it->second;

        VkDescriptorBufferInfo& bufInfo = m_bufferInfos.emplace_back( buffer.GetDescriptorInfo() );

        VkWriteDescriptorSet write = { VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET };
        write.dstSet               = m_set;
        write.dstBinding           = resourceInfo.binding;
        write.dstArrayElement      = 0;
        write.descriptorType       = MapResourceTypeToVulkan( resourceInfo.type );
        write.descriptorCount      = 1;
        write.pBufferInfo          = &bufInfo;

        m_pendingWrites.push_back( write );
        return Result::SUCCESS;
    }

    void BindingGroup::Build()
    {
        if( m_pendingWrites.empty() || m_set == VK_NULL_HANDLE )
            return;

        m_device.UpdateDescriptorSets( m_pendingWrites );

        m_pendingWrites.clear();
        m_bufferInfos.clear();
    }
} // namespace DotObjViewer
