#include "rhi/Buffer.hpp"

#include <cstring>

namespace DotObjViewer
{
    Buffer::Buffer( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api )
        : m_allocator( allocator )
        , m_device( device )
        , m_api( api )
    {
    }

    Buffer::~Buffer()
    {
        Destroy();
    }

    Result Buffer::Create( const BufferDesc& desc )
    {
        if( desc.size == 0 )
        {
            DOV_CORE_ERROR( "Refusing to create a zero-sized buffer." );
            return Result::INVALID_ARGS;
        }

        Destroy();

        VkBufferCreateInfo bufferInfo = { VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO };
        bufferInfo.size               = desc.size;
        bufferInfo.sharingMode        = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo = {};
        allocInfo.usage                   = VMA_MEMORY_USAGE_AUTO;

        switch( desc.type )
        {
            case BufferType::UPLOAD:
                // Written once front to back
                bufferInfo.usage = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
                allocInfo.flags  = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
                break;

            case BufferType::READBACK:
                bufferInfo.usage = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
                allocInfo.flags  = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
                break;

            case BufferType::UNIFORM:
                bufferInfo.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
                allocInfo.flags  = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
                break;

            // Mesh buffers are filled by copies and may be copied back out for inspection
            case BufferType::VERTEX:
                bufferInfo.usage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
                allocInfo.usage  = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
                break;

            case BufferType::INDEX:
                bufferInfo.usage = VK_BUFFER_USAGE_INDEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
                allocInfo.usage  = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
                break;
        }

        VmaAllocationInfo resultInfo = {};
        VkResult          result     = vmaCreateBuffer( m_allocator, &bufferInfo, &allocInfo, &m_buffer, &m_allocation, &resultInfo );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create buffer of {} bytes! Error: {}", desc.size, ( int )result );
            m_buffer     = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
            return result == VK_ERROR_OUT_OF_DEVICE_MEMORY || result == VK_ERROR_OUT_OF_HOST_MEMORY ? Result::OUT_OF_MEMORY : Result::FAIL;
        }

        m_size       = desc.size;
        m_type       = desc.type;
        m_mappedData = resultInfo.pMappedData;
        return Result::SUCCESS;
    }

    void Buffer::Destroy()
    {
        if( m_buffer != VK_NULL_HANDLE )
        {
            vmaDestroyBuffer( m_allocator, m_buffer, m_allocation );
            m_buffer     = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
        }
        m_mappedData = nullptr;
        m_size       = 0;
    }

    Result Buffer::CheckHostRange( size_t size, size_t offset ) const
    {
        if( !m_mappedData )
        {
            DOV_CORE_ERROR( "Host access to a device local buffer!" );
            return Result::INVALID_ARGS;
        }
        if( offset + size > m_size )
        {
            DOV_CORE_ERROR( "Buffer access [{}, {}) is past the end ({} bytes)!", offset, offset + size, m_size );
            return Result::INVALID_ARGS;
        }
        return Result::SUCCESS;
    }

    Result Buffer::Write( const void* data, size_t size, size_t offset )
    {
        Result res = CheckHostRange( size, offset );
        if( res != Result::SUCCESS )
            return res;

        std::memcpy( static_cast<uint8_t*>( m_mappedData ) + offset, data, size );
        // No-op on coherent memory
        return vmaFlushAllocation( m_allocator, m_allocation, offset, size ) == VK_SUCCESS ? Result::SUCCESS : Result::FAIL;
    }

    Result Buffer::Read( void* outData, size_t size, size_t offset )
    {
        Result res = CheckHostRange( size, offset );
        if( res != Result::SUCCESS )
            return res;

        // Make GPU writes visible to the host first
        if( vmaInvalidateAllocation( m_allocator, m_allocation, offset, size ) != VK_SUCCESS )
            return Result::FAIL;
        std::memcpy( outData, static_cast<const uint8_t*>( m_mappedData ) + offset, size );
        return Result::SUCCESS;
    }
} // namespace DotObjViewer
