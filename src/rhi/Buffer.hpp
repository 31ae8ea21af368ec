#pragma once
#include "core/Base.hpp"
#include <volk.h>
#include <vk_mem_alloc.h>

namespace DotObjViewer
{
    // Defines the intended usage and memory location of the buffer
    enum class BufferType
    {
        UPLOAD,   // Host visible staging memory, copy source
        READBACK, // Host visible, copy destination
        UNIFORM,  // Host visible, rewritten every frame
        VERTEX,   // Device local vertex data
        INDEX     // Device local 32-bit indices
    };

    struct BufferDesc
    {
        VkDeviceSize size = 0;
        BufferType   type = BufferType::VERTEX;
    };

    /**
     * @brief VMA-backed buffer. Host visible types stay mapped for their whole lifetime.
     */
    class Buffer
    {
    public:
        Buffer( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api );
        ~Buffer();

        Buffer( const Buffer& )            = delete;
        Buffer& operator=( const Buffer& ) = delete;

        Result Create( const BufferDesc& desc );
        void   Destroy();

        /**
         * @brief Copies between host memory and a host visible buffer.
         * @return Result::INVALID_ARGS for device local buffers or ranges past the end.
         */
        Result Write( const void* data, size_t size, size_t offset = 0 );
        Result Read( void* outData, size_t size, size_t offset = 0 );

        VkDescriptorBufferInfo GetDescriptorInfo() const { return { m_buffer, 0, VK_WHOLE_SIZE }; }

        VkBuffer     GetHandle() const { return m_buffer; }
        VkDeviceSize GetSize() const { return m_size; }
        BufferType   GetType() const { return m_type; }
        bool_t       IsHostVisible() const { return m_mappedData != nullptr; }

    private:
        Result CheckHostRange( size_t size, size_t offset ) const;

    private:
        VmaAllocator           m_allocator;
        VkDevice               m_device;
        const VolkDeviceTable* m_api;
        VkBuffer               m_buffer     = VK_NULL_HANDLE;
        VmaAllocation          m_allocation = VK_NULL_HANDLE;
        VkDeviceSize           m_size       = 0;
        BufferType             m_type       = BufferType::VERTEX;
        void*                  m_mappedData = nullptr;
    };
} // namespace DotObjViewer
