#pragma once
#include "core/Base.hpp"
#include <volk.h>
#include <vk_mem_alloc.h>

namespace DotObjViewer
{
    // What the image is rendered as, every texture is an attachment
    enum class TextureUsage
    {
        COLOR_ATTACHMENT,
        DEPTH_ATTACHMENT
    };

    struct TextureDesc
    {
        uint32_t     width  = 1;
        uint32_t     height = 1;
        VkFormat     format = VK_FORMAT_D32_SFLOAT;
        TextureUsage usage  = TextureUsage::DEPTH_ATTACHMENT;
    };

    /**
     * @brief Single-sample 2D attachment image with one view, in dedicated device memory.
     * Recreated on every surface resize rather than resized in place.
     */
    class Texture
    {
    public:
        Texture( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api );
        ~Texture();

        Texture( const Texture& )            = delete;
        Texture& operator=( const Texture& ) = delete;

        /**
         * @return Result::INVALID_ARGS for a zero extent or a usage/format mismatch,
         * Result::OUT_OF_MEMORY if the allocation fails.
         */
        Result Create( const TextureDesc& desc );
        void   Destroy();

        static bool_t             IsDepthFormat( VkFormat format );
        static VkImageAspectFlags GetAspectFlags( VkFormat format );

        VkImage            GetImage() const { return m_image; }
        VkImageView        GetView() const { return m_view; }
        VkExtent2D         GetExtent() const { return m_extent; }
        VkFormat           GetFormat() const { return m_format; }
        VkImageAspectFlags GetAspect() const { return GetAspectFlags( m_format ); }

    private:
        VmaAllocator           m_allocator;
        VkDevice               m_device;
        const VolkDeviceTable* m_api;

        VkImage       m_image      = VK_NULL_HANDLE;
        VkImageView   m_view       = VK_NULL_HANDLE;
        VmaAllocation m_allocation = VK_NULL_HANDLE;

        VkExtent2D m_extent = { 0, 0 };
        VkFormat   m_format = VK_FORMAT_UNDEFINED;
    };
} // namespace DotObjViewer
