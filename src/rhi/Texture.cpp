#include "rhi/Texture.hpp"

namespace DotObjViewer
{
    bool_t Texture::IsDepthFormat( VkFormat format )
    {
        switch( format )
        {
            case VK_FORMAT_D16_UNORM:
            case VK_FORMAT_X8_D24_UNORM_PACK32:
            case VK_FORMAT_D32_SFLOAT:
            case VK_FORMAT_D16_UNORM_S8_UINT:
            case VK_FORMAT_D24_UNORM_S8_UINT:
            case VK_FORMAT_D32_SFLOAT_S8_UINT:
                return true;
            default:
                return false;
        }
    }

    VkImageAspectFlags Texture::GetAspectFlags( VkFormat format )
    {
        switch( format )
        {
            case VK_FORMAT_D16_UNORM_S8_UINT:
            case VK_FORMAT_D24_UNORM_S8_UINT:
            case VK_FORMAT_D32_SFLOAT_S8_UINT:
                return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;
            default:
                return IsDepthFormat( format ) ? VK_IMAGE_ASPECT_DEPTH_BIT : VK_IMAGE_ASPECT_COLOR_BIT;
        }
    }

    Texture::Texture( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api )
        : m_allocator( allocator )
        , m_device( device )
        , m_api( api )
    {
    }

    Texture::~Texture()
    {
        Destroy();
    }

    void Texture::Destroy()
    {
        if( m_view != VK_NULL_HANDLE )
        {
            m_api->vkDestroyImageView( m_device, m_view, nullptr );
            m_view = VK_NULL_HANDLE;
        }
        if( m_image != VK_NULL_HANDLE )
        {
            vmaDestroyImage( m_allocator, m_image, m_allocation );
            m_image      = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
        }
    }

    Result Texture::Create( const TextureDesc& desc )
    {
        if( desc.width == 0 || desc.height == 0 )
        {
            DOV_CORE_ERROR( "Texture extent must be non-zero ({}x{}).", desc.width, desc.height );
            return Result::INVALID_ARGS;
        }

        const bool_t depth = desc.usage == TextureUsage::DEPTH_ATTACHMENT;
        if( depth != IsDepthFormat( desc.format ) )
        {
            DOV_CORE_ERROR( "Format {} does not match the requested {} attachment.", ( int )desc.format, depth ? "depth" : "color" );
            return Result::INVALID_ARGS;
        }

        Destroy();
        m_extent = { desc.width, desc.height };
        m_format = desc.format;

        VkImageCreateInfo imageInfo = { VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO };
        imageInfo.imageType         = VK_IMAGE_TYPE_2D;
        imageInfo.extent            = { desc.width, desc.height, 1 };
        imageInfo.mipLevels         = 1;
        imageInfo.arrayLayers       = 1;
        imageInfo.format            = m_format;
        imageInfo.tiling            = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.initialLayout     = VK_IMAGE_LAYOUT_UNDEFINED;
        imageInfo.usage             = depth ? VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT : VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
        imageInfo.sharingMode       = VK_SHARING_MODE_EXCLUSIVE;
        imageInfo.samples           = VK_SAMPLE_COUNT_1_BIT;

        // Attachments are large and rebuilt on resize, keep them out of shared blocks
        VmaAllocationCreateInfo allocInfo = {};
        allocInfo.usage                   = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
        allocInfo.flags                   = VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;

        VkResult result = vmaCreateImage( m_allocator, &imageInfo, &allocInfo, &m_image, &m_allocation, nullptr );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to allocate {}x{} attachment! Error: {}", desc.width, desc.height, ( int )result );
            m_image      = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
            return result == VK_ERROR_OUT_OF_DEVICE_MEMORY || result == VK_ERROR_OUT_OF_HOST_MEMORY ? Result::OUT_OF_MEMORY : Result::FAIL;
        }

        VkImageViewCreateInfo viewInfo       = { VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO };
        viewInfo.image                       = m_image;
        viewInfo.viewType                    = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format                      = m_format;
        viewInfo.subresourceRange.aspectMask = GetAspectFlags( m_format );
        viewInfo.subresourceRange.levelCount = 1;
        viewInfo.subresourceRange.layerCount = 1;

        result = m_api->vkCreateImageView( m_device, &viewInfo, nullptr, &m_view );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Failed to create attachment view! Error: {}", ( int )result );
            Destroy();
            return Result::FAIL;
        }

        return Result::SUCCESS;
    }
} // namespace DotObjViewer
