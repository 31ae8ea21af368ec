#include "rhi/Queue.hpp"

namespace DotObjViewer
{
    Queue::Queue( VkDevice device, const VolkDeviceTable& api, uint32_t queueFamilyIndex )
        : m_device( device )
        , m_api( api )
        , m_queue( VK_NULL_HANDLE )
        , m_queueFamilyIndex( queueFamilyIndex )
        , m_timelineSemaphore( VK_NULL_HANDLE )
        , m_nextValue( 1 )
    {
        m_api.vkGetDeviceQueue( m_device, m_queueFamilyIndex, 0, &m_queue );

        VkSemaphoreTypeCreateInfo timelineCreateInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO };
        timelineCreateInfo.semaphoreType             = VK_SEMAPHORE_TYPE_TIMELINE;
        timelineCreateInfo.initialValue              = 0;

        VkSemaphoreCreateInfo createInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };
        createInfo.pNext                 = &timelineCreateInfo;

        VkResult result = m_api.vkCreateSemaphore( m_device, &createInfo, nullptr, &m_timelineSemaphore );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_CRITICAL( "Failed to create Timeline Semaphore for queue family {}! Error: {}", m_queueFamilyIndex, ( int )result );
            m_timelineSemaphore = VK_NULL_HANDLE;
        }
    }

    Queue::~Queue()
    {
        if( m_timelineSemaphore != VK_NULL_HANDLE )
        {
            m_api.vkDestroySemaphore( m_device, m_timelineSemaphore, nullptr );
        }
    }

    Result Queue::Submit( const SubmitInfo& info, uint64_t* outSignalValue )
    {
        std::lock_guard<std::mutex> lock( m_mutex );

        std::vector<VkCommandBufferSubmitInfo> cmdInfos;
        cmdInfos.reserve( info.commandBuffers.size() );
        for( auto cmd: info.commandBuffers )
        {
            VkCommandBufferSubmitInfo cmdInfo = { VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO };
            cmdInfo.commandBuffer             = cmd;
            cmdInfos.push_back( cmdInfo );
        }

        std::vector<VkSemaphoreSubmitInfo> waitInfos;
        waitInfos.reserve( info.waitSemaphores.size() );
        for( const auto& wait: info.waitSemaphores )
        {
            VkSemaphoreSubmitInfo semInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO };
            semInfo.semaphore             = wait.semaphore;
            semInfo.value                 = wait.value;
            semInfo.stageMask             = wait.stageMask;
            waitInfos.push_back( semInfo );
        }

        std::vector<VkSemaphoreSubmitInfo> signalInfos;
        signalInfos.reserve( info.signalSemaphores.size() + 1 );
        for( const auto& signal: info.signalSemaphores )
        {
            VkSemaphoreSubmitInfo semInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO };
            semInfo.semaphore             = signal.semaphore;
            semInfo.value                 = signal.value;
            semInfo.stageMask             = signal.stageMask;
            signalInfos.push_back( semInfo );
        }

        // Internal timeline signal, always last
        uint64_t signalValue = m_nextValue;

        VkSemaphoreSubmitInfo timelineSignal = { VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO };
        timelineSignal.semaphore             = m_timelineSemaphore;
        timelineSignal.value                 = signalValue;
        timelineSignal.stageMask             = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        signalInfos.push_back( timelineSignal );

        VkSubmitInfo2 submitInfo            = { VK_STRUCTURE_TYPE_SUBMIT_INFO_2 };
        submitInfo.commandBufferInfoCount   = static_cast<uint32_t>( cmdInfos.size() );
        submitInfo.pCommandBufferInfos      = cmdInfos.data();
        submitInfo.waitSemaphoreInfoCount   = static_cast<uint32_t>( waitInfos.size() );
        submitInfo.pWaitSemaphoreInfos      = waitInfos.data();
        submitInfo.signalSemaphoreInfoCount = static_cast<uint32_t>( signalInfos.size() );
        submitInfo.pSignalSemaphoreInfos    = signalInfos.data();

        VkResult result = m_api.vkQueueSubmit2( m_queue, 1, &submitInfo, VK_NULL_HANDLE );
        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "Queue Submit2 failed! Error: {}", ( int )result );
            if( result == VK_ERROR_OUT_OF_HOST_MEMORY || result == VK_ERROR_OUT_OF_DEVICE_MEMORY )
                return Result::OUT_OF_MEMORY;
            return Result::FAIL;
        }

        // Only advance once the value is guaranteed to be signaled
        ++m_nextValue;
        if( outSignalValue )
        {
            *outSignalValue = signalValue;
        }

        return Result::SUCCESS;
    }

    Result Queue::Submit( VkCommandBuffer commandBuffer, uint64_t& outSignalValue )
    {
        SubmitInfo info;
        info.commandBuffers.push_back( commandBuffer );
        return Submit( info, &outSignalValue );
    }

    bool_t Queue::IsValueCompleted( uint64_t value )
    {
        uint64_t completedValue = 0;
        VkResult result         = m_api.vkGetSemaphoreCounterValue( m_device, m_timelineSemaphore, &completedValue );

        if( result != VK_SUCCESS )
        {
            DOV_CORE_ERROR( "GetSemaphoreCounterValue failed! Error: {}", ( int )result );
            return false;
        }

        return completedValue >= value;
    }

} // namespace DotObjViewer
