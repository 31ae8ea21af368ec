#pragma once

#include "core/Base.hpp"
#include <mutex>
#include <volk.h>

namespace DotObjViewer
{
    // Description of a semaphore to wait on
    struct QueueWaitInfo
    {
        VkSemaphore           semaphore;
        uint64_t              value;     // Target value for Timeline, ignored (0) for Binary
        VkPipelineStageFlags2 stageMask; // Pipeline stage that blocks waiting for this semaphore
    };

    // Description of a semaphore to signal
    struct QueueSignalInfo
    {
        VkSemaphore           semaphore;
        uint64_t              value;     // Signal value for Timeline, ignored (0) for Binary
        VkPipelineStageFlags2 stageMask; // Pipeline stage that signals this semaphore
    };

    struct SubmitInfo
    {
        std::vector<VkCommandBuffer> commandBuffers;
        std::vector<QueueWaitInfo>   waitSemaphores;
        std::vector<QueueSignalInfo> signalSemaphores;
    };

    /**
     * @brief Graphics/present queue with an internal timeline semaphore.
     * Every submission signals the next timeline value, so CPU waits never need fences.
     */
    class Queue
    {
    public:
        Queue( VkDevice device, const VolkDeviceTable& table, uint32_t queueFamilyIndex );
        ~Queue();

        /**
         * @brief Submits command buffers with vkQueueSubmit2.
         * @param info Command buffers plus user-provided wait/signal semaphores.
         * @param outSignalValue [Out, Optional] Timeline value signaled when this batch completes.
         * @return Result::SUCCESS, Result::OUT_OF_MEMORY or Result::FAIL.
         */
        Result Submit( const SubmitInfo& info, uint64_t* outSignalValue = nullptr );
        Result Submit( VkCommandBuffer commandBuffer, uint64_t& outSignalValue );

        bool_t      IsValueCompleted( uint64_t value );
        VkQueue     GetHandle() const { return m_queue; }
        uint32_t    GetFamilyIndex() const { return m_queueFamilyIndex; }
        uint64_t    GetLastSubmittedValue() const { return m_nextValue - 1; }
        VkSemaphore GetTimelineSemaphore() const { return m_timelineSemaphore; }
        bool_t      IsValid() const { return m_timelineSemaphore != VK_NULL_HANDLE; }

    private:
        VkDevice               m_device;
        const VolkDeviceTable& m_api;
        VkQueue                m_queue;
        uint32_t               m_queueFamilyIndex;
        std::mutex             m_mutex;

        VkSemaphore m_timelineSemaphore;
        uint64_t    m_nextValue;
    };
} // namespace DotObjViewer
