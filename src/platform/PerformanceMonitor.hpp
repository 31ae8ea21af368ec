#pragma once
#include "core/Base.hpp"
#include "core/Timer.hpp"
#include <istream>

namespace DotObjViewer
{
    // Snapshot read by the overlay, never written by the renderer
    struct PerformanceStats
    {
        float    cpuUsage      = 0.0f; // Percent over all cores
        float    memoryUsage   = 0.0f; // Percent of physical memory
        uint64_t memoryUsedMB  = 0;
        uint64_t memoryTotalMB = 0;
        float    fps           = 0.0f; // Exponentially smoothed
        float    frameTimeMs   = 0.0f;
        uint64_t frameCount    = 0;

        bool_t   hasGpuMemory     = false;
        uint64_t gpuMemoryUsedMB  = 0;
        uint64_t gpuMemoryTotalMB = 0;
    };

    // Aggregate jiffies from the first line of /proc/stat
    struct CpuTimes
    {
        uint64_t idle  = 0;
        uint64_t total = 0;
    };

    /**
     * @brief Frame timing plus system CPU/RAM sampling.
     * Call Update() once per frame. System metrics refresh at most every REFRESH_INTERVAL_MS.
     */
    class PerformanceMonitor
    {
    public:
        static constexpr float REFRESH_INTERVAL_MS = 500.0f;
        static constexpr float FPS_SMOOTHING       = 0.9f; // Weight of the previous value

        PerformanceMonitor();

        void Update();
        void Update( Timer::TimePoint now );

        // Reported by the renderer, shown next to system memory
        void SetGpuMemory( uint64_t usedBytes, uint64_t totalBytes );

        const PerformanceStats& GetStats() const { return m_stats; }

        // --- /proc parsers ---
        static bool_t ParseCpuTimes( std::istream& procStat, CpuTimes& out );
        static bool_t ParseMemInfo( std::istream& procMeminfo, uint64_t& outTotalBytes, uint64_t& outAvailableBytes );

        // Busy share between two samples, in percent
        static float CpuUsageBetween( const CpuTimes& previous, const CpuTimes& current );

    private:
        void RefreshSystemMetrics();

    private:
        PerformanceStats m_stats;
        Timer            m_frameTimer;
        Timer            m_refreshTimer;
        bool_t           m_firstRefresh = true;
        bool_t           m_hasCpuSample = false;
        CpuTimes         m_lastCpu;
    };
} // namespace DotObjViewer
