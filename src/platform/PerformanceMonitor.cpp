#include "platform/PerformanceMonitor.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace DotObjViewer
{
    static constexpr uint64_t BYTES_PER_MB = 1024 * 1024;

    PerformanceMonitor::PerformanceMonitor()
    {
        Timer::TimePoint now = Timer::Clock::now();
        m_frameTimer.Reset( now );
        m_refreshTimer.Reset( now );
    }

    void PerformanceMonitor::Update()
    {
        Update( Timer::Clock::now() );
    }

    void PerformanceMonitor::Update( Timer::TimePoint now )
    {
        if( m_firstRefresh || m_refreshTimer.ElapsedAt( now ) * 1000.0f >= REFRESH_INTERVAL_MS )
        {
            RefreshSystemMetrics();
            m_refreshTimer.Reset( now );
            m_firstRefresh = false;
        }

        float frameTime = m_frameTimer.ElapsedAt( now );
        m_frameTimer.Reset( now );

        m_stats.frameTimeMs = frameTime * 1000.0f;
        m_stats.frameCount++;
        if( frameTime > 0.0f )
        {
            m_stats.fps = m_stats.fps * FPS_SMOOTHING + ( 1.0f / frameTime ) * ( 1.0f - FPS_SMOOTHING );
        }
    }

    void PerformanceMonitor::SetGpuMemory( uint64_t usedBytes, uint64_t totalBytes )
    {
        m_stats.hasGpuMemory     = true;
        m_stats.gpuMemoryUsedMB  = usedBytes / BYTES_PER_MB;
        m_stats.gpuMemoryTotalMB = totalBytes / BYTES_PER_MB;
    }

    void PerformanceMonitor::RefreshSystemMetrics()
    {
        // Without /proc both files fail to open and the metrics stay at zero
        std::ifstream statFile( "/proc/stat" );
        CpuTimes      cpu;
        if( statFile.is_open() && ParseCpuTimes( statFile, cpu ) )
        {
            if( m_hasCpuSample )
            {
                m_stats.cpuUsage = CpuUsageBetween( m_lastCpu, cpu );
            }
            m_lastCpu      = cpu;
            m_hasCpuSample = true;
        }

        std::ifstream meminfoFile( "/proc/meminfo" );
        uint64_t      total     = 0;
        uint64_t      available = 0;
        if( meminfoFile.is_open() && ParseMemInfo( meminfoFile, total, available ) && total > 0 )
        {
            uint64_t used         = total - available;
            m_stats.memoryTotalMB = total / BYTES_PER_MB;
            m_stats.memoryUsedMB  = used / BYTES_PER_MB;
            m_stats.memoryUsage   = static_cast<float>( used ) / static_cast<float>( total ) * 100.0f;
        }
    }

    bool_t PerformanceMonitor::ParseCpuTimes( std::istream& procStat, CpuTimes& out )
    {
        std::string line;
        if( !std::getline( procStat, line ) )
            return false;

        std::istringstream stream( line );
        std::string        label;
        stream >> label;
        if( label != "cpu" )
            return false;

        // user nice system idle iowait irq softirq steal ...
        uint64_t values[ 8 ] = {};
        int      count       = 0;
        while( count < 8 && stream >> values[ count ] )
        {
            ++count;
        }
        if( count < 4 )
            return false;

        out.idle  = values[ 3 ] + ( count > 4 ? values[ 4 ] : 0 );
        out.total = 0;
        for( int i = 0; i < count; ++i )
        {
            out.total += values[ i ];
        }
        return true;
    }

    bool_t PerformanceMonitor::ParseMemInfo( std::istream& procMeminfo, uint64_t& outTotalBytes, uint64_t& outAvailableBytes )
    {
        bool_t      hasTotal = false, hasAvailable = false;
        std::string key;
        uint64_t    valueKb = 0;
        std::string line;

        while( std::getline( procMeminfo, line ) )
        {
            std::istringstream stream( line );
            if( !( stream >> key >> valueKb ) )
                continue;

            if( key == "MemTotal:" )
            {
                outTotalBytes = valueKb * 1024;
                hasTotal      = true;
            }
            else if( key == "MemAvailable:" )
            {
                outAvailableBytes = valueKb * 1024;
                hasAvailable      = true;
            }
        }
        return hasTotal && hasAvailable;
    }

    float PerformanceMonitor::CpuUsageBetween( const CpuTimes& previous, const CpuTimes& current )
    {
        if( current.total <= previous.total )
            return 0.0f;
        uint64_t totalDelta = current.total - previous.total;
        uint64_t idleDelta  = current.idle >= previous.idle ? current.idle - previous.idle : 0;
        if( idleDelta > totalDelta )
            return 0.0f;
        return static_cast<float>( totalDelta - idleDelta ) / static_cast<float>( totalDelta ) * 100.0f;
    }
} // namespace DotObjViewer
