#pragma once
#include <chrono>

namespace DotObjViewer
{

    class Timer
    {
    public:
        using Clock     = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;

        Timer() { Reset(); }

        void Reset() { m_start = Clock::now(); }
        void Reset( TimePoint start ) { m_start = start; }

        // Seconds between the last reset and 'now'
        float ElapsedAt( TimePoint now ) const
        {
            return std::chrono::duration_cast<std::chrono::nanoseconds>( now - m_start ).count() * 1e-9f;
        }

    private:
        TimePoint m_start;
    };
} // namespace DotObjViewer
