#include "platform/PerformanceMonitor.hpp"
#include "platform/Window.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <sstream>

using namespace DotObjViewer;

// =================================================================================================
// Performance Monitor
// =================================================================================================

TEST( PerformanceMonitorTest, StartsEmpty )
{
    PerformanceMonitor monitor;
    const auto&        stats = monitor.GetStats();

    EXPECT_EQ( stats.frameCount, 0u );
    EXPECT_FLOAT_EQ( stats.fps, 0.0f );
    EXPECT_FALSE( stats.hasGpuMemory );
}

TEST( PerformanceMonitorTest, FpsIsExponentiallySmoothed )
{
    PerformanceMonitor monitor;
    Timer::TimePoint   now = Timer::Clock::now();

    // Steady 10 ms frames: fps_n = 100 * (1 - 0.9^n)
    float expected = 0.0f;
    for( int i = 1; i <= 5; ++i )
    {
        now += std::chrono::milliseconds( 10 );
        monitor.Update( now );
        expected = expected * PerformanceMonitor::FPS_SMOOTHING + 100.0f * ( 1.0f - PerformanceMonitor::FPS_SMOOTHING );
    }

    // The first frame also covers the time since construction
    const auto& stats = monitor.GetStats();
    EXPECT_EQ( stats.frameCount, 5u );
    EXPECT_NEAR( stats.frameTimeMs, 10.0f, 0.01f );
    EXPECT_NEAR( stats.fps, expected, 1.0f );
    EXPECT_LT( stats.fps, 100.0f );
}

TEST( PerformanceMonitorTest, ZeroFrameTimeKeepsFps )
{
    PerformanceMonitor monitor;
    Timer::TimePoint   now = Timer::Clock::now() + std::chrono::milliseconds( 20 );

    monitor.Update( now );
    float fps = monitor.GetStats().fps;

    monitor.Update( now );
    EXPECT_FLOAT_EQ( monitor.GetStats().fps, fps );
    EXPECT_EQ( monitor.GetStats().frameCount, 2u );
}

TEST( PerformanceMonitorTest, GpuMemoryIsReportedInMegabytes )
{
    PerformanceMonitor monitor;
    monitor.SetGpuMemory( 512ull * 1024 * 1024, 2048ull * 1024 * 1024 );

    const auto& stats = monitor.GetStats();
    EXPECT_TRUE( stats.hasGpuMemory );
    EXPECT_EQ( stats.gpuMemoryUsedMB, 512u );
    EXPECT_EQ( stats.gpuMemoryTotalMB, 2048u );
}

TEST( PerformanceMonitorTest, ParsesProcStat )
{
    std::istringstream input( "cpu  100 20 30 400 50 6 7 8 0 0\ncpu0 1 2 3 4 5 6 7 8\n" );
    CpuTimes           times;

    ASSERT_TRUE( PerformanceMonitor::ParseCpuTimes( input, times ) );
    EXPECT_EQ( times.idle, 450u );
    EXPECT_EQ( times.total, 621u );
}

TEST( PerformanceMonitorTest, RejectsMalformedProcStat )
{
    std::istringstream wrongLabel( "intr 1 2 3 4\n" );
    std::istringstream tooShort( "cpu 1 2\n" );
    CpuTimes           times;

    EXPECT_FALSE( PerformanceMonitor::ParseCpuTimes( wrongLabel, times ) );
    EXPECT_FALSE( PerformanceMonitor::ParseCpuTimes( tooShort, times ) );
}

TEST( PerformanceMonitorTest, ParsesMemInfo )
{
    std::istringstream input( "MemTotal:       16000000 kB\n"
                              "MemFree:         2000000 kB\n"
                              "MemAvailable:    4000000 kB\n"
                              "Buffers:          100000 kB\n" );
    uint64_t           total = 0, available = 0;

    ASSERT_TRUE( PerformanceMonitor::ParseMemInfo( input, total, available ) );
    EXPECT_EQ( total, 16000000ull * 1024 );
    EXPECT_EQ( available, 4000000ull * 1024 );
}

TEST( PerformanceMonitorTest, MemInfoWithoutAvailableFails )
{
    std::istringstream input( "MemTotal: 16000000 kB\nMemFree: 2000000 kB\n" );
    uint64_t           total = 0, available = 0;

    EXPECT_FALSE( PerformanceMonitor::ParseMemInfo( input, total, available ) );
}

TEST( PerformanceMonitorTest, CpuUsageBetweenSamples )
{
    CpuTimes first{ 100, 200 };
    CpuTimes second{ 150, 300 };

    EXPECT_FLOAT_EQ( PerformanceMonitor::CpuUsageBetween( first, second ), 50.0f );

    // No elapsed jiffies or counters that went backwards read as idle
    EXPECT_FLOAT_EQ( PerformanceMonitor::CpuUsageBetween( second, second ), 0.0f );
    EXPECT_FLOAT_EQ( PerformanceMonitor::CpuUsageBetween( second, first ), 0.0f );
}

// =================================================================================================
// Window
// =================================================================================================

TEST( WindowTest, KeepsRequestedConfig )
{
    WindowConfig config;
    config.title  = "Test Window";
    config.width  = 800;
    config.height = 600;
    config.vsync  = false;

    Window window( config );

    EXPECT_EQ( window.GetWidth(), 800u );
    EXPECT_EQ( window.GetHeight(), 600u );
    EXPECT_FALSE( window.IsVSync() );
    EXPECT_EQ( window.GetNativeWindow(), nullptr ) << "Nothing is opened before Init";
}

TEST( WindowTest, OpensWhenDisplayAvailable )
{
    WindowConfig config;
    config.width  = 320;
    config.height = 240;

    Window window( config );
    if( window.Init() != Result::SUCCESS )
        GTEST_SKIP() << "No display available, skipping window test.";

    EXPECT_NE( window.GetNativeWindow(), nullptr );
    EXPECT_FALSE( window.IsClosed() );

    window.PollEvents();
    window.RequestClose();
    EXPECT_TRUE( window.IsClosed() );
}
