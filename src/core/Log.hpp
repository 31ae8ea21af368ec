#pragma once

#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace DotObjViewer
{
    class Log
    {
    public:
        /**
         * @brief Creates the CORE and VIEWER loggers. Safe to call more than once.
         * @param level Minimum severity emitted by both loggers.
         */
        static void Init( spdlog::level::level_enum level = spdlog::level::trace );

        static void SetLevel( spdlog::level::level_enum level );

        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger() { return s_coreLogger; }
        inline static std::shared_ptr<spdlog::logger>& GetViewerLogger() { return s_viewerLogger; }

    private:
        static std::shared_ptr<spdlog::logger> s_coreLogger;
        static std::shared_ptr<spdlog::logger> s_viewerLogger;
    };
} // namespace DotObjViewer

#define DOV_CORE_TRACE( ... )    ::DotObjViewer::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define DOV_CORE_INFO( ... )     ::DotObjViewer::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define DOV_CORE_WARN( ... )     ::DotObjViewer::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define DOV_CORE_ERROR( ... )    ::DotObjViewer::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define DOV_CORE_CRITICAL( ... ) ::DotObjViewer::Log::GetCoreLogger()->critical( __VA_ARGS__ )

#define DOV_TRACE( ... )    ::DotObjViewer::Log::GetViewerLogger()->trace( __VA_ARGS__ )
#define DOV_INFO( ... )     ::DotObjViewer::Log::GetViewerLogger()->info( __VA_ARGS__ )
#define DOV_WARN( ... )     ::DotObjViewer::Log::GetViewerLogger()->warn( __VA_ARGS__ )
#define DOV_ERROR( ... )    ::DotObjViewer::Log::GetViewerLogger()->error( __VA_ARGS__ )
#define DOV_CRITICAL( ... ) ::DotObjViewer::Log::GetViewerLogger()->critical( __VA_ARGS__ )
