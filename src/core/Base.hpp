#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace DotObjViewer
{
    using bool_t    = bool;
    using float32_t = float;
    using float64_t = double;

    // Error codes
    enum class Result : int32_t
    {
        SUCCESS         = 0,
        FAIL            = -1,
        NOT_IMPLEMENTED = -2,
        INVALID_ARGS    = -3,
        TIMEOUT         = -4,
        NOT_FOUND       = -5,
        INVALID_DATA    = -6,
        OUT_OF_MEMORY   = -10
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::NOT_IMPLEMENTED:
                return "NOT_IMPLEMENTED";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::TIMEOUT:
                return "TIMEOUT";
            case Result::NOT_FOUND:
                return "NOT_FOUND";
            case Result::INVALID_DATA:
                return "INVALID_DATA";
            case Result::OUT_OF_MEMORY:
                return "OUT_OF_MEMORY";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;

    template<typename T, typename... Args>
    constexpr Ref<T> CreateRef( Args&&... args )
    {
        return std::make_shared<T>( std::forward<Args>( args )... );
    }
} // namespace DotObjViewer

#include "core/Log.hpp"

#if defined( _MSC_VER )
#    define DOV_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define DOV_DEBUGBREAK() raise( SIGTRAP )
#else
#    define DOV_DEBUGBREAK()
#endif

#ifdef DOV_DEBUG
#    define DOV_ENABLE_ASSERTS
#endif

#ifdef DOV_ENABLE_ASSERTS
#    define DOV_ASSERT( x, ... )                                                                                                                     \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                DOV_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                                   \
                DOV_DEBUGBREAK();                                                                                                                    \
            }                                                                                                                                        \
        }
#    define DOV_CORE_ASSERT( x, ... )                                                                                                                \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                DOV_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                              \
                DOV_DEBUGBREAK();                                                                                                                    \
            }                                                                                                                                        \
        }
#else
#    define DOV_ASSERT( x, ... )
#    define DOV_CORE_ASSERT( x, ... )
#endif
