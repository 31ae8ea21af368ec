#pragma once
#include "core/Base.hpp"
#include <functional>
#include <string>

struct GLFWwindow;

namespace DotObjViewer
{
    struct WindowConfig
    {
        std::string title  = "DotObjViewer";
        uint32_t    width  = 1024;
        uint32_t    height = 768;
        bool        vsync  = true;
    };

    /**
     * @brief Handlers for the OS events the viewer reacts to.
     * Key and button codes are GLFW codes (GLFW_KEY_*, GLFW_MOUSE_BUTTON_*).
     */
    struct WindowCallbacks
    {
        std::function<void( uint32_t, uint32_t )> onResize;      // Framebuffer size in pixels
        std::function<void( int, bool )>          onMouseButton; // Button, pressed
        std::function<void( float, float )>       onCursorMoved; // Position in pixels
        std::function<void( float )>              onScroll;      // Vertical offset in lines
        std::function<void( int, int )>           onKey;         // Key, GLFW action
        std::function<void()>                     onClose;
    };

    class Window
    {
    public:
        Window( const WindowConfig& config );
        ~Window();

        /**
         * @brief Initializes GLFW and opens the window.
         * @return Result::FAIL if GLFW or the window cannot be created.
         */
        Result Init();

        // Pumps OS events, callbacks fire from inside this call
        void PollEvents();
        // Blocks until at least one event arrives (used while minimized)
        void WaitEvents();

        void SetCallbacks( WindowCallbacks callbacks ) { m_data.callbacks = std::move( callbacks ); }

        uint32_t GetWidth() const { return m_data.width; }
        uint32_t GetHeight() const { return m_data.height; }
        bool     IsVSync() const { return m_data.vsync; }

        // Returns true if the user requested to close the window (e.g. clicked X)
        bool IsClosed() const;
        void RequestClose();

        // Raw pointer for RHI / ImGui
        void* GetNativeWindow() const { return m_window; }

    private:
        void Shutdown();

    private:
        struct WindowData
        {
            std::string     title;
            uint32_t        width, height;
            bool            vsync;
            WindowCallbacks callbacks;
        };

        WindowData  m_data;
        GLFWwindow* m_window = nullptr;
    };
} // namespace DotObjViewer
