#include "platform/Window.hpp"

#include <GLFW/glfw3.h>

namespace DotObjViewer
{
    static uint32_t s_windowCount = 0;

    static void GLFWErrorCallback( int error, const char* description )
    {
        DOV_CORE_ERROR( "GLFW Error ({0}): {1}", error, description );
    }

    Window::Window( const WindowConfig& config )
    {
        m_data.title  = config.title;
        m_data.width  = config.width;
        m_data.height = config.height;
        m_data.vsync  = config.vsync;
    }

    Window::~Window()
    {
        Shutdown();
    }

    Result Window::Init()
    {
        DOV_CORE_INFO( "Creating window {0} ({1}x{2})", m_data.title, m_data.width, m_data.height );

        if( s_windowCount == 0 )
        {
            glfwSetErrorCallback( GLFWErrorCallback );
            if( !glfwInit() )
            {
                DOV_CORE_CRITICAL( "Could not initialize GLFW!" );
                return Result::FAIL;
            }
        }

        // Tell GLFW we are using Vulkan (no OpenGL context)
        glfwWindowHint( GLFW_CLIENT_API, GLFW_NO_API );
        glfwWindowHint( GLFW_RESIZABLE, GLFW_TRUE );

        m_window = glfwCreateWindow( ( int )m_data.width, ( int )m_data.height, m_data.title.c_str(), nullptr, nullptr );
        if( !m_window )
        {
            DOV_CORE_CRITICAL( "Could not create GLFW window!" );
            if( s_windowCount == 0 )
                glfwTerminate();
            return Result::FAIL;
        }
        ++s_windowCount;

        // The swapchain works in framebuffer pixels, which differ from window units on HiDPI screens
        int fbWidth = 0, fbHeight = 0;
        glfwGetFramebufferSize( m_window, &fbWidth, &fbHeight );
        m_data.width  = static_cast<uint32_t>( fbWidth );
        m_data.height = static_cast<uint32_t>( fbHeight );

        glfwSetWindowUserPointer( m_window, &m_data );

        glfwSetFramebufferSizeCallback( m_window, []( GLFWwindow* window, int width, int height ) {
            WindowData& data = *( WindowData* )glfwGetWindowUserPointer( window );
            data.width       = static_cast<uint32_t>( width );
            data.height      = static_cast<uint32_t>( height );
            if( data.callbacks.onResize )
                data.callbacks.onResize( data.width, data.height );
        } );

        glfwSetMouseButtonCallback( m_window, []( GLFWwindow* window, int button, int action, int ) {
            WindowData& data = *( WindowData* )glfwGetWindowUserPointer( window );
            if( data.callbacks.onMouseButton )
                data.callbacks.onMouseButton( button, action == GLFW_PRESS );
        } );

        glfwSetCursorPosCallback( m_window, []( GLFWwindow* window, double x, double y ) {
            WindowData& data = *( WindowData* )glfwGetWindowUserPointer( window );
            if( data.callbacks.onCursorMoved )
                data.callbacks.onCursorMoved( static_cast<float>( x ), static_cast<float>( y ) );
        } );

        glfwSetScrollCallback( m_window, []( GLFWwindow* window, double, double yOffset ) {
            WindowData& data = *( WindowData* )glfwGetWindowUserPointer( window );
            if( data.callbacks.onScroll )
                data.callbacks.onScroll( static_cast<float>( yOffset ) );
        } );

        glfwSetKeyCallback( m_window, []( GLFWwindow* window, int key, int, int action, int ) {
            WindowData& data = *( WindowData* )glfwGetWindowUserPointer( window );
            if( data.callbacks.onKey )
                data.callbacks.onKey( key, action );
        } );

        glfwSetWindowCloseCallback( m_window, []( GLFWwindow* window ) {
            WindowData& data = *( WindowData* )glfwGetWindowUserPointer( window );
            if( data.callbacks.onClose )
                data.callbacks.onClose();
        } );

        return Result::SUCCESS;
    }

    void Window::Shutdown()
    {
        if( m_window )
        {
            glfwDestroyWindow( m_window );
            m_window = nullptr;

            if( --s_windowCount == 0 )
            {
                glfwTerminate();
            }
        }
    }

    void Window::PollEvents()
    {
        glfwPollEvents();
    }

    void Window::WaitEvents()
    {
        glfwWaitEvents();
    }

    bool Window::IsClosed() const
    {
        return m_window == nullptr || glfwWindowShouldClose( m_window );
    }

    void Window::RequestClose()
    {
        if( m_window )
            glfwSetWindowShouldClose( m_window, GLFW_TRUE );
    }
} // namespace DotObjViewer
