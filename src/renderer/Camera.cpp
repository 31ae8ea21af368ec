#include "renderer/Camera.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace DotObjViewer
{
    Camera::Camera( float fov, float aspectRatio, float nearClip, float farClip )
        : m_fov( fov )
        , m_aspectRatio( aspectRatio )
        , m_nearClip( nearClip )
        , m_farClip( farClip )
        , m_initialNearClip( nearClip )
        , m_initialFarClip( farClip )
    {
    }

    glm::mat4 Camera::Perspective( float fov, float aspectRatio, float nearClip, float farClip )
    {
        glm::mat4 projection = glm::perspectiveRH_ZO( fov, aspectRatio, nearClip, farClip );
        projection[ 1 ][ 1 ] *= -1.0f; // Vulkan Y flip
        return projection;
    }

    glm::vec3 Camera::GetPosition() const
    {
        float x = m_distance * std::cos( m_pitch ) * std::sin( m_yaw );
        float y = m_distance * std::sin( m_pitch );
        float z = m_distance * std::cos( m_pitch ) * std::cos( m_yaw );

        // Position is relative to the target
        return m_target + glm::vec3( x, y, z );
    }

    glm::mat4 Camera::GetView() const
    {
        return glm::lookAtRH( GetPosition(), m_target, m_up );
    }

    glm::mat4 Camera::GetProjection() const
    {
        return Perspective( m_fov, m_aspectRatio, m_nearClip, m_farClip );
    }

    void Camera::ApplyOrbitDelta( float dx, float dy )
    {
        m_yaw += dx * ORBIT_SENSITIVITY;
        m_pitch = std::clamp( m_pitch + dy * ORBIT_SENSITIVITY, -PITCH_LIMIT, PITCH_LIMIT );
    }

    void Camera::ApplyZoomDelta( float delta, ScrollUnit unit )
    {
        float step = unit == ScrollUnit::LINE ? ZOOM_PER_LINE : ZOOM_PER_PIXEL;
        m_distance = std::clamp( m_distance - delta * step, MIN_DISTANCE, MAX_DISTANCE );
    }

    void Camera::OnOrbitButton( bool pressed )
    {
        m_isOrbiting = pressed;
        if( !pressed )
        {
            // The next drag starts from its own first cursor sample
            m_hasLastMouse = false;
        }
    }

    void Camera::OnCursorMoved( float x, float y )
    {
        if( !m_isOrbiting )
            return;

        glm::vec2 mouse = { x, y };
        if( m_hasLastMouse )
        {
            glm::vec2 delta = mouse - m_lastMousePos;
            ApplyOrbitDelta( delta.x, delta.y );
        }
        m_lastMousePos = mouse;
        m_hasLastMouse = true;
    }

    bool_t Camera::OnResize( uint32_t width, uint32_t height )
    {
        if( width == 0 || height == 0 )
            return false;
        m_aspectRatio = static_cast<float>( width ) / static_cast<float>( height );
        return true;
    }

    void Camera::AutoFit( const glm::vec3& boundsMin, const glm::vec3& boundsMax )
    {
        float diagonal = glm::length( boundsMax - boundsMin );
        m_target       = ( boundsMin + boundsMax ) * 0.5f;
        m_distance     = std::max( diagonal * 2.0f, MIN_DISTANCE );

        // Every corner lies within diagonal / 2 of the target, so depths span [distance - diagonal / 2, distance + diagonal / 2]
        m_nearClip = std::min( m_initialNearClip, m_distance * 0.5f );
        m_farClip  = std::max( m_initialFarClip, m_distance + diagonal );
    }
} // namespace DotObjViewer
