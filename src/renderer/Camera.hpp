#pragma once
#include "core/Base.hpp"
#include <glm/glm.hpp>

namespace DotObjViewer
{
    // Scroll deltas come either in wheel notches or in trackpad pixels
    enum class ScrollUnit
    {
        LINE,
        PIXEL
    };

    /**
     * @brief Orbit Camera (Arcball style).
     * Rotates around a target point. The position is never stored, it is derived from
     * (distance, yaw, pitch) around the target every time it is needed.
     * Controls:
     * - Left Drag: Rotate (Orbit)
     * - Scroll: Zoom (Distance)
     */
    class Camera
    {
    public:
        static constexpr float ORBIT_SENSITIVITY = 0.01f; // Radians per pixel
        static constexpr float PITCH_LIMIT       = 1.5f;
        static constexpr float MIN_DISTANCE      = 0.1f;
        static constexpr float MAX_DISTANCE      = 100.0f;
        static constexpr float ZOOM_PER_LINE     = 0.5f;
        static constexpr float ZOOM_PER_PIXEL    = 0.01f;

        /**
         * @param fov Vertical field of view in radians.
         */
        Camera( float fov, float aspectRatio, float nearClip, float farClip );

        // Right-handed perspective with [0, 1] depth and the Vulkan Y flip
        static glm::mat4 Perspective( float fov, float aspectRatio, float nearClip, float farClip );

        glm::mat4 GetView() const;
        glm::mat4 GetProjection() const;
        glm::mat4 GetViewProjection() const { return GetProjection() * GetView(); }
        glm::vec3 GetPosition() const;

        const glm::vec3& GetTarget() const { return m_target; }
        const glm::vec3& GetUp() const { return m_up; }
        float            GetDistance() const { return m_distance; }
        float            GetYaw() const { return m_yaw; }
        float            GetPitch() const { return m_pitch; }
        float            GetFov() const { return m_fov; }
        float            GetAspectRatio() const { return m_aspectRatio; }
        float            GetNearClip() const { return m_nearClip; }
        float            GetFarClip() const { return m_farClip; }
        bool_t           IsOrbiting() const { return m_isOrbiting; }

        // Pointer deltas in pixels
        void ApplyOrbitDelta( float dx, float dy );

        // Positive deltas move the camera towards the target
        void ApplyZoomDelta( float delta, ScrollUnit unit );

        // --- Input ---
        void OnOrbitButton( bool pressed );
        void OnCursorMoved( float x, float y );

        /**
         * @brief Updates the aspect ratio to width / height.
         * @return false if the size has zero area, nothing changes then.
         */
        bool_t OnResize( uint32_t width, uint32_t height );

        /**
         * @brief Frames an axis aligned box: target = center, distance = 2 * diagonal.
         * The distance is kept above MIN_DISTANCE so a single point stays viewable.
         * The clip planes are widened from their initial values until the whole box fits in depth.
         */
        void AutoFit( const glm::vec3& boundsMin, const glm::vec3& boundsMax );

    private:
        float m_fov, m_aspectRatio, m_nearClip, m_farClip;
        float m_initialNearClip, m_initialFarClip;

        glm::vec3 m_target = { 0.0f, 0.0f, 0.0f };
        glm::vec3 m_up     = { 0.0f, 1.0f, 0.0f };

        // Spherical coordinates
        float m_distance = 5.0f;
        float m_yaw      = 0.0f;
        float m_pitch    = 0.0f;

        bool_t    m_isOrbiting   = false;
        bool_t    m_hasLastMouse = false;
        glm::vec2 m_lastMousePos = { 0.0f, 0.0f };
    };
} // namespace DotObjViewer
