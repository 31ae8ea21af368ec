#include "renderer/Camera.hpp"
#include <cmath>
#include <glm/gtc/constants.hpp>
#include <gtest/gtest.h>

using namespace DotObjViewer;

class CameraTest : public ::testing::Test
{
protected:
    Camera camera{ glm::radians( 45.0f ), 16.0f / 9.0f, 0.1f, 1000.0f };
};

// =================================================================================================
// Orbit
// =================================================================================================

TEST_F( CameraTest, DefaultsLookAtOriginFromPositiveZ )
{
    EXPECT_FLOAT_EQ( camera.GetDistance(), 5.0f );
    EXPECT_FLOAT_EQ( camera.GetYaw(), 0.0f );
    EXPECT_FLOAT_EQ( camera.GetPitch(), 0.0f );

    glm::vec3 pos = camera.GetPosition();
    EXPECT_NEAR( pos.x, 0.0f, 1e-5f );
    EXPECT_NEAR( pos.y, 0.0f, 1e-5f );
    EXPECT_NEAR( pos.z, 5.0f, 1e-5f );
}

TEST_F( CameraTest, OrbitDeltaScalesBySensitivity )
{
    camera.ApplyOrbitDelta( 10.0f, -20.0f );

    EXPECT_NEAR( camera.GetYaw(), 0.1f, 1e-6f );
    EXPECT_NEAR( camera.GetPitch(), -0.2f, 1e-6f );
}

TEST_F( CameraTest, PitchIsClampedBothWays )
{
    camera.ApplyOrbitDelta( 0.0f, 10000.0f );
    EXPECT_FLOAT_EQ( camera.GetPitch(), Camera::PITCH_LIMIT );

    camera.ApplyOrbitDelta( 0.0f, -100000.0f );
    EXPECT_FLOAT_EQ( camera.GetPitch(), -Camera::PITCH_LIMIT );

    // Clamping does not swallow later movement back towards the horizon
    camera.ApplyOrbitDelta( 0.0f, 50.0f );
    EXPECT_NEAR( camera.GetPitch(), -Camera::PITCH_LIMIT + 0.5f, 1e-5f );
}

TEST_F( CameraTest, YawIsNotWrapped )
{
    for( int i = 0; i < 10; ++i )
    {
        camera.ApplyOrbitDelta( 100.0f, 0.0f );
    }
    EXPECT_NEAR( camera.GetYaw(), 10.0f, 1e-4f );
}

TEST_F( CameraTest, PositionStaysOnSphereAroundTarget )
{
    camera.ApplyOrbitDelta( 123.0f, 45.0f );

    glm::vec3 offset = camera.GetPosition() - camera.GetTarget();
    EXPECT_NEAR( glm::length( offset ), camera.GetDistance(), 1e-4f );

    // Pitch below the limit keeps the camera off the poles
    EXPECT_LT( std::abs( offset.y ), camera.GetDistance() );
}

TEST_F( CameraTest, DragOnlyOrbitsWhileButtonHeld )
{
    camera.OnCursorMoved( 100.0f, 100.0f );
    camera.OnCursorMoved( 200.0f, 200.0f );
    EXPECT_FLOAT_EQ( camera.GetYaw(), 0.0f ) << "Cursor motion without a pressed button must not orbit";

    camera.OnOrbitButton( true );
    EXPECT_TRUE( camera.IsOrbiting() );

    // First sample of a drag only records the position
    camera.OnCursorMoved( 200.0f, 200.0f );
    EXPECT_FLOAT_EQ( camera.GetYaw(), 0.0f );

    camera.OnCursorMoved( 250.0f, 210.0f );
    EXPECT_NEAR( camera.GetYaw(), 0.5f, 1e-6f );
    EXPECT_NEAR( camera.GetPitch(), 0.1f, 1e-6f );

    camera.OnOrbitButton( false );
    EXPECT_FALSE( camera.IsOrbiting() );

    // A new drag starting far away does not jump
    camera.OnOrbitButton( true );
    camera.OnCursorMoved( 900.0f, 900.0f );
    EXPECT_NEAR( camera.GetYaw(), 0.5f, 1e-6f );
}

// =================================================================================================
// Zoom
// =================================================================================================

TEST_F( CameraTest, ZoomUnitsUseTheirOwnStep )
{
    camera.ApplyZoomDelta( 2.0f, ScrollUnit::LINE );
    EXPECT_NEAR( camera.GetDistance(), 4.0f, 1e-6f );

    camera.ApplyZoomDelta( -100.0f, ScrollUnit::PIXEL );
    EXPECT_NEAR( camera.GetDistance(), 5.0f, 1e-5f );
}

TEST_F( CameraTest, ZoomIsClampedToRange )
{
    camera.ApplyZoomDelta( 1000.0f, ScrollUnit::LINE );
    EXPECT_FLOAT_EQ( camera.GetDistance(), Camera::MIN_DISTANCE );

    camera.ApplyZoomDelta( -1000.0f, ScrollUnit::LINE );
    EXPECT_FLOAT_EQ( camera.GetDistance(), Camera::MAX_DISTANCE );
}

// =================================================================================================
// Resize & Projection
// =================================================================================================

TEST_F( CameraTest, ResizeUpdatesAspectRatio )
{
    EXPECT_TRUE( camera.OnResize( 800, 400 ) );
    EXPECT_FLOAT_EQ( camera.GetAspectRatio(), 2.0f );
}

TEST_F( CameraTest, ZeroAreaResizeIsIgnored )
{
    float aspect = camera.GetAspectRatio();

    EXPECT_FALSE( camera.OnResize( 0, 600 ) );
    EXPECT_FALSE( camera.OnResize( 800, 0 ) );
    EXPECT_FLOAT_EQ( camera.GetAspectRatio(), aspect );
}

TEST_F( CameraTest, ProjectionFlipsYAndMapsDepthToUnitRange )
{
    glm::mat4 proj = Camera::Perspective( glm::radians( 90.0f ), 1.0f, 1.0f, 10.0f );

    EXPECT_LT( proj[ 1 ][ 1 ], 0.0f ) << "Vulkan clip space has Y pointing down";

    glm::vec4 nearPoint = proj * glm::vec4( 0.0f, 0.0f, -1.0f, 1.0f );
    glm::vec4 farPoint  = proj * glm::vec4( 0.0f, 0.0f, -10.0f, 1.0f );
    EXPECT_NEAR( nearPoint.z / nearPoint.w, 0.0f, 1e-5f );
    EXPECT_NEAR( farPoint.z / farPoint.w, 1.0f, 1e-5f );
}

TEST_F( CameraTest, TargetProjectsToScreenCenter )
{
    camera.ApplyOrbitDelta( 40.0f, 30.0f );

    glm::vec4 clip = camera.GetViewProjection() * glm::vec4( camera.GetTarget(), 1.0f );
    EXPECT_NEAR( clip.x / clip.w, 0.0f, 1e-5f );
    EXPECT_NEAR( clip.y / clip.w, 0.0f, 1e-5f );
}

// =================================================================================================
// Auto Fit
// =================================================================================================

TEST_F( CameraTest, AutoFitUnitCube )
{
    camera.AutoFit( glm::vec3( -0.5f ), glm::vec3( 0.5f ) );

    EXPECT_NEAR( camera.GetTarget().x, 0.0f, 1e-6f );
    EXPECT_NEAR( camera.GetTarget().y, 0.0f, 1e-6f );
    EXPECT_NEAR( camera.GetTarget().z, 0.0f, 1e-6f );
    EXPECT_NEAR( camera.GetDistance(), 2.0f * std::sqrt( 3.0f ), 1e-5f );
}

TEST_F( CameraTest, AutoFitCentersOffsetBounds )
{
    camera.AutoFit( glm::vec3( 10.0f, 0.0f, -4.0f ), glm::vec3( 12.0f, 2.0f, -2.0f ) );

    EXPECT_NEAR( camera.GetTarget().x, 11.0f, 1e-5f );
    EXPECT_NEAR( camera.GetTarget().y, 1.0f, 1e-5f );
    EXPECT_NEAR( camera.GetTarget().z, -3.0f, 1e-5f );
}

TEST_F( CameraTest, AutoFitSinglePointKeepsMinimumDistance )
{
    camera.AutoFit( glm::vec3( 1.0f ), glm::vec3( 1.0f ) );
    EXPECT_FLOAT_EQ( camera.GetDistance(), Camera::MIN_DISTANCE );
}

TEST_F( CameraTest, AutoFitKeepsOrientation )
{
    camera.ApplyOrbitDelta( 30.0f, 20.0f );
    float yaw   = camera.GetYaw();
    float pitch = camera.GetPitch();

    camera.AutoFit( glm::vec3( -1.0f ), glm::vec3( 1.0f ) );

    EXPECT_FLOAT_EQ( camera.GetYaw(), yaw );
    EXPECT_FLOAT_EQ( camera.GetPitch(), pitch );
}

TEST_F( CameraTest, AutoFitWidensFarPlaneForLargeModels )
{
    camera.AutoFit( glm::vec3( -300.0f ), glm::vec3( 300.0f ) );

    float diagonal = std::sqrt( 3.0f ) * 600.0f;
    EXPECT_NEAR( camera.GetDistance(), 2.0f * diagonal, 1e-2f );
    EXPECT_GE( camera.GetFarClip(), camera.GetDistance() + diagonal * 0.5f );
    EXPECT_FLOAT_EQ( camera.GetNearClip(), 0.1f ) << "Zooming in on a large model must not clip it";
}

TEST_F( CameraTest, AutoFitRestoresClipPlanesForSmallModels )
{
    camera.AutoFit( glm::vec3( -300.0f ), glm::vec3( 300.0f ) );
    camera.AutoFit( glm::vec3( -0.5f ), glm::vec3( 0.5f ) );

    EXPECT_FLOAT_EQ( camera.GetNearClip(), 0.1f );
    EXPECT_FLOAT_EQ( camera.GetFarClip(), 1000.0f );
}

TEST_F( CameraTest, AutoFitKeepsBoundsInsideFrustum )
{
    struct Box
    {
        glm::vec3 min, max;
    };
    const Box boxes[] = {
        { glm::vec3( -0.5f ), glm::vec3( 0.5f ) },
        { glm::vec3( 10.0f, 0.0f, -4.0f ), glm::vec3( 12.0f, 2.0f, -2.0f ) },
        { glm::vec3( -300.0f ), glm::vec3( 300.0f ) },
        { glm::vec3( 0.0f, 0.0f, 0.0f ), glm::vec3( 1500.0f, 20.0f, 400.0f ) },
        { glm::vec3( 2.0f, 2.0f, 2.0f ), glm::vec3( 2.01f, 2.01f, 2.01f ) },
    };

    // Portrait sizes down to 3:4 still frame the box at distance = 2 * diagonal
    const glm::uvec2 sizes[]    = { { 768, 1024 }, { 1000, 1000 }, { 1024, 768 }, { 1920, 1080 } };
    const glm::vec2  rotations[] = { { 0.0f, 0.0f }, { 0.7f, 0.3f }, { -0.785f, 0.0f }, { 2.5f, -1.2f }, { 4.0f, 1.45f } };

    for( const Box& box: boxes )
    {
        for( const glm::uvec2& size: sizes )
        {
            for( const glm::vec2& rotation: rotations )
            {
                Camera fitted( glm::radians( 45.0f ), 1.0f, 0.1f, 1000.0f );
                ASSERT_TRUE( fitted.OnResize( size.x, size.y ) );
                fitted.ApplyOrbitDelta( rotation.x / Camera::ORBIT_SENSITIVITY, rotation.y / Camera::ORBIT_SENSITIVITY );
                fitted.AutoFit( box.min, box.max );

                for( const glm::vec3& corner: { box.min, box.max } )
                {
                    glm::vec4 clip = fitted.GetViewProjection() * glm::vec4( corner, 1.0f );
                    ASSERT_GT( clip.w, 0.0f );
                    glm::vec3 ndc = glm::vec3( clip ) / clip.w;

                    SCOPED_TRACE( testing::Message() << "box diagonal " << glm::length( box.max - box.min ) << ", size " << size.x << "x"
                                                     << size.y << ", yaw " << rotation.x << ", pitch " << rotation.y );
                    EXPECT_LE( std::abs( ndc.x ), 1.0f );
                    EXPECT_LE( std::abs( ndc.y ), 1.0f );
                    EXPECT_GE( ndc.z, 0.0f );
                    EXPECT_LE( ndc.z, 1.0f );
                }
            }
        }
    }
}
