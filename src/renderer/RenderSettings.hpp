#pragma once
#include "core/Base.hpp"

namespace DotObjViewer
{
    /**
     * @brief User toggles read by the compositor every frame.
     * Toggling twice restores the previous state.
     */
    struct RenderSettings
    {
        bool_t wireframe     = false;
        bool_t overlayDetail = false;

        void ToggleWireframe() { wireframe = !wireframe; }
        void ToggleOverlayDetail() { overlayDetail = !overlayDetail; }
    };
} // namespace DotObjViewer
