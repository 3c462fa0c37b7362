//
//  CoreTypes.hpp
//  Core
//
// Public enums shared by the core and its hosts.

#pragma once

enum class ViewMode
{
    PERSPECTIVE,
    TOP,
    BOTTOM,
    FRONT,
    BACK,
    LEFT,
    RIGHT
};

/// Pointer event in viewport pixels (top-left origin, y down).
struct CoreEvent
{
    int   button    = 0;
    float x         = 0.0f;
    float y         = 0.0f;
    float deltaX    = 0.0f;
    float deltaY    = 0.0f;
    bool  shift_key = false;
    bool  ctrl_key  = false;
    bool  alt_key   = false;
    bool  dbl_click = false;
};
