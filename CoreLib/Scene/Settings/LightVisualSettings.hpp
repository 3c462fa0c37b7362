//============================================================
// LightVisualSettings.hpp
//============================================================
#pragma once

#include <cstdint>

/**
 * @brief Tuning of the viewport representation of managed lights.
 */
struct LightVisualSettings
{
    // --------------------------------------------------------
    // Intensity fan-out
    // helper opacity = clamp(intensity * gain, min, max)
    // helper scale   = clamp(base + intensity * gain, min, max)
    // proxy emissive = min(intensity * gain, max)
    // --------------------------------------------------------
    float helperOpacityGain = 0.8f;
    float helperOpacityMin  = 0.2f;
    float helperOpacityMax  = 0.9f;

    float helperScaleBase = 0.75f;
    float helperScaleGain = 0.25f;
    float helperScaleMin  = 0.5f;
    float helperScaleMax  = 2.0f;

    float emissiveGain = 0.5f;
    float emissiveMax  = 2.0f;

    // --------------------------------------------------------
    // Helper shapes
    // --------------------------------------------------------
    float selectorRadius         = 0.1f;
    float directionLength        = 1.0f;
    float axesLength             = 0.5f;
    float cornerMarkerSize       = 0.15f;
    float infiniteRangeIndicator = 1.0f; // drawn radius/length when distance is 0

    int32_t rangeSegments = 32; // per circle of the range sphere
    int32_t coneSegments  = 24;
    int32_t coneSpokes    = 6;
    int32_t selectorRings = 8;
    int32_t selectorSides = 16;

    // --------------------------------------------------------
    // Area light emissive proxy
    // --------------------------------------------------------
    float proxyOpacity = 0.8f;
};
