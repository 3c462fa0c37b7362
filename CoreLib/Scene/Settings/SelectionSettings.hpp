//============================================================
// SelectionSettings.hpp
//============================================================
#pragma once

/**
 * @brief Pointer selection tuning.
 */
struct SelectionSettings
{
    // Movement beyond this many pixels between press and release turns the
    // gesture into a drag (camera orbit) and suppresses selection.
    float dragThresholdPx = 4.0f;
};
