#pragma once

#include "ItemFactory.hpp"

class LightHelperBuilder;

namespace config
{

    /**
     * @brief Register the viewport helper builder of every light kind.
     *
     * Keys are the kindKey() strings ("point", "spot", "directional",
     * "area"). Ambient lights have no helper and no entry.
     *
     * Typical usage:
     * @code
     * ItemFactory<LightHelperBuilder> builders;
     * registerLightHelpers(builders);
     * @endcode
     *
     * @param factory Factory instance that will receive the builders.
     */
    void registerLightHelpers(ItemFactory<LightHelperBuilder>& factory);

} // namespace config
