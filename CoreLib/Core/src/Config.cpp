#include "Config.hpp"

#include "Light.hpp"
#include "LightHelperBuilders.hpp"

namespace config
{

    void registerLightHelpers(ItemFactory<LightHelperBuilder>& factory)
    {
        factory.registerItem(kindKey(LightKind::Point), factory.createItemType<PointHelperBuilder>);
        factory.registerItem(kindKey(LightKind::Spot), factory.createItemType<SpotHelperBuilder>);
        factory.registerItem(kindKey(LightKind::Directional), factory.createItemType<DirectionalHelperBuilder>);
        factory.registerItem(kindKey(LightKind::Area), factory.createItemType<AreaHelperBuilder>);
    }

} // namespace config
