#ifndef DISPLAY_CONFIG_HPP
#define DISPLAY_CONFIG_HPP

namespace MarketDesk {
namespace Config {

struct DisplayConfig {
    int depth_width;       // bar units for the widest level on each side
    int depth_levels;      // levels drawn per side

    DisplayConfig() : depth_width(18), depth_levels(12) {}
};

} // namespace Config
} // namespace MarketDesk

#endif // DISPLAY_CONFIG_HPP
