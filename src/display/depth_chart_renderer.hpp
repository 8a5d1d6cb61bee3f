#ifndef DEPTH_CHART_RENDERER_HPP
#define DEPTH_CHART_RENDERER_HPP

#include "configs/display_config.hpp"
#include "core/data_structures.hpp"
#include <string>
#include <vector>

namespace MarketDesk {
namespace Display {

/**
 * Two-column text depth chart. Bids on the left (bar padded on its right,
 * then the price), asks on the right. Level order is taken as received.
 * The price column is at least PRICE_COLUMN_WIDTH and widens for the whole
 * chart when any price needs more room.
 */
class DepthChartRenderer {
private:
    const Config::DisplayConfig& display_config;

public:
    static constexpr char BAR_UNIT = '#';
    static constexpr int PRICE_COLUMN_WIDTH = 8;

    explicit DepthChartRenderer(const Config::DisplayConfig& display_config_ref);

    std::string render_depth_chart(const Core::OrderBook& order_book) const;

    // round(size / max_size * width), at least 1 for a non-zero size. Scaled per side.
    static std::vector<int> compute_bar_lengths(const std::vector<Core::OrderBookLevel>& levels, int width);
    static int compute_price_column_width(const std::vector<Core::OrderBookLevel>& levels);
};

} // namespace Display
} // namespace MarketDesk

#endif // DEPTH_CHART_RENDERER_HPP
