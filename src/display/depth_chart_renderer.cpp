#include "depth_chart_renderer.hpp"
#include "display/text_formatters.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace MarketDesk {
namespace Display {

DepthChartRenderer::DepthChartRenderer(const Config::DisplayConfig& display_config_ref)
    : display_config(display_config_ref) {}

std::vector<int> DepthChartRenderer::compute_bar_lengths(const std::vector<Core::OrderBookLevel>& levels, int width) {
    double max_size = 0.0;
    for (const Core::OrderBookLevel& level : levels) {
        max_size = std::max(max_size, level.size);
    }

    std::vector<int> bar_lengths;
    bar_lengths.reserve(levels.size());
    for (const Core::OrderBookLevel& level : levels) {
        if (max_size <= 0.0 || level.size <= 0.0) {
            bar_lengths.push_back(0);
            continue;
        }
        int bar_length = static_cast<int>(std::lround(level.size / max_size * width));
        bar_lengths.push_back(std::max(bar_length, 1));
    }
    return bar_lengths;
}

int DepthChartRenderer::compute_price_column_width(const std::vector<Core::OrderBookLevel>& levels) {
    size_t price_width = static_cast<size_t>(PRICE_COLUMN_WIDTH);
    for (const Core::OrderBookLevel& level : levels) {
        price_width = std::max(price_width, format_decimal(level.price, 2).size());
    }
    return static_cast<int>(price_width);
}

std::string DepthChartRenderer::render_depth_chart(const Core::OrderBook& order_book) const {
    const int bar_width = display_config.depth_width;
    const size_t level_cap = static_cast<size_t>(display_config.depth_levels);

    std::vector<Core::OrderBookLevel> bids(order_book.bids.begin(),
                                           order_book.bids.begin() + std::min(level_cap, order_book.bids.size()));
    std::vector<Core::OrderBookLevel> asks(order_book.asks.begin(),
                                           order_book.asks.begin() + std::min(level_cap, order_book.asks.size()));

    std::ostringstream chart_stream;
    chart_stream << order_book.symbol << " depth | Mid: " << format_optional_decimal(order_book.mid_price, 2, PLACEHOLDER);

    if (bids.empty() && asks.empty()) {
        chart_stream << "\nNo depth available";
        return chart_stream.str();
    }

    std::vector<int> bid_lengths = compute_bar_lengths(bids, bar_width);
    std::vector<int> ask_lengths = compute_bar_lengths(asks, bar_width);
    const size_t row_count = std::max(bids.size(), asks.size());
    const int price_width = std::max(compute_price_column_width(bids), compute_price_column_width(asks));
    const std::string blank_bid_cell(static_cast<size_t>(bar_width + 1 + price_width), ' ');
    const std::string blank_ask_cell(static_cast<size_t>(price_width + 1 + bar_width), ' ');

    for (size_t row_index = 0; row_index < row_count; ++row_index) {
        chart_stream << "\n";
        if (row_index < bids.size()) {
            std::string bid_bar(static_cast<size_t>(bid_lengths[row_index]), BAR_UNIT);
            chart_stream << std::setw(bar_width) << std::left << bid_bar << " "
                         << std::setw(price_width) << std::right << format_decimal(bids[row_index].price, 2);
        } else {
            chart_stream << blank_bid_cell;
        }

        chart_stream << " | ";

        if (row_index < asks.size()) {
            std::string ask_bar(static_cast<size_t>(ask_lengths[row_index]), BAR_UNIT);
            chart_stream << std::setw(price_width) << std::left << format_decimal(asks[row_index].price, 2) << " "
                         << std::setw(bar_width) << std::left << ask_bar;
        } else {
            chart_stream << blank_ask_cell;
        }
    }
    return chart_stream.str();
}

} // namespace Display
} // namespace MarketDesk
