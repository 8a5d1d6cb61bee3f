#ifndef ORDERS_CONFIG_HPP
#define ORDERS_CONFIG_HPP

#include <string>

namespace MarketDesk {
namespace Config {

// What list_orders returns when live mode is off or credentials are missing.
enum class MockOrderPolicy {
    SYNTHETIC,
    EMPTY
};

struct OrdersConfig {
    MockOrderPolicy mock_policy;
    int max_limit;
    int default_limit;

    OrdersConfig() : mock_policy(MockOrderPolicy::SYNTHETIC), max_limit(20), default_limit(5) {}
};

MockOrderPolicy parse_mock_order_policy(const std::string& policy_name);

} // namespace Config
} // namespace MarketDesk

#endif // ORDERS_CONFIG_HPP
