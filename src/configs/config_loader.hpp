#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "system_config.hpp"
#include <string>

namespace MarketDesk {
namespace Core {

class ConfigLoader {
public:
    // Load key,value CSV into a SystemConfig. Unknown keys are ignored.
    static Config::SystemConfig load_from_csv(const std::string& csv_path);

    // Apply RH_* and LIVE environment variables on top of file values.
    static void apply_environment_overrides(Config::SystemConfig& config);

    // Throws ConfigurationError describing the first invalid value.
    static void validate(const Config::SystemConfig& config);

    // load_from_csv + apply_environment_overrides + validate.
    static Config::SystemConfig load_system_config(const std::string& csv_path);

    static void apply_setting(const std::string& key, const std::string& value, Config::SystemConfig& config);

private:
    static std::string trim(const std::string& str);
    static bool to_bool(const std::string& str);
    static int to_int(const std::string& key, const std::string& value);
    static std::string strip_trailing_slashes(const std::string& url);
};

} // namespace Core
} // namespace MarketDesk

#endif // CONFIG_LOADER_HPP
