// include/macross/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "macross/core/error.hpp"

namespace macross {

/**
 * @brief Base class for all configuration types
 * Provides common JSON file persistence on top of to_json()/from_json()
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON, keys that are absent keep their value
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace macross
