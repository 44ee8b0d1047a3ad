#pragma once
#include <printrelay/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file.
     * @throws std::runtime_error if the file is missing, a required field is
     *         absent, a field has the wrong type or an invalid value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    /**
     * @brief Validate value ranges of an already populated configuration.
     * @throws std::runtime_error describing the first invalid field
     */
    static void validate(const AppConfig::AppConfiguration& config);
};
