#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

// Applies key,value overrides from one CSV file. Returns false when the file cannot be opened;
// throws std::runtime_error naming the key when a value is malformed.
bool load_config_from_csv(ConfluenceScalper::Config::SystemConfig& cfg, const std::string& csv_path);

// Loads every known CSV present under config_directory and validates the result. Returns 0 on success.
int load_system_config(ConfluenceScalper::Config::SystemConfig& config, const std::string& config_directory);

bool validate_config(const ConfluenceScalper::Config::SystemConfig& config, std::string& error_message);

#endif // CONFIG_LOADER_HPP
