/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop tools
 * 
 * Reads the subset of TOML used by farmfence configuration files into an
 * EngineConfig. Unknown sections and keys are ignored.
 * 
 * Supported Sections:
 * - [tracking]: sensor options, distance/accuracy filters, history capacity
 * - [proximity]: nearby radius
 * - [data]: zone, tree and track snapshot files
 * 
 * @note Simple line-based parser: no arrays, inline tables or multi-line strings
 */

#pragma once

#include <cmath>
#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include "domain/FieldTracker.hpp"

namespace farmfence {

/**
 * @brief TOML configuration file parser and validator
 * 
 * Missing files fall back to defaults with a warning. Values that are present
 * but unusable (non-numeric, negative radius, zero capacity) are rejected.
 */
class TomlConfig {
public:
    /**
     * @brief Load and parse a TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Engine configuration, defaults for anything not specified
     * @throws std::runtime_error if a value cannot be converted or is out of range
     */
    static domain::EngineConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        
        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << ", using defaults" << std::endl;
            return domain::EngineConfig{};
        }
        
        return parse(file);
    }

    /**
     * @brief Parse TOML text from a stream
     * @throws std::runtime_error if a value cannot be converted or is out of range
     */
    static domain::EngineConfig parse(std::istream& input) {
        domain::EngineConfig config;
        
        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            // Remove comments and trim whitespace
            size_t commentPos = line.find('#');
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }
            trim(line);
            
            if (line.empty()) {
                continue;
            }
            
            // Handle section headers
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }
            
            // Parse key = value
            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);
            
            if (currentSection == "tracking") {
                if (key == "enable_high_accuracy") {
                    config.stream.enableHighAccuracy = toBool(key, value);
                } else if (key == "timeout_ms") {
                    config.stream.timeoutMs = static_cast<uint32_t>(toUnsigned(key, value));
                } else if (key == "max_age_ms") {
                    config.stream.maxAgeMs = static_cast<uint32_t>(toUnsigned(key, value));
                } else if (key == "distance_filter_meters") {
                    config.stream.distanceFilterMeters = parseNonNegative(key, value);
                } else if (key == "max_accuracy_meters") {
                    config.stream.maxAccuracyMeters = parseNonNegative(key, value);
                } else if (key == "history_capacity") {
                    auto capacity = toUnsigned(key, value);
                    if (capacity == 0) {
                        throw std::runtime_error("[Config] history_capacity must be at least 1");
                    }
                    config.stream.historyCapacity = static_cast<size_t>(capacity);
                }
            } else if (currentSection == "proximity") {
                if (key == "radius_meters") {
                    config.proximityRadiusMeters = parseNonNegative(key, value);
                }
            } else if (currentSection == "data") {
                if (key == "zones_file") {
                    config.zonesFile = value;
                } else if (key == "trees_file") {
                    config.treesFile = value;
                } else if (key == "track_file") {
                    config.trackFile = value;
                }
            }
        }
        
        return config;
    }

    /**
     * @brief Convert a whole string to a non-negative number
     * @throws std::runtime_error naming the key on trailing text or a negative value
     */
    static double parseNonNegative(const std::string& key, const std::string& value) {
        double number = 0.0;
        try {
            size_t consumed = 0;
            number = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
        } catch (const std::exception&) {
            throw std::runtime_error("[Config] " + key + " is not a number: " + value);
        }
        if (!std::isfinite(number)) {
            throw std::runtime_error("[Config] " + key + " is not a finite number: " + value);
        }
        if (number < 0.0) {
            throw std::runtime_error("[Config] " + key + " must not be negative");
        }
        return number;
    }

private:
    static unsigned long toUnsigned(const std::string& key, const std::string& value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("[Config] " + key + " is not a non-negative integer: " + value);
        }
        try {
            return std::stoul(value);
        } catch (const std::out_of_range&) {
            throw std::runtime_error("[Config] " + key + " is out of range: " + value);
        }
    }

    static bool toBool(const std::string& key, const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::runtime_error("[Config] " + key + " is not a boolean: " + value);
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }
    
    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace farmfence
