/*
 * JSON Utilities
 *
 * Thin helpers around nlohmann/json for reading loosely typed messages
 * coming from browsers and DevTools without throwing on missing keys.
 */

#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include <nlohmann/json.hpp>
#include <string>

namespace json_utils {

using json = nlohmann::json;

/**
 * Parse JSON text
 * @throws nlohmann::json::parse_error on invalid JSON
 */
json parse(const std::string& str);

/**
 * Parse JSON text without throwing
 * @param str JSON text
 * @param out Parsed value on success
 * @param error Parser message on failure
 * @return true if the text parsed
 */
bool try_parse(const std::string& str, json& out, std::string& error);

// Compact (-1) or indented dump
std::string to_string(const json& j, int indent = -1);

std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val = "");

int get_int(const json& j, const std::string& key, int default_val = 0);

/**
 * Get a number of any JSON numeric kind as double
 * Numeric strings ("12.5") are accepted as well, browsers sometimes send them.
 */
double get_double(const json& j, const std::string& key, double default_val = 0.0);

bool get_bool(const json& j, const std::string& key, bool default_val = false);

bool has_key(const json& j, const std::string& key);

/**
 * Parse JSON file
 * @throws std::exception on file read or parse error
 */
json parse_file(const std::string& path);

} // namespace json_utils

#endif // JSON_UTILS_H
