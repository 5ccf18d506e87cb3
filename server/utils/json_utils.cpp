/*
 * JSON Utilities Implementation
 */

#include "json_utils.h"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace json_utils {

json parse(const std::string& str) {
    return json::parse(str);
}

bool try_parse(const std::string& str, json& out, std::string& error) {
    try {
        out = json::parse(str);
        return true;
    } catch (const json::parse_error& e) {
        error = e.what();
        return false;
    }
}

std::string to_string(const json& j, int indent) {
    return j.dump(indent);
}

std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return default_val;
    }

    return it->get<std::string>();
}

int get_int(const json& j, const std::string& key, int default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return default_val;
    }

    if (it->is_number_integer()) {
        return it->get<int>();
    }
    return static_cast<int>(it->get<double>());
}

double get_double(const json& j, const std::string& key, double default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end()) {
        return default_val;
    }

    if (it->is_number()) {
        return it->get<double>();
    }

    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        if (s.empty()) return default_val;
        char* end = nullptr;
        double v = strtod(s.c_str(), &end);
        if (end && *end == '\0') {
            return v;
        }
    }

    return default_val;
}

bool get_bool(const json& j, const std::string& key, bool default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return default_val;
    }

    return it->get<bool>();
}

bool has_key(const json& j, const std::string& key) {
    if (!j.is_object()) {
        return false;
    }

    return j.find(key) != j.end();
}

json parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    json j;
    file >> j;
    return j;
}

} // namespace json_utils
