/*
 * Warden C++ - Configuration Implementation
 */
#include <warden/core/config.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace warden {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "Cannot open config file: " + path;
        LOG_ERROR("[Config] %s", last_error_.c_str());
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (!load_string(content.str())) {
        LOG_ERROR("[Config] Failed to parse %s: %s", path.c_str(), last_error_.c_str());
        return false;
    }

    path_ = path;
    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            last_error_ = "top-level value must be an object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        return false;
    }
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return default_val;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        try {
            return std::stoll(v->get<std::string>());
        } catch (const std::exception&) {
            LOG_WARN("[Config] '%s' is not an integer, using default", key.c_str());
        }
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
    }
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    return default_val;
}

std::vector<std::string> Config::get_string_list(const std::string& key,
                                                 const std::vector<std::string>& default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_array()) return default_val;

    std::vector<std::string> out;
    for (size_t i = 0; i < v->size(); ++i) {
        if ((*v)[i].is_string()) {
            out.push_back((*v)[i].get<std::string>());
        }
    }
    return out;
}

Json Config::get_json(const std::string& key) const {
    const Json* v = find(key);
    return v ? *v : Json();
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

void Config::set_json(const std::string& key, const Json& value) {
    slot(key) = value;
}

} // namespace warden
