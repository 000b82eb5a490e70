/*
 * warden C++17 - Configuration
 *
 * JSON-backed configuration with dotted-key access:
 *   cfg.get_int("sleep.max_ms", 5000)  ->  {"sleep": {"max_ms": ...}}
 */
#ifndef warden_CORE_CONFIG_HPP
#define warden_CORE_CONFIG_HPP

#include <warden/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace warden {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load from a JSON file. Returns false (and keeps the previous
    // contents) if the file is missing or not valid JSON.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> get_string_list(const std::string& key,
                                             const std::vector<std::string>& default_val) const;

    // Raw sub-document; null Json if absent
    Json get_json(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);
    void set_json(const std::string& key, const Json& value);

    const Json& data() const { return data_; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);

    Json data_;
    std::string path_;
    std::string last_error_;
};

} // namespace warden

#endif // warden_CORE_CONFIG_HPP
