/*
 * sandkernel C++ - Configuration
 *
 * JSON configuration with dotted-key access ("limits.max_memory_mb").
 */
#ifndef sandkernel_CORE_CONFIG_HPP
#define sandkernel_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace sandkernel {

class Config {
public:
    Config();

    bool load_file(const std::string& path);
    bool load_string(const std::string& content);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> get_string_list(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);

    const Json& raw() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* lookup(const std::string& key) const;
    Json& lookup_or_create(const std::string& key);

    Json data_;
    std::string last_error_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_CONFIG_HPP
