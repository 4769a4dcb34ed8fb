#include <sandkernel/core/config.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace sandkernel {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string content;
    if (!read_file(path, content)) {
        last_error_ = "cannot read " + path;
        return false;
    }
    return load_string(content);
}

bool Config::load_string(const std::string& content) {
    Json parsed = Json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        last_error_ = "configuration is not a JSON object";
        LOG_ERROR("[Config] %s", last_error_.c_str());
        return false;
    }
    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    for (const auto& part : split(key, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::lookup_or_create(const std::string& key) {
    Json* node = &data_;
    for (const auto& part : split(key, '.')) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[part];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    const Json* node = lookup(key);
    return node != nullptr && !node->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_string()) return default_val;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = lookup(key);
    if (!node) return default_val;
    if (node->is_number_unsigned()) {
        uint64_t v = node->get<uint64_t>();
        return v > static_cast<uint64_t>(INT64_MAX) ? INT64_MAX : static_cast<int64_t>(v);
    }
    if (node->is_number_integer()) return node->get<int64_t>();
    if (node->is_number_float()) {
        double v = node->get<double>();
        if (std::isnan(v)) return default_val;
        // Saturate: the cast is undefined outside the int64 range
        if (v >= 9.2233720368547758e18) return INT64_MAX;
        if (v <= -9.2233720368547758e18) return INT64_MIN;
        return static_cast<int64_t>(v);
    }
    if (node->is_string()) {
        const std::string s = node->get<std::string>();
        char* end = nullptr;
        long long v = strtoll(s.c_str(), &end, 10);
        if (end && *end == '\0' && !s.empty()) return static_cast<int64_t>(v);
        LOG_WARN("[Config] %s: '%s' is not an integer, using %lld",
                 key.c_str(), s.c_str(), static_cast<long long>(default_val));
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = lookup(key);
    if (!node) return default_val;
    if (node->is_boolean()) return node->get<bool>();
    if (node->is_string()) {
        std::string s = to_lower(node->get<std::string>());
        if (s == "true" || s == "yes" || s == "1") return true;
        if (s == "false" || s == "no" || s == "0") return false;
    }
    return default_val;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = lookup(key);
    if (!node) return out;
    if (node->is_string()) {
        out.push_back(node->get<std::string>());
        return out;
    }
    if (!node->is_array()) return out;
    for (const auto& item : *node) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

void Config::set_string(const std::string& key, const std::string& value) {
    lookup_or_create(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    lookup_or_create(key) = value;
}

} // namespace sandkernel
