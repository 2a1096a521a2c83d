#pragma once

#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <fstream>
#include <cstdint>

namespace chunkrelay::core {

class Config {
public:
    Config() = default;

    static Config& instance();

    bool load_from_file(const std::string& filename);

    // Overrides "a.b" keys with CHUNKRELAY_A_B environment variables when set.
    void load_from_environment();

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    int get_int(const std::string& key, int default_value = 0) const;
    uint64_t get_uint64(const std::string& key, uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string> values_;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    std::string trim(const std::string& str) const;
};

} // namespace chunkrelay::core
