#include "chunkrelay/core/config.hpp"
#include <cctype>
#include <cstdlib>
#include <iterator>

namespace chunkrelay::core {

namespace {

std::string environment_name(const std::string& key) {
    std::string name = "CHUNKRELAY_";
    for (char c : key) {
        name += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

void Config::load_from_environment() {
    for (auto& [key, value] : values_) {
        if (const char* env = std::getenv(environment_name(key).c_str())) {
            value = env;
        }
    }
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

uint64_t Config::get_uint64(const std::string& key, uint64_t default_value) const {
    auto value = get_as<uint64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["transfer.chunk_size"] = "1048576";
    values_["transfer.buffer_chunks"] = "8";
    values_["transfer.session_timeout_s"] = "0";
    values_["retry.chunk_attempts"] = "5";
    values_["retry.metadata_attempts"] = "3";
    values_["retry.base_delay_ms"] = "1000";
    values_["retry.max_delay_ms"] = "30000";
    values_["retry.max_server_delay_s"] = "120";
    values_["http.connect_timeout_s"] = "15";
    values_["http.request_timeout_s"] = "120";
    values_["upload.part_size"] = "8388608";
    values_["graph.base_url"] = "https://graph.microsoft.com/v1.0";
    values_["auth.tenant_id"] = "";
    values_["auth.client_id"] = "";
    values_["auth.client_secret"] = "";
    values_["auth.token"] = "";
    values_["s3.region"] = "us-east-1";
    values_["s3.endpoint"] = "";
    values_["s3.access_key"] = "";
    values_["s3.secret_key"] = "";
    values_["s3.session_token"] = "";
    values_["gcs.token"] = "";
    values_["azure.account_name"] = "";
    values_["azure.account_key"] = "";
    values_["azure.sas_token"] = "";
    values_["azure.endpoint"] = "";
    values_["journal.path"] = "chunkrelay.db";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkrelay.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == str.end()) {
        return "";
    }

    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

}
