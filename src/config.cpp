#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>

namespace gymface {

std::string Config::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        validation_errors_.clear();
        validation_errors_.push_back("Cannot open config file: " + path);
        return false;
    }
    return parse(file);
}

bool Config::loadFromString(const std::string& text) {
    std::istringstream in(text);
    return parse(in);
}

bool Config::parse(std::istream& in) {
    validation_errors_.clear();

    std::string line;
    std::string current_section;

    while (std::getline(in, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            data_[current_section][key] = value;
        }
    }

    bool valid = validate();

    if (!validation_errors_.empty()) {
        Logger::getInstance().warning("Configuration validation found " +
            std::to_string(validation_errors_.size()) + " issue(s):");
        for (const auto& error : validation_errors_) {
            Logger::getInstance().warning("  - " + error);
        }
    }

    return valid;
}

std::optional<std::string> Config::getString(const std::string& section, const std::string& key) const {
    auto section_it = data_.find(section);
    if (section_it == data_.end()) {
        return std::nullopt;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return std::nullopt;
    }

    return key_it->second;
}

std::optional<int> Config::getInt(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        int parsed = std::stoi(*value, &consumed);
        if (consumed != value->size()) return std::nullopt;
        return parsed;
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range: treat as unset
        return std::nullopt;
    }
}

std::optional<double> Config::getDouble(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        double parsed = std::stod(*value, &consumed);
        if (consumed != value->size()) return std::nullopt;
        return parsed;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<bool> Config::getBool(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        return true;
    } else if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        return false;
    }

    return std::nullopt;
}

void Config::set(const std::string& section, const std::string& key, const std::string& value) {
    data_[section][key] = value;
}

bool Config::validateInt(const std::string& section, const std::string& key, int min_val, int max_val) {
    auto raw = getString(section, key);
    if (!raw.has_value()) {
        return true;  // Optional value, not set
    }

    auto value = getInt(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " = '" + *raw + "' is not an integer");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateDouble(const std::string& section, const std::string& key, double min_val, double max_val) {
    auto raw = getString(section, key);
    if (!raw.has_value()) {
        return true;
    }

    auto value = getDouble(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " = '" + *raw + "' is not a number");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validate() {
    bool all_valid = true;

    // Anti-spoofing
    all_valid &= validateDouble("anti_spoofing", "min_liveness_score", 0.0, 1.0);

    // Recognition
    all_valid &= validateDouble("recognition", "tolerance", -1.0, 1.0);
    all_valid &= validateInt("recognition", "embedding_dimensions", 64, 2048);
    all_valid &= validateInt("recognition", "detection_size", 160, 1920);
    all_valid &= validateDouble("recognition", "detection_confidence", 0.05, 1.0);

    // Human-face validation
    all_valid &= validateInt("validation", "min_age", 0, 150);
    all_valid &= validateInt("validation", "max_age", 0, 150);
    all_valid &= validateDouble("validation", "min_face_size_ratio", 0.0, 1.0);
    all_valid &= validateDouble("validation", "max_face_angle", 0.0, 90.0);

    auto min_age = getInt("validation", "min_age");
    auto max_age = getInt("validation", "max_age");
    if (min_age && max_age && *min_age > *max_age) {
        validation_errors_.push_back("[validation].min_age must not exceed [validation].max_age");
        all_valid = false;
    }

    // Image limits
    all_valid &= validateDouble("image", "max_size_mb", 0.01, 100.0);
    all_valid &= validateInt("image", "max_pixels", 10000, 1000000000);
    all_valid &= validateInt("thumbnail", "width", 16, 1024);
    all_valid &= validateInt("thumbnail", "height", 16, 1024);
    all_valid &= validateInt("thumbnail", "quality", 1, 100);

    auto enabled = getString("anti_spoofing", "enabled");
    if (enabled && !getBool("anti_spoofing", "enabled").has_value()) {
        validation_errors_.push_back("[anti_spoofing].enabled = '" + *enabled + "' is not a boolean");
        all_valid = false;
    }

    return all_valid;
}

} // namespace gymface
