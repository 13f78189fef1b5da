#ifndef GYMFACE_CONFIG_H
#define GYMFACE_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <vector>
#include <istream>

namespace gymface {

// INI-style configuration: [section] headers, "key = value" pairs, '#' or ';' comments
class Config {
public:
    Config() = default;

    bool load(const std::string& path);
    bool loadFromString(const std::string& text);

    std::optional<std::string> getString(const std::string& section, const std::string& key) const;
    std::optional<int> getInt(const std::string& section, const std::string& key) const;
    std::optional<double> getDouble(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;

    void set(const std::string& section, const std::string& key, const std::string& value);

    // Validation errors from the last load
    std::vector<std::string> getValidationErrors() const { return validation_errors_; }

private:
    std::map<std::string, std::map<std::string, std::string>> data_;
    std::vector<std::string> validation_errors_;

    bool parse(std::istream& in);
    std::string trim(const std::string& str) const;
    bool validate();
    bool validateInt(const std::string& section, const std::string& key, int min_val, int max_val);
    bool validateDouble(const std::string& section, const std::string& key, double min_val, double max_val);
};

} // namespace gymface

#endif // GYMFACE_CONFIG_H
