// EN: Implementation of the ConfigManager class. YAML parsing, validation and environment overrides.
// FR: Implémentation de la classe ConfigManager. Parsing YAML, validation et surcharges d'environnement.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <regex>
#include <sstream>
#include <type_traits>

#include <unistd.h>

extern char** environ;

namespace PHR {

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        if (!loadNode(YAML::LoadFile(filename))) {
            LOG_ERROR("config", "Configuration root must be a mapping: " + filename);
            return false;
        }

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!loadNode(YAML::Load(yaml_content))) {
            LOG_ERROR("config", "Configuration root must be a mapping");
            return false;
        }
        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Top-level keys are sections; a scalar at the top level lands in section "default".
// FR: Les clés de premier niveau sont des sections ; un scalaire de premier niveau va dans "default".
bool ConfigManager::loadNode(const YAML::Node& yaml) {
    if (yaml.IsNull()) {
        sections_.clear();
        return true;
    }
    if (!yaml.IsMap()) {
        return false;
    }

    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();

        if (section.second.IsMap()) {
            ConfigSection& config_section = loaded[section_name];
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            loaded["default"].set(section_name, parseYamlValue(section.second));
        }
    }

    sections_ = std::move(loaded);
    return true;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    if (node.IsScalar()) {
        // EN: Quoted scalars carry the "!" tag and always stay strings.
        // FR: Les scalaires entre guillemets portent le tag "!" et restent des chaînes.
        if (node.Tag() == "!") {
            return ConfigValue(expandVariables(node.Scalar()));
        }
        return parseScalar(expandVariables(node.Scalar()));
    }

    return ConfigValue();
}

ConfigValue ConfigManager::parseScalar(const std::string& raw) {
    if (raw == "true" || raw == "false") {
        return ConfigValue(raw == "true");
    }

    if (!raw.empty()) {
        errno = 0;
        char* end = nullptr;
        long int_val = std::strtol(raw.c_str(), &end, 10);
        if (end && *end == '\0' && errno == 0 &&
            int_val >= std::numeric_limits<int>::min() &&
            int_val <= std::numeric_limits<int>::max()) {
            return ConfigValue(static_cast<int>(int_val));
        }

        errno = 0;
        end = nullptr;
        double double_val = std::strtod(raw.c_str(), &end);
        if (end && *end == '\0' && errno == 0) {
            return ConfigValue(double_val);
        }
    }

    return ConfigValue(raw);
}

// EN: PHR_RUNNER_SHELL=/bin/bash overrides runner.shell; PHR_TASKFILE=x sets default.taskfile.
// FR: PHR_RUNNER_SHELL=/bin/bash surcharge runner.shell ; PHR_TASKFILE=x définit default.taskfile.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t applied = 0;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        size_t eq_pos = entry.find('=');
        if (eq_pos == std::string::npos || eq_pos <= prefix.size()) {
            continue;
        }

        std::string path = entry.substr(prefix.size(), eq_pos - prefix.size());
        std::string raw_value = entry.substr(eq_pos + 1);
        std::transform(path.begin(), path.end(), path.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::string section = "default";
        std::string key = path;
        size_t underscore = path.find('_');
        if (underscore != std::string::npos && underscore > 0 && underscore + 1 < path.size()) {
            section = path.substr(0, underscore);
            key = path.substr(underscore + 1);
        }

        sections_[section].set(key, parseScalar(raw_value));
        ++applied;
        LOG_DEBUG("config", "Environment override applied: " + section + "." + key);
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        const auto [section_name, key_name] = splitKey(rule.key);
        ConfigValue value = lookupLocked(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

std::pair<std::string, std::string> ConfigManager::splitKey(const std::string& key) {
    const size_t dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        return {"default", key};
    }
    return {key.substr(0, dot_pos), key.substr(dot_pos + 1)};
}

ConfigValue ConfigManager::get(const std::string& key) const {
    const auto [section, name] = splitKey(key);
    return get(section, name);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupLocked(section, key);
}

ConfigValue ConfigManager::lookupLocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    const auto [section, name] = splitKey(key);
    set(section, name, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    const auto [section, name] = splitKey(key);
    return has(section, name);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.has(key);
    }
    return false;
}

void ConfigManager::remove(const std::string& key) {
    const auto [section, name] = splitKey(key);
    remove(section, name);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        auto found = std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value);
        if (found == rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);

        // EN: Unknown variables are left as written.
        // FR: Les variables inconnues restent telles quelles.
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace PHR
