// EN: Sectioned runner configuration loaded from YAML with environment overrides.
// FR: Configuration du runner par sections, chargée depuis YAML avec surcharges d'environnement.

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace PHR {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: String literals must not decay to bool.
    // FR: Les littéraux chaîne ne doivent pas être convertis en bool.
    ConfigValue(const char* value) : value_(std::string(value)) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance une exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        const T* typed = std::get_if<T>(&*value_);
        if (!typed) {
            throw std::runtime_error("ConfigValue type mismatch");
        }
        return *typed;
    }

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        const T* typed = std::get_if<T>(&*value_);
        if (!typed) {
            return std::nullopt;
        }
        return *typed;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing, validation and environment overrides.
// FR: Gestionnaire de configuration principal avec parsing YAML, validation et surcharges d'environnement.
class ConfigManager {
public:
    // EN: Validation rule for one "section.key" value.
    // FR: Règle de validation pour une valeur "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file (replaces the current sections).
    // FR: Charge la configuration depuis un fichier YAML (remplace les sections actuelles).
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string.
    // FR: Charge la configuration depuis une chaîne YAML.
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply PREFIX_SECTION_KEY environment variables as overrides; returns the number applied.
    // FR: Applique les variables PREFIX_SECTION_KEY comme surcharges ; retourne le nombre appliqué.
    size_t loadEnvironmentOverrides(const std::string& prefix = "PHR_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    // EN: Single-key forms take "section.key"; a key without a dot lives in section "default".
    // FR: Les formes à clé unique prennent "section.clé" ; une clé sans point est dans la section "default".
    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& key);
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données et règles de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

    // EN: Convert a raw string (environment value) to the narrowest ConfigValue.
    // FR: Convertit une chaîne brute (valeur d'environnement) en ConfigValue le plus précis.
    static ConfigValue parseScalar(const std::string& raw);

    static std::pair<std::string, std::string> splitKey(const std::string& key);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadNode(const YAML::Node& yaml);
    ConfigValue lookupLocked(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${ENV} references in configuration strings.
    // FR: Étend les références ${ENV} dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

} // namespace PHR
