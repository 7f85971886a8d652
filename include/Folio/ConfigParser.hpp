// =================================================================
// include/Folio/ConfigParser.hpp
// =================================================================
// Defines a parser for the optional .folio.yml configuration file.

#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace Folio {

class ConfigParser {
public:
    /// File looked up in the input directory when no --config is given
    static constexpr const char* DEFAULT_CONFIG_FILE = ".folio.yml";

    ConfigParser() = default;

    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * A missing file leaves the parser empty. A malformed file is reported
     * as a warning and also leaves it empty.
     * @param config_path The path to the YAML file.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Builds a parser from YAML text instead of a file.
     */
    static ConfigParser fromString(const std::string& yaml_text);

    bool isLoaded() const { return m_loaded; }
    const std::string& getPath() const { return m_path; }

    bool hasKey(const std::string& key) const;

    /**
     * @brief Retrieves a scalar value for a dotted key.
     * @param key The configuration key (e.g., "title").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a list of strings; a single scalar is returned as a one-element list.
     */
    std::vector<std::string> getStringList(const std::string& key) const;

    /**
     * @brief Retrieves a boolean (true/false, yes/no, on/off).
     */
    bool getBoolValue(const std::string& key, bool default_value) const;

private:
    YAML::Node m_root;
    std::string m_path;
    bool m_loaded = false;

    YAML::Node lookup(const std::string& key) const;
};

} // namespace Folio
