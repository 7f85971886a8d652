// =================================================================
// src/Folio/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Folio/ConfigParser.hpp"
#include "Folio/Logger.hpp"
#include <filesystem>
#include <sstream>

namespace Folio {

ConfigParser::ConfigParser(const std::string& config_path)
    : m_path(config_path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        // No configuration file is fine; defaults apply.
        return;
    }

    try {
        m_root = YAML::LoadFile(config_path);
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().warning("ConfigParser",
            "Ignoring malformed configuration file: " + config_path, e.what());
        m_root = YAML::Node();
    }

    if (m_loaded && !m_root.IsNull() && !m_root.IsMap()) {
        Logger::getInstance().warning("ConfigParser",
            "Configuration file must contain a mapping: " + config_path);
        m_root = YAML::Node();
        m_loaded = false;
    }
}

ConfigParser ConfigParser::fromString(const std::string& yaml_text) {
    ConfigParser parser;
    try {
        parser.m_root = YAML::Load(yaml_text);
        parser.m_loaded = parser.m_root.IsMap();
    } catch (const YAML::Exception& e) {
        Logger::getInstance().warning("ConfigParser", "Ignoring malformed configuration", e.what());
    }
    if (!parser.m_loaded) {
        parser.m_root = YAML::Node();
    }
    return parser;
}

bool ConfigParser::hasKey(const std::string& key) const {
    return static_cast<bool>(lookup(key));
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    YAML::Node node = lookup(key);
    if (!node || !node.IsScalar()) {
        return "";
    }
    return node.as<std::string>();
}

std::vector<std::string> ConfigParser::getStringList(const std::string& key) const {
    std::vector<std::string> values;
    YAML::Node node = lookup(key);
    if (!node) {
        return values;
    }

    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }

    if (!node.IsSequence()) {
        Logger::getInstance().warning("ConfigParser", "Expected a list for '" + key + "'");
        return values;
    }

    for (const auto& item : node) {
        if (item.IsScalar()) {
            values.push_back(item.as<std::string>());
        } else {
            Logger::getInstance().warning("ConfigParser", "Skipping non-scalar entry in '" + key + "'");
        }
    }
    return values;
}

bool ConfigParser::getBoolValue(const std::string& key, bool default_value) const {
    YAML::Node node = lookup(key);
    if (!node || !node.IsScalar()) {
        return default_value;
    }

    try {
        return node.as<bool>();
    } catch (const YAML::BadConversion&) {
        Logger::getInstance().warning("ConfigParser",
            "Invalid boolean for '" + key + "', using default", node.Scalar());
        return default_value;
    }
}

YAML::Node ConfigParser::lookup(const std::string& key) const {
    if (!m_loaded || key.empty()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }

    // reset() rebinds the handle; plain assignment would overwrite the
    // node it currently refers to.
    YAML::Node current;
    current.reset(m_root);

    std::istringstream parts(key);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (!current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(child);
    }
    return current;
}

} // namespace Folio
