#include "ConfigParser.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::filesystem::path ConfigParser::defaultConfigPath(const std::filesystem::path& root) {
    return root / "config" / "config.json";
}

std::filesystem::path ConfigParser::getDestinationDirectory() const {
    if (m_destination_directory.empty()) {
        std::cerr << "Destination directory has not been configured yet." << std::endl;
        return {};
    }

    std::error_code ec;
    if (std::filesystem::is_directory(m_destination_directory, ec)) {
        return m_destination_directory;
    }

    if (ec && ec != std::errc::no_such_file_or_directory) {
        std::cerr << "Unable to validate folder `" << m_destination_directory << "`: " << ec.message() << std::endl;
        return {};
    }

    std::cerr << "'destination_directory' `" << m_destination_directory << "` not found." << std::endl;
    return {};
}

std::filesystem::path ConfigParser::getSourceDirectory() const {
    return m_source_directory;
}

bool ConfigParser::load(const std::filesystem::path& configFile) {
    std::ifstream jsonFile(configFile);
    if (!jsonFile) {
        std::cerr << "Configuration file " << configFile << " not found." << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid configuration: the top level must be an object." << std::endl;
        return false;
    }

    loadPlaceholders(data);

    try {
        const std::string rawDestination = data.at("destination_directory").get<std::string>();
        m_destination_directory = applyPlaceholders("destination_directory", rawDestination);
    } catch (const json::exception& e) {
        std::cerr << "Missing or invalid destination_directory: " << e.what() << std::endl;
        return false;
    }

    m_source_directory.clear();
    if (auto it = data.find("source_directory"); it != data.end() && !it->is_null()) {
        if (!it->is_string()) {
            std::cerr << "`source_directory` must be a string." << std::endl;
            return false;
        }
        m_source_directory = applyPlaceholders("source_directory", it->get<std::string>());
    }

    std::cout << "Loaded configuration from " << configFile << std::endl;
    return true;
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    if (auto userIt = data.find("user"); userIt != data.end()) {
        if (userIt->is_string()) {
            m_placeholders["user"] = userIt->get<std::string>();
        } else {
            std::cerr << "`user` must be a string; {{user}} stays unresolved." << std::endl;
        }
    }

    auto placeholdersIt = data.find("placeholders");
    if (placeholdersIt == data.end()) {
        return;
    }
    if (!placeholdersIt->is_object()) {
        std::cerr << "`placeholders` must map names to folder strings." << std::endl;
        return;
    }
    // Entries here take precedence over the top-level `user`.
    for (const auto& item : placeholdersIt->items()) {
        if (!item.value().is_string()) {
            std::cerr << "Placeholder `" << item.key() << "` must be a string." << std::endl;
            continue;
        }
        m_placeholders[item.key()] = item.value().get<std::string>();
    }
}

std::string ConfigParser::applyPlaceholders(const char* key, const std::string& value) const {
    std::string result;
    result.reserve(value.size());

    std::size_t pos = 0;
    while (pos < value.size()) {
        const std::size_t open = value.find("{{", pos);
        const std::size_t close = open == std::string::npos ? std::string::npos : value.find("}}", open + 2);
        if (close == std::string::npos) {
            result.append(value, pos, std::string::npos);
            break;
        }

        result.append(value, pos, open - pos);
        const std::string name = value.substr(open + 2, close - open - 2);
        if (auto it = m_placeholders.find(name); it != m_placeholders.end()) {
            result += it->second;
        } else {
            std::cerr << "Warning: `" << key << "` uses unknown placeholder `{{" << name << "}}`; kept as written." << std::endl;
            result.append(value, open, close + 2 - open);
        }
        pos = close + 2;
    }

    return result;
}
