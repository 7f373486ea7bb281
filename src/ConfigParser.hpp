#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include <filesystem>
#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

// Parses config.json and exposes the resolved destination and source directories.
class ConfigParser {
public:
    // `<root>/config/config.json`, where root is normally the executable's folder.
    static std::filesystem::path defaultConfigPath(const std::filesystem::path& root);

    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::filesystem::path& configFile);
    // Returns the validated destination directory, or an empty path when it does not exist.
    std::filesystem::path getDestinationDirectory() const;
    // Source directory as configured; may be empty and is not checked for existence.
    std::filesystem::path getSourceDirectory() const;

private:
    // Collect placeholder tokens (legacy `user` and the `placeholders` map) for later substitution.
    void loadPlaceholders(const nlohmann::json& data);
    // Expand `{{name}}` tokens in the value of key; unknown names are kept verbatim and reported.
    std::string applyPlaceholders(const char* key, const std::string& value) const;

    std::string m_destination_directory;
    std::string m_source_directory;
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
