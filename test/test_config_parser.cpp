#include "ConfigParser.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using test_support::expect;
using test_support::ScratchDir;

namespace fs = std::filesystem;

int main() {
    bool ok = true;

    {
        ScratchDir scratch("config_valid");
        fs::create_directories(scratch.path() / "reader" / "Library");
        const fs::path configFile = ConfigParser::defaultConfigPath(scratch.path());
        fs::create_directories(configFile.parent_path());
        test_support::writeTextFile(configFile,
                                    "{\n"
                                    "  \"user\": \"reader\",\n"
                                    "  \"placeholders\": {\"root\": \"" + scratch.path().generic_string() + "\"},\n"
                                    "  \"destination_directory\": \"{{root}}/{{user}}/Library\",\n"
                                    "  \"source_directory\": \"{{root}}/{{user}}/Downloads\"\n"
                                    "}\n");

        ConfigParser parser;
        ok = expect(parser.load(configFile), "Expected valid configuration to load") && ok;
        ok = expect(parser.getDestinationDirectory() == scratch.path() / "reader" / "Library",
                    "Expected placeholders to resolve in destination_directory") && ok;
        // The source folder only seeds the picker and may not exist.
        ok = expect(parser.getSourceDirectory() == scratch.path() / "reader" / "Downloads",
                    "Expected source_directory without existence check") && ok;
    }

    {
        ScratchDir scratch("config_missing");
        ConfigParser parser;
        ok = expect(!parser.load(scratch.path() / "config.json"), "Expected missing file to fail") && ok;
    }

    {
        ScratchDir scratch("config_malformed");
        const fs::path configFile = scratch.path() / "config.json";
        test_support::writeTextFile(configFile, "{ \"destination_directory\": ");
        ConfigParser parser;
        ok = expect(!parser.load(configFile), "Expected malformed JSON to fail") && ok;
    }

    {
        ScratchDir scratch("config_no_destination");
        const fs::path configFile = scratch.path() / "config.json";
        test_support::writeTextFile(configFile, "{ \"source_directory\": \"/tmp\" }");
        ConfigParser parser;
        ok = expect(!parser.load(configFile), "Expected missing destination_directory to fail") && ok;
    }

    {
        ScratchDir scratch("config_bad_source");
        const fs::path configFile = scratch.path() / "config.json";
        test_support::writeTextFile(configFile, "{ \"destination_directory\": \"/tmp\", \"source_directory\": 5 }");
        ConfigParser parser;
        ok = expect(!parser.load(configFile), "Expected non-string source_directory to fail") && ok;
    }

    {
        ScratchDir scratch("config_absent_destination");
        const fs::path configFile = scratch.path() / "config.json";
        test_support::writeTextFile(configFile,
                                    "{ \"destination_directory\": \"" + (scratch.path() / "nowhere").generic_string() + "\" }");
        ConfigParser parser;
        ok = expect(parser.load(configFile), "Expected file with absent destination to parse") && ok;
        ok = expect(parser.getDestinationDirectory().empty(), "Expected absent destination to be rejected") && ok;
        ok = expect(parser.getSourceDirectory().empty(), "Expected unset source_directory to stay empty") && ok;
    }

    {
        ScratchDir scratch("config_unknown_placeholder");
        const fs::path configFile = scratch.path() / "config.json";
        test_support::writeTextFile(configFile,
                                    "{\n"
                                    "  \"user\": 42,\n"
                                    "  \"placeholders\": {\"root\": \"" + scratch.path().generic_string() + "\", \"skip\": 7},\n"
                                    "  \"destination_directory\": \"{{root}}/{{shelf}}\",\n"
                                    "  \"source_directory\": \"{{root}}/{{user}}/{{root\"\n"
                                    "}\n");
        ConfigParser parser;
        ok = expect(parser.load(configFile), "Expected unknown placeholders not to fail loading") && ok;
        ok = expect(parser.getSourceDirectory() == fs::path(scratch.path().generic_string() + "/{{user}}/{{root"),
                    "Expected unknown and unterminated tokens to be kept verbatim") && ok;
        // `{{shelf}}` stays literal, so the destination does not exist.
        ok = expect(parser.getDestinationDirectory().empty(), "Expected unresolved destination to be rejected") && ok;
        fs::create_directories(scratch.path() / "{{shelf}}");
        ok = expect(parser.getDestinationDirectory() == fs::path(scratch.path().generic_string() + "/{{shelf}}"),
                    "Expected unresolved token to stay in destination_directory") && ok;
    }

    if (!ok) {
        return 1;
    }

    std::cout << "Config parser tests passed" << std::endl;
    return 0;
}
