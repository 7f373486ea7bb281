#include <clocale>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "ConfigParser.hpp"
#include "FileMover.hpp"
#include "SeriesIndex.hpp"
#include "UserPrompts.hpp"

#ifdef _WIN32
#include <windows.h>
#endif

namespace {
// Return the absolute path for the currently running executable, or empty on failure.
std::filesystem::path getExecutablePath() {
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    DWORD length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (length == 0) {
        return {};
    }

    if (length >= buffer.size()) {
        buffer.resize(length + 1);
        length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (length == 0) {
            return {};
        }
    }

    buffer.resize(length);
    return std::filesystem::path(buffer);
#else
    std::error_code ec;
    std::filesystem::path path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return {};
    }
    return path;
#endif
}
} // namespace

int main(int argc, char* argv[]) {
    // libarchive converts entry names through the current locale.
    std::setlocale(LC_ALL, "");

    std::filesystem::path configPath;
    if (argc > 1) {
        configPath = argv[1];
    } else {
        // Use the executable location so a bundled config folder is found regardless of the working directory.
        const std::filesystem::path executablePath = getExecutablePath();
        const std::filesystem::path configRoot =
            executablePath.empty() ? std::filesystem::current_path() : executablePath.parent_path();
        configPath = ConfigParser::defaultConfigPath(configRoot);
    }

    ConfigParser parser;
    if (!parser.load(configPath)) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    const std::filesystem::path destination = parser.getDestinationDirectory();
    if (destination.empty()) {
        std::cerr << "Destination directory is not available. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    ConsoleFolderPicker picker(std::cin, std::cout);
    const auto sourceFolder = picker.pickDirectory(parser.getSourceDirectory());
    if (!sourceFolder) {
        std::cout << "No folder selected. Exiting. Please hit Enter." << std::flush;
        std::string ignored;
        std::getline(std::cin, ignored);
        return EXIT_FAILURE;
    }

    // Built once before any worker starts; shared read-only afterwards.
    const SeriesIndex index = SeriesIndex::fromDirectoryTree(destination);

    const auto archives = FileMover::listArchives(*sourceFolder);
    std::cout << "Found " << archives.size() << " zip file(s) in " << sourceFolder->string() << std::endl;

    ConsoleConfirmationDialog dialog(std::cin, std::cout);
    FileMover mover(index, dialog);
    const RunSummary summary = mover.organize(archives);

    std::cout << "\nFinished. Moved " << summary.moved << " files." << std::endl;
    std::cout << "Skipped (exists): " << summary.skipped << ", declined: " << summary.declined
              << ", no match: " << summary.noMatch << ", failed: " << summary.failed << std::endl;
    return EXIT_SUCCESS;
}
