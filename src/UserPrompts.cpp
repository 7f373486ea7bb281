#include "UserPrompts.hpp"

#include "TitleExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <system_error>

ConsoleConfirmationDialog::ConsoleConfirmationDialog(std::istream& input, std::ostream& output)
    : m_input(input), m_output(output) {}

bool ConsoleConfirmationDialog::confirm(const std::string& caption, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_output << "\n[" << caption << "]\n" << message << "\n[y/N] " << std::flush;

    std::string answer;
    if (!std::getline(m_input, answer)) {
        m_output << std::endl;
        return false;
    }

    answer = trimWhitespace(answer);
    std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return answer == "y" || answer == "yes";
}

ConsoleFolderPicker::ConsoleFolderPicker(std::istream& input, std::ostream& output)
    : m_input(input), m_output(output) {}

std::optional<std::filesystem::path> ConsoleFolderPicker::pickDirectory(const std::filesystem::path& initialDirectory) {
    m_output << "Folder containing the zip files";
    if (!initialDirectory.empty()) {
        m_output << " [" << initialDirectory.string() << "]";
    }
    m_output << ": " << std::flush;

    std::string answer;
    if (!std::getline(m_input, answer)) {
        return std::nullopt;
    }

    answer = trimWhitespace(answer);
    // Drag-and-drop into a terminal often wraps the path in quotes.
    if (answer.size() >= 2 && (answer.front() == '"' || answer.front() == '\'') && answer.back() == answer.front()) {
        answer = answer.substr(1, answer.size() - 2);
    }

    const std::filesystem::path chosen = answer.empty() ? initialDirectory : std::filesystem::path(answer);
    if (chosen.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(chosen, ec) || ec) {
        m_output << "`" << chosen.string() << "` is not a directory." << std::endl;
        return std::nullopt;
    }

    return chosen;
}
