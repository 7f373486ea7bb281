#ifndef USER_PROMPTS_HPP
#define USER_PROMPTS_HPP

#include <filesystem>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

// Yes/no confirmation; implementations may block the calling worker until answered.
class ConfirmationDialog {
public:
    virtual ~ConfirmationDialog() = default;
    virtual bool confirm(const std::string& caption, const std::string& message) = 0;
};

// Interactive directory selection; returns nothing when the user gives up.
class FolderPicker {
public:
    virtual ~FolderPicker() = default;
    virtual std::optional<std::filesystem::path> pickDirectory(const std::filesystem::path& initialDirectory) = 0;
};

// Asks on a text stream; prompts from concurrent workers are answered one at a time.
class ConsoleConfirmationDialog : public ConfirmationDialog {
public:
    ConsoleConfirmationDialog(std::istream& input, std::ostream& output);

    bool confirm(const std::string& caption, const std::string& message) override;

private:
    std::istream& m_input;
    std::ostream& m_output;
    std::mutex m_mutex;
};

// Offers the configured source folder as the default and accepts a typed path instead.
class ConsoleFolderPicker : public FolderPicker {
public:
    ConsoleFolderPicker(std::istream& input, std::ostream& output);

    std::optional<std::filesystem::path> pickDirectory(const std::filesystem::path& initialDirectory) override;

private:
    std::istream& m_input;
    std::ostream& m_output;
};

#endif
