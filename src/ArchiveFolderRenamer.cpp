#include "ArchiveFolderRenamer.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

namespace {
constexpr std::size_t kBlockSize = 10240;

struct ReadArchiveDeleter {
    void operator()(struct archive* ptr) const {
        if (ptr) {
            archive_read_free(ptr);
        }
    }
};

struct WriteArchiveDeleter {
    void operator()(struct archive* ptr) const {
        if (ptr) {
            archive_write_free(ptr);
        }
    }
};

struct EntryDeleter {
    void operator()(struct archive_entry* ptr) const {
        if (ptr) {
            archive_entry_free(ptr);
        }
    }
};

using ReadArchivePtr = std::unique_ptr<struct archive, ReadArchiveDeleter>;
using WriteArchivePtr = std::unique_ptr<struct archive, WriteArchiveDeleter>;
using EntryPtr = std::unique_ptr<struct archive_entry, EntryDeleter>;

// Deletes the temporary archive on scope exit unless the rename committed it.
class TemporaryArchive {
public:
    explicit TemporaryArchive(std::filesystem::path path) : m_path(std::move(path)) {}
    ~TemporaryArchive() {
        if (m_committed) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
        if (ec) {
            std::cerr << "Failed to remove temporary archive `" << m_path.string() << "`: " << ec.message() << std::endl;
        }
    }

    TemporaryArchive(const TemporaryArchive&) = delete;
    TemporaryArchive& operator=(const TemporaryArchive&) = delete;

    void commit() { m_committed = true; }

private:
    std::filesystem::path m_path;
    bool m_committed = false;
};

std::string errorString(struct archive* handle) {
    const char* message = archive_error_string(handle);
    return message ? message : "unknown libarchive error";
}

// libarchive reports the entry's method in the format name, e.g. "ZIP 1.0 (uncompressed)".
bool isStoredEntry(struct archive* reader) {
    const char* formatName = archive_format_name(reader);
    return formatName && std::strstr(formatName, "uncompressed") != nullptr;
}

bool readEntryData(struct archive* reader, std::vector<char>& data) {
    data.clear();
    char buffer[kBlockSize];
    while (true) {
        const la_ssize_t bytesRead = archive_read_data(reader, buffer, sizeof(buffer));
        if (bytesRead == 0) {
            return true;
        }
        if (bytesRead < 0) {
            return false;
        }
        data.insert(data.end(), buffer, buffer + bytesRead);
    }
}
}

std::string renameEntryPath(const std::string& entryPath, bool isDirectory, const std::string& newFolderName) {
    const auto separator = entryPath.find('/');
    if (separator != std::string::npos) {
        return newFolderName + entryPath.substr(separator);
    }
    if (isDirectory && !entryPath.empty()) {
        return newFolderName + "/";
    }
    return entryPath;
}

bool renameTopLevelFolder(const std::filesystem::path& archivePath, const std::string& newFolderName) {
    std::filesystem::path tempPath = archivePath;
    tempPath.replace_extension(".tmp");

    std::error_code existsErr;
    if (std::filesystem::exists(tempPath, existsErr) || existsErr) {
        std::cerr << "Error renaming folder in zip `" << archivePath.string() << "`: temporary file `" << tempPath.string()
                  << "` already exists or cannot be checked." << std::endl;
        return false;
    }

    ReadArchivePtr reader(archive_read_new());
    if (!reader) {
        std::cerr << "Failed to allocate libarchive reader." << std::endl;
        return false;
    }
    archive_read_support_format_zip(reader.get());

    if (archive_read_open_filename(reader.get(), archivePath.string().c_str(), kBlockSize) != ARCHIVE_OK) {
        std::cerr << "Error renaming folder in zip `" << archivePath.string() << "`: " << errorString(reader.get()) << std::endl;
        return false;
    }

    // Declared before the writer so the file is closed before it gets removed.
    TemporaryArchive temporary(tempPath);

    WriteArchivePtr writer(archive_write_new());
    if (!writer) {
        std::cerr << "Failed to allocate libarchive writer." << std::endl;
        return false;
    }

    if (archive_write_set_format_zip(writer.get()) != ARCHIVE_OK ||
        archive_write_set_format_option(writer.get(), "zip", "hdrcharset", "UTF-8") != ARCHIVE_OK ||
        archive_write_open_filename(writer.get(), tempPath.string().c_str()) != ARCHIVE_OK) {
        std::cerr << "Error creating `" << tempPath.string() << "`: " << errorString(writer.get()) << std::endl;
        return false;
    }

    std::vector<char> data;
    while (true) {
        struct archive_entry* entry = nullptr;
        const int headerResult = archive_read_next_header(reader.get(), &entry);
        if (headerResult == ARCHIVE_EOF) {
            break;
        }
        if (headerResult == ARCHIVE_WARN) {
            std::cerr << "Warning while reading `" << archivePath.string() << "`: " << errorString(reader.get()) << std::endl;
        } else if (headerResult != ARCHIVE_OK) {
            std::cerr << "Error reading `" << archivePath.string() << "`: " << errorString(reader.get()) << std::endl;
            return false;
        }

        const char* utf8Name = archive_entry_pathname_utf8(entry);
        const char* rawName = utf8Name ? utf8Name : archive_entry_pathname(entry);
        if (!rawName) {
            std::cerr << "Error reading `" << archivePath.string() << "`: entry without a name." << std::endl;
            return false;
        }

        const bool isDirectory = archive_entry_filetype(entry) == AE_IFDIR;
        const bool stored = isDirectory || isStoredEntry(reader.get());

        if (!isDirectory && !readEntryData(reader.get(), data)) {
            std::cerr << "Error reading `" << rawName << "` from `" << archivePath.string() << "`: "
                      << errorString(reader.get()) << std::endl;
            return false;
        }

        // The clone carries mtime and permission bits over to the new entry.
        EntryPtr renamed(archive_entry_clone(entry));
        if (!renamed) {
            std::cerr << "Failed to allocate archive entry." << std::endl;
            return false;
        }
        const std::string newPath = renameEntryPath(rawName, isDirectory, newFolderName);
        archive_entry_set_pathname_utf8(renamed.get(), newPath.c_str());
        archive_entry_set_size(renamed.get(), isDirectory ? 0 : static_cast<la_int64_t>(data.size()));

        if (archive_write_set_format_option(writer.get(), "zip", "compression", stored ? "store" : "deflate") != ARCHIVE_OK) {
            std::cerr << "Error selecting compression for `" << newPath << "`: " << errorString(writer.get()) << std::endl;
            return false;
        }

        if (archive_write_header(writer.get(), renamed.get()) != ARCHIVE_OK) {
            std::cerr << "Error writing header for `" << newPath << "`: " << errorString(writer.get()) << std::endl;
            return false;
        }

        if (!isDirectory && !data.empty()) {
            const la_ssize_t written = archive_write_data(writer.get(), data.data(), data.size());
            if (written < 0 || static_cast<std::size_t>(written) != data.size()) {
                std::cerr << "Error writing `" << newPath << "`: " << errorString(writer.get()) << std::endl;
                return false;
            }
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        std::cerr << "Error finalizing `" << tempPath.string() << "`: " << errorString(writer.get()) << std::endl;
        return false;
    }
    writer.reset();
    reader.reset();

    // rename() replaces the original in one step, so the archive is never missing.
    std::error_code renameErr;
    std::filesystem::rename(tempPath, archivePath, renameErr);
    if (renameErr) {
        std::cerr << "Error replacing `" << archivePath.string() << "`: " << renameErr.message() << std::endl;
        return false;
    }

    temporary.commit();
    return true;
}
