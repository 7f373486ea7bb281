#ifndef ARCHIVE_FOLDER_RENAMER_HPP
#define ARCHIVE_FOLDER_RENAMER_HPP

#include <filesystem>
#include <string>

// Rewrite the first path segment of every entry in a zip archive to newFolderName.
// The result is built in "<stem>.tmp" next to the archive and replaces it only when complete;
// on failure the temporary file is removed, the archive is untouched and false is returned.
bool renameTopLevelFolder(const std::filesystem::path& archivePath, const std::string& newFolderName);

// Path an entry takes after its top-level folder is renamed.
std::string renameEntryPath(const std::string& entryPath, bool isDirectory, const std::string& newFolderName);

#endif
