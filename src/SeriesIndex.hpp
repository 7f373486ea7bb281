#ifndef SERIES_INDEX_HPP
#define SERIES_INDEX_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Series entry: cleaned title plus the destination folder it was derived from.
struct SeriesEntry {
    std::string title;
    std::filesystem::path folder;
};

// Maps cleaned series titles to destination folders. Built once per run and only read afterwards.
class SeriesIndex {
public:
    // Scan every directory below root (recursively) and index it under its cleaned name.
    static SeriesIndex fromDirectoryTree(const std::filesystem::path& root);

    // Insert a title, or replace the folder of an existing one while keeping its position.
    void add(const std::string& title, std::filesystem::path folder);
    // Exact key lookup.
    std::optional<std::filesystem::path> find(const std::string& title) const;
    // Every title containing the query as a substring, in index order.
    std::vector<std::string> candidates(const std::string& query) const;

    std::size_t size() const;
    bool empty() const;

private:
    std::vector<SeriesEntry> m_entries;
    std::unordered_map<std::string, std::size_t> m_positions;
};

#endif
