#include "SeriesIndex.hpp"

#include "TitleExtractor.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

SeriesIndex SeriesIndex::fromDirectoryTree(const std::filesystem::path& root) {
    SeriesIndex index;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator iter(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << root.string() << "`: " << ec.message() << std::endl;
        return index;
    }

    std::vector<std::filesystem::path> folders;
    const std::filesystem::recursive_directory_iterator end;
    while (iter != end) {
        std::error_code typeErr;
        if (iter->is_directory(typeErr) && !typeErr) {
            folders.push_back(iter->path());
        }

        iter.increment(ec);
        if (ec) {
            // A subtree vanished or became unreadable mid-scan; keep what was collected.
            std::cerr << "Warning: stopped scanning `" << root.string() << "`: " << ec.message() << std::endl;
            break;
        }
    }

    // Directory iteration order is filesystem-dependent; sort so candidate order is stable.
    std::sort(folders.begin(), folders.end());

    for (auto& folder : folders) {
        index.add(cleanSeriesName(folder.filename().string()), std::move(folder));
    }

    std::cout << "Indexed " << index.size() << " series folder(s) under " << root.string() << std::endl;
    return index;
}

void SeriesIndex::add(const std::string& title, std::filesystem::path folder) {
    auto it = m_positions.find(title);
    if (it != m_positions.end()) {
        m_entries[it->second].folder = std::move(folder);
        return;
    }

    m_positions.emplace(title, m_entries.size());
    m_entries.push_back({title, std::move(folder)});
}

std::optional<std::filesystem::path> SeriesIndex::find(const std::string& title) const {
    auto it = m_positions.find(title);
    if (it == m_positions.end()) {
        return std::nullopt;
    }
    return m_entries[it->second].folder;
}

std::vector<std::string> SeriesIndex::candidates(const std::string& query) const {
    std::vector<std::string> matches;
    for (const auto& entry : m_entries) {
        if (entry.title.find(query) != std::string::npos) {
            matches.push_back(entry.title);
        }
    }
    return matches;
}

std::size_t SeriesIndex::size() const {
    return m_entries.size();
}

bool SeriesIndex::empty() const {
    return m_entries.empty();
}
