#include "FileMover.hpp"

#include "ArchiveFolderRenamer.hpp"
#include "DisambiguationGate.hpp"
#include "TitleExtractor.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>

namespace {
constexpr std::size_t kMinWorkers = 2;
constexpr std::size_t kMaxWorkers = 8;

// Puts a renamed archive back under its original name unless the move committed.
class RenameRollback {
public:
    RenameRollback(std::filesystem::path originalPath, std::filesystem::path renamedPath)
        : m_originalPath(std::move(originalPath)), m_renamedPath(std::move(renamedPath)) {}

    ~RenameRollback() {
        if (m_committed) {
            return;
        }
        std::error_code ec;
        std::filesystem::rename(m_renamedPath, m_originalPath, ec);
        if (ec) {
            std::cerr << "Failed to restore `" << m_renamedPath.string() << "` to `" << m_originalPath.filename().string()
                      << "`: " << ec.message() << std::endl;
        }
    }

    RenameRollback(const RenameRollback&) = delete;
    RenameRollback& operator=(const RenameRollback&) = delete;

    void commit() { m_committed = true; }

private:
    std::filesystem::path m_originalPath;
    std::filesystem::path m_renamedPath;
    bool m_committed = false;
};

// True when target is taken; an error while checking also counts as taken.
bool isOccupied(const std::filesystem::path& target) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(target, ec);
    if (ec) {
        std::cerr << "Unable to check `" << target.string() << "`: " << ec.message() << std::endl;
        return true;
    }
    return exists;
}

bool hasZipExtension(const std::filesystem::path& file) {
    std::string extension = file.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension == ".zip";
}
}

const char* toString(MoveOutcome outcome) {
    switch (outcome) {
    case MoveOutcome::Moved:
        return "moved";
    case MoveOutcome::SkippedExists:
        return "skipped-exists";
    case MoveOutcome::RenameFailed:
        return "rename-failed";
    case MoveOutcome::Declined:
        return "declined";
    case MoveOutcome::NoMatch:
        return "no-match";
    case MoveOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

FileMover::FileMover(const SeriesIndex& index, ConfirmationDialog& dialog)
    : m_index(index), m_dialog(dialog) {}

MoveOutcome FileMover::moveArchive(const std::filesystem::path& archivePath) const {
    const TitleParts parts = splitTitle(archivePath.stem().string());
    const std::string fileName = archivePath.filename().string();

    if (parts.title.empty()) {
        std::cout << "No series title in `" << fileName << "`, leaving in place." << std::endl;
        return MoveOutcome::NoMatch;
    }

    if (const auto seriesFolder = m_index.find(parts.title)) {
        return moveExactMatch(archivePath, *seriesFolder);
    }

    const std::vector<std::string> candidates = m_index.candidates(parts.title);
    if (candidates.empty()) {
        std::cout << "No matching series for `" << fileName << "`, leaving in place." << std::endl;
        return MoveOutcome::NoMatch;
    }

    const auto selected = resolveCandidate(parts.title, candidates, fileName, m_dialog);
    if (!selected) {
        std::cout << "Declined moving `" << fileName << "`." << std::endl;
        return MoveOutcome::Declined;
    }

    return moveToCandidate(archivePath, *selected, parts.suffix);
}

MoveOutcome FileMover::moveExactMatch(const std::filesystem::path& archivePath, const std::filesystem::path& seriesFolder) const {
    const auto targetPath = seriesFolder / archivePath.filename();
    if (isOccupied(targetPath)) {
        std::cout << "File " << targetPath.filename().string() << " already exists. Skipping." << std::endl;
        return MoveOutcome::SkippedExists;
    }

    if (!moveFile(archivePath, targetPath)) {
        return MoveOutcome::Failed;
    }

    std::cout << "Moved " << archivePath.filename().string() << " into " << seriesFolder.filename().string() << std::endl;
    return MoveOutcome::Moved;
}

MoveOutcome FileMover::moveToCandidate(const std::filesystem::path& archivePath,
                                       const std::string& seriesTitle,
                                       const std::string& volumeSuffix) const {
    const auto seriesFolder = m_index.find(seriesTitle);
    if (!seriesFolder) {
        std::cerr << "Series `" << seriesTitle << "` is not in the index." << std::endl;
        return MoveOutcome::Failed;
    }

    const std::string folderName = seriesTitle + volumeSuffix;
    const std::string newFileName = folderName + archivePath.extension().string();
    const auto renamedPath = archivePath.parent_path() / newFileName;
    const auto targetPath = *seriesFolder / newFileName;

    // Checked up front as well so a known conflict never touches the archive.
    if (isOccupied(targetPath)) {
        std::cout << "File " << newFileName << " already exists. Skipping." << std::endl;
        return MoveOutcome::SkippedExists;
    }

    if (isOccupied(renamedPath)) {
        std::cerr << "Cannot rename `" << archivePath.filename().string() << "`: `" << newFileName
                  << "` already exists in the source folder." << std::endl;
        return MoveOutcome::RenameFailed;
    }

    std::error_code renameErr;
    std::filesystem::rename(archivePath, renamedPath, renameErr);
    if (renameErr) {
        std::cerr << "Failed to rename `" << archivePath.filename().string() << "` to `" << newFileName
                  << "`: " << renameErr.message() << std::endl;
        return MoveOutcome::RenameFailed;
    }

    RenameRollback rollback(archivePath, renamedPath);

    if (!renameTopLevelFolder(renamedPath, folderName)) {
        std::cerr << "Warning: Failed to rename folder inside " << newFileName << std::endl;
    }

    if (isOccupied(targetPath)) {
        std::cout << "File " << newFileName << " already exists. Skipping." << std::endl;
        return MoveOutcome::SkippedExists;
    }

    if (!moveFile(renamedPath, targetPath)) {
        return MoveOutcome::Failed;
    }
    rollback.commit();

    std::cout << "Moved and renamed " << archivePath.filename().string() << " to " << newFileName << " into "
              << seriesFolder->filename().string() << std::endl;
    return MoveOutcome::Moved;
}

MoveOutcome FileMover::moveArchiveGuarded(const std::filesystem::path& archivePath) const {
    try {
        return moveArchive(archivePath);
    } catch (const std::exception& e) {
        std::cerr << "Failed to process `" << archivePath.filename().string() << "`: " << e.what() << std::endl;
        return MoveOutcome::Failed;
    }
}

RunSummary FileMover::organize(const std::filesystem::path& sourceFolder, std::size_t workerCount) const {
    return organize(listArchives(sourceFolder), workerCount);
}

RunSummary FileMover::organize(const std::vector<std::filesystem::path>& archives, std::size_t workerCount) const {
    RunSummary summary;
    summary.total = archives.size();
    if (archives.empty()) {
        return summary;
    }

    if (workerCount == 0) {
        workerCount = defaultWorkerCount(archives.size());
    }
    workerCount = std::min(workerCount, archives.size());

    std::vector<MoveOutcome> outcomes(archives.size(), MoveOutcome::Failed);
    std::atomic<std::size_t> nextIndex{0};

    auto worker = [&]() {
        for (;;) {
            const std::size_t index = nextIndex.fetch_add(1);
            if (index >= archives.size()) {
                return;
            }
            outcomes[index] = moveArchiveGuarded(archives[index]);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    for (const MoveOutcome outcome : outcomes) {
        switch (outcome) {
        case MoveOutcome::Moved:
            ++summary.moved;
            break;
        case MoveOutcome::SkippedExists:
            ++summary.skipped;
            break;
        case MoveOutcome::Declined:
            ++summary.declined;
            break;
        case MoveOutcome::NoMatch:
            ++summary.noMatch;
            break;
        case MoveOutcome::RenameFailed:
        case MoveOutcome::Failed:
            ++summary.failed;
            break;
        }
    }

    return summary;
}

std::vector<std::filesystem::path> FileMover::listArchives(const std::filesystem::path& folder) {
    std::vector<std::filesystem::path> archives;

    std::error_code ec;
    std::filesystem::directory_iterator iter(folder, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << folder.string() << "`: " << ec.message() << std::endl;
        return archives;
    }

    for (const auto& entry : iter) {
        ec.clear();
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        if (hasZipExtension(entry.path())) {
            archives.push_back(entry.path());
        }
    }

    std::sort(archives.begin(), archives.end());
    return archives;
}

std::size_t FileMover::defaultWorkerCount(std::size_t jobCount) {
    std::size_t workers = std::thread::hardware_concurrency();
    workers = std::clamp(workers, kMinWorkers, kMaxWorkers);
    return std::max<std::size_t>(1, std::min(workers, jobCount));
}

bool FileMover::moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) {
    std::error_code renameErr;
    std::filesystem::rename(sourcePath, targetPath, renameErr);
    if (!renameErr) {
        return true;
    }

    if (renameErr == std::errc::cross_device_link) {
        // copy_options::none refuses to replace a file that appeared after the existence check.
        std::error_code copyErr;
        std::filesystem::copy_file(sourcePath, targetPath, std::filesystem::copy_options::none, copyErr);
        if (copyErr) {
            std::cerr << "Failed to copy `" << sourcePath.string() << "` to `" << targetPath.string() << "`: " << copyErr.message() << std::endl;
            if (copyErr != std::errc::file_exists) {
                std::error_code cleanupErr;
                std::filesystem::remove(targetPath, cleanupErr);
                if (cleanupErr) {
                    std::cerr << "Failed to remove partial copy `" << targetPath.string() << "`: " << cleanupErr.message() << std::endl;
                }
            }
            return false;
        }

        std::error_code removeErr;
        std::filesystem::remove(sourcePath, removeErr);
        if (!removeErr) {
            return true;
        }

        std::cerr << "Failed to remove original file `" << sourcePath.string() << "` after copy: " << removeErr.message() << std::endl;
        // Keep exactly one copy: drop the new one and leave the source in place.
        std::error_code undoErr;
        std::filesystem::remove(targetPath, undoErr);
        if (undoErr) {
            std::cerr << "Failed to remove partial copy `" << targetPath.string() << "`: " << undoErr.message() << std::endl;
        }
        return false;
    }

    std::cerr << "Failed to move `" << sourcePath.string() << "`: " << renameErr.message() << std::endl;
    return false;
}
