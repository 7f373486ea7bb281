#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include "SeriesIndex.hpp"
#include "UserPrompts.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Terminal state of one archive. Only Moved counts as success.
enum class MoveOutcome {
    Moved,
    SkippedExists,
    RenameFailed,
    Declined,
    NoMatch,
    Failed
};

const char* toString(MoveOutcome outcome);

// Per-outcome counts for one run.
struct RunSummary {
    std::size_t total = 0;
    std::size_t moved = 0;
    std::size_t skipped = 0;
    std::size_t declined = 0;
    std::size_t noMatch = 0;
    std::size_t failed = 0;
};

// Moves zip archives into the series folder their file name matches.
// The index and dialog are borrowed and must outlive the mover.
class FileMover {
public:
    FileMover(const SeriesIndex& index, ConfirmationDialog& dialog);

    // Run one archive through extraction, lookup, optional rename and the move.
    MoveOutcome moveArchive(const std::filesystem::path& archivePath) const;
    // Process every zip directly inside sourceFolder on a bounded worker pool (0 picks a default size).
    RunSummary organize(const std::filesystem::path& sourceFolder, std::size_t workerCount = 0) const;
    RunSummary organize(const std::vector<std::filesystem::path>& archives, std::size_t workerCount = 0) const;

    // Zip files (case-insensitive extension) directly inside folder, sorted by path.
    static std::vector<std::filesystem::path> listArchives(const std::filesystem::path& folder);
    // hardware_concurrency() clamped to [2, 8] and never above the job count.
    static std::size_t defaultWorkerCount(std::size_t jobCount);

private:
    MoveOutcome moveExactMatch(const std::filesystem::path& archivePath, const std::filesystem::path& seriesFolder) const;
    MoveOutcome moveToCandidate(const std::filesystem::path& archivePath,
                                const std::string& seriesTitle,
                                const std::string& volumeSuffix) const;
    // Catches exceptions so one archive cannot stop the rest of the run.
    MoveOutcome moveArchiveGuarded(const std::filesystem::path& archivePath) const;
    // Rename, falling back to copy-then-remove across devices; never overwrites the target.
    static bool moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath);

    const SeriesIndex& m_index;
    ConfirmationDialog& m_dialog;
};

#endif
