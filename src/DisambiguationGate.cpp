#include "DisambiguationGate.hpp"

#include <sstream>

namespace {
constexpr char kCaption[] = "Confirm move";
}

std::string buildCandidateMessage(const std::string& query,
                                  const std::vector<std::string>& candidates,
                                  const std::string& archiveFileName) {
    std::ostringstream message;
    message << "'" << query << "' is part of the following series title(s):\n\n";
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        message << (i + 1) << ". " << candidates[i] << "\n";
    }
    message << "\nMove '" << archiveFileName << "' into this folder?";
    if (candidates.size() > 1) {
        message << "\nThe first candidate will be used.";
    }
    return message.str();
}

std::optional<std::string> resolveCandidate(const std::string& query,
                                            const std::vector<std::string>& candidates,
                                            const std::string& archiveFileName,
                                            ConfirmationDialog& dialog) {
    if (candidates.empty()) {
        return std::nullopt;
    }

    if (!dialog.confirm(kCaption, buildCandidateMessage(query, candidates, archiveFileName))) {
        return std::nullopt;
    }

    return candidates.front();
}
