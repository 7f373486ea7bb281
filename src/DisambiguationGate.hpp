#ifndef DISAMBIGUATION_GATE_HPP
#define DISAMBIGUATION_GATE_HPP

#include "UserPrompts.hpp"

#include <optional>
#include <string>
#include <vector>

// Ask whether an archive whose title only partially matches should go to the first candidate.
// All candidates are listed, but acceptance always selects candidates.front(); denial or an
// empty list selects nothing. The dialog is not shown for an empty list.
std::optional<std::string> resolveCandidate(const std::string& query,
                                            const std::vector<std::string>& candidates,
                                            const std::string& archiveFileName,
                                            ConfirmationDialog& dialog);

// Text shown by resolveCandidate.
std::string buildCandidateMessage(const std::string& query,
                                  const std::vector<std::string>& candidates,
                                  const std::string& archiveFileName);

#endif
