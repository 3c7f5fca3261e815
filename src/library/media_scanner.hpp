#pragma once

#include <string>
#include <vector>

namespace cue {

bool has_playable_extension(const std::string &path,
                            const std::vector<std::string> &extensions);

// Playable files under `folder` (normalized, absolute), in natural order of
// their path relative to `folder`. Hidden files and directories are skipped.
std::vector<std::string> list_playable_entries(const std::string &folder,
                                               const std::vector<std::string> &extensions,
                                               bool recursive);

} // namespace cue
