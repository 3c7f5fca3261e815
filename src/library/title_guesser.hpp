#pragma once

#include "../core/media.hpp"
#include <string>

namespace cue {

// Readable title and season from a release-style name:
//   "Show.Name.S02E05.1080p.mkv" -> {"Show Name", 2}
//   "Some_Movie (2010) [x264].mp4" -> {"Some Movie", none}
//   ".../Show Name/Season 3"      -> {"Show Name", 3}
MediaMetadata guess_metadata(const std::string &path, bool is_folder);

std::string clean_title(const std::string &raw);

} // namespace cue
