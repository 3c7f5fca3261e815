#include "title_guesser.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace cue {

namespace {

const std::regex kEpisodeTag(R"(\bs(\d{1,2})[ ._-]?e\d{1,3}\b)", std::regex::icase);
const std::regex kCrossTag(R"(\b(\d{1,2})x\d{2}\b)", std::regex::icase);
const std::regex kSeasonWord(R"(\bseason[ ._-]*(\d{1,2})\b)", std::regex::icase);
const std::regex kReleaseNoise(R"(\b((19|20)\d{2}|\d{3,4}p|x26[45]|h\.?26[45]|web-?dl|bluray|hdtv)\b)",
                               std::regex::icase);
const std::regex kBrackets(R"(\[[^\]]*\]|\{[^}]*\})");
const std::regex kParens(R"(\([^)]*\))");

std::string trim(const std::string &text) {
  const char *blank = " -_.\t([";
  size_t start = text.find_first_not_of(blank);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(blank);
  return text.substr(start, end - start + 1);
}

// '_' is a word character to std::regex, so "Show_S01E02" has no \b.
std::string underscores_to_spaces(std::string text) {
  std::replace(text.begin(), text.end(), '_', ' ');
  return text;
}

} // namespace

std::string clean_title(const std::string &raw) {
  std::string text = underscores_to_spaces(raw);
  text = std::regex_replace(text, kBrackets, " ");
  text = std::regex_replace(text, kParens, " ");

  std::smatch noise;
  if (std::regex_search(text, noise, kReleaseNoise) && noise.position(0) > 0) {
    text = text.substr(0, static_cast<size_t>(noise.position(0)));
  }

  std::string spaced;
  bool last_space = true;
  for (char c : text) {
    bool is_space = c == '.' || c == '_' || c == ' ' || c == '\t';
    if (is_space) {
      if (!last_space) spaced += ' ';
      last_space = true;
    } else {
      spaced += c;
      last_space = false;
    }
  }
  return trim(spaced);
}

MediaMetadata guess_metadata(const std::string &path, bool is_folder) {
  fs::path p(path);
  while (!p.empty() && !p.has_filename() && p.has_parent_path() &&
         p != p.parent_path()) {
    p = p.parent_path();
  }
  std::string name = underscores_to_spaces(
      is_folder ? p.filename().string() : p.stem().string());

  MediaMetadata metadata;
  std::string title_part = name;
  std::smatch match;
  if (std::regex_search(name, match, kEpisodeTag) ||
      std::regex_search(name, match, kCrossTag) ||
      std::regex_search(name, match, kSeasonWord)) {
    metadata.season_number = std::stoi(match[1].str());
    title_part = name.substr(0, static_cast<size_t>(match.position(0)));
  }

  metadata.clean_title = clean_title(title_part);
  if (metadata.clean_title.empty()) {
    // "Season 3" or "S01E01.mkv": the show name lives one level up.
    std::string parent = p.parent_path().filename().string();
    metadata.clean_title = clean_title(parent.empty() ? name : parent);
  }
  if (metadata.clean_title.empty()) {
    metadata.clean_title = name;
  }
  return metadata;
}

} // namespace cue
