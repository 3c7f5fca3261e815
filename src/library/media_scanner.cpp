#include "media_scanner.hpp"
#include "../common/log.hpp"
#include "../core/media.hpp"
#include "natural_sort.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace cue {

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool is_hidden(const fs::path &path) {
  std::string name = path.filename().string();
  return !name.empty() && name[0] == '.';
}

} // namespace

bool has_playable_extension(const std::string &path,
                            const std::vector<std::string> &extensions) {
  std::string ext = lowercase(fs::path(path).extension().string());
  if (ext.empty()) {
    return false;
  }
  for (const auto &allowed : extensions) {
    std::string normalized = lowercase(allowed);
    if (!normalized.empty() && normalized[0] != '.') {
      normalized.insert(normalized.begin(), '.');
    }
    if (ext == normalized) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> list_playable_entries(const std::string &folder,
                                               const std::vector<std::string> &extensions,
                                               bool recursive) {
  std::error_code ec;
  if (!fs::is_directory(folder, ec)) {
    return {};
  }

  // (relative path for ordering, absolute path)
  std::vector<std::pair<std::string, std::string>> found;
  auto consider = [&](const fs::directory_entry &entry) {
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec) || is_hidden(entry.path())) {
      return;
    }
    if (!has_playable_extension(entry.path().string(), extensions)) {
      return;
    }
    found.emplace_back(entry.path().lexically_relative(folder).generic_string(),
                       entry.path().string());
  };

  const auto options = fs::directory_options::skip_permission_denied;
  if (recursive) {
    fs::recursive_directory_iterator it(folder, options, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      std::error_code dir_ec;
      if (it->is_directory(dir_ec) && is_hidden(it->path())) {
        it.disable_recursion_pending();
        continue;
      }
      consider(*it);
    }
  } else {
    fs::directory_iterator it(folder, options, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      consider(*it);
    }
  }
  if (ec) {
    log::warn("Scanner", "listing {} stopped early: {}", folder, ec.message());
  }

  std::stable_sort(found.begin(), found.end(),
                   [](const auto &a, const auto &b) {
                     return natural_less(a.first, b.first);
                   });

  std::vector<std::string> entries;
  entries.reserve(found.size());
  for (const auto &[relative, absolute] : found) {
    entries.push_back(normalize_path(absolute));
  }
  return entries;
}

} // namespace cue
