#include "resume_coordinator.hpp"
#include "../common/log.hpp"
#include "../common/notification.hpp"
#include "../core/errors.hpp"
#include "../library/folder_resolver.hpp"
#include "../library/title_guesser.hpp"

#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace cue {

struct ResumeCoordinator::Session {
  SessionHandle handle;
  std::string folder; // empty for a single file
  double start_offset = 0.0;
  std::unique_ptr<PlayerDriver> driver;
  LaunchInfo launch;

  // Guards everything below up to commit_mutex. identity, prior and title
  // follow the playing entry; they change with commit_mutex also held.
  mutable std::mutex mutex;
  std::condition_variable cv;
  SessionState state = SessionState::Starting;
  MediaIdentity identity;
  std::optional<ResumeRecord> prior;
  std::string title;
  bool stop_requested = false;
  bool process_exited = false;
  std::optional<double> last_position;
  std::vector<std::string> warnings;
  std::optional<ResumeRecord> final_record;
  int exit_status = -1;

  // Orders this session's store writes. Nothing is written after finalized.
  std::mutex commit_mutex;
  bool finalized = false;
  bool played_any = false;
  std::string committed_selection;
  // Guessed metadata, written with the entry's first record.
  std::map<std::string, MediaMetadata> pending_metadata;

  std::mutex join_mutex;
  std::thread sampler;
  std::thread watcher;
};

namespace {

bool is_over(SessionState state) {
  return state == SessionState::Ended || state == SessionState::Failed;
}

// Final record for an entry the player is done with.
ResumeRecord settle_record(const MediaIdentity &identity,
                           std::optional<double> position,
                           std::optional<double> reported_duration,
                           bool reached_end,
                           const std::optional<ResumeRecord> &prior,
                           double completion_threshold) {
  double duration = 0.0;
  if (reported_duration) {
    duration = *reported_duration;
  } else if (prior) {
    duration = prior->duration_seconds;
  }

  bool past_threshold = position && duration > 0 &&
                        *position >= completion_threshold * duration;

  ResumeRecord record;
  record.identity = identity;
  record.duration_seconds = duration;
  if (reached_end || past_threshold) {
    record.finished = true;
    record.position_seconds = position.value_or(duration);
  } else if (position) {
    record.position_seconds = *position;
  } else if (prior) {
    // Nothing observed: keep what we knew, never invent a position.
    record.position_seconds = prior->position_seconds;
    record.duration_seconds = prior->duration_seconds;
    record.finished = prior->finished;
  }
  record.updated_at = now_ms();
  return record;
}

} // namespace

ResumeCoordinator::ResumeCoordinator(PositionStore &store, Settings settings,
                                     DriverFactory factory)
    : store(store), settings(std::move(settings)), factory(std::move(factory)) {}

ResumeCoordinator::~ResumeCoordinator() {
  std::shared_ptr<Session> running;
  std::vector<std::shared_ptr<Session>> all;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex);
    running = active;
    for (const auto &entry : sessions) {
      all.push_back(entry.second);
    }
  }
  if (running) {
    try {
      stop(running->handle);
    } catch (const std::exception &e) {
      log::error("Coordinator", "stopping session {} on shutdown: {}",
                 running->handle.id, e.what());
    }
  }
  for (const auto &session : all) {
    join_threads(*session);
  }
}

SessionHandle ResumeCoordinator::start(const PlaybackRequest &request) {
  auto session = std::make_shared<Session>();
  std::vector<std::shared_ptr<Session>> retired;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex);
    if (active) {
      throw CueError(ErrorCode::SessionActive,
                     fmt::format("session {} is still playing", active->handle.id));
    }
    session->handle.id = next_id++;
    active = session;

    // Nothing is active, so every stored session has ended. Keep the newest.
    while (sessions.size() > 1) {
      retired.push_back(sessions.begin()->second);
      sessions.erase(sessions.begin());
    }
  }
  for (const auto &old : retired) {
    join_threads(*old);
    log::debug("Coordinator", "session {} released", old->handle.id);
  }
  retired.clear();

  std::vector<std::string> playlist;
  try {
    if (request.kind == PlaybackRequest::Kind::Folder) {
      FolderResolver resolver(store, settings);
      FolderResolution resolution = resolver.resolve(request.path);
      session->folder = resolution.folder;
      session->identity = MediaIdentity{MediaIdentity::Kind::FolderEntry,
                                        resolution.entry, resolution.folder};
      session->prior = resolution.record;
      playlist.assign(resolution.entries.begin() +
                          static_cast<std::ptrdiff_t>(resolution.index),
                      resolution.entries.end());
    } else {
      session->identity = MediaIdentity::file(request.path);
      std::error_code ec;
      if (!fs::is_regular_file(session->identity.path, ec)) {
        throw CueError(ErrorCode::InvalidIdentity,
                       session->identity.path + " is not a playable file");
      }
      session->prior = store.lookup(session->identity);
      playlist.push_back(session->identity.path);
    }

    session->start_offset = session->prior ? session->prior->resume_offset() : 0.0;
    session->driver = factory(settings);
    session->launch = session->driver->launch_playlist(playlist, session->start_offset);
  } catch (const std::exception &e) {
    log::error("Coordinator", "could not start {}: {}", request.path, e.what());
    {
      std::lock_guard<std::mutex> lock(session->mutex);
      session->state = SessionState::Failed;
    }
    std::lock_guard<std::mutex> lock(sessions_mutex);
    active.reset();
    throw;
  }

  // The threads do not exist yet, so nothing else reads these.
  session->title = metadata_for(*session, session->identity).clean_title;
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    session->state = SessionState::Running;
  }

  double effective_offset = session->launch.offset_honored ? session->start_offset : 0.0;
  log::info("Coordinator", "session {}: {} from {} ({} driver)", session->handle.id,
            session->identity.path, log::format_time(effective_offset),
            session->driver->name());
  if (playlist.size() > 1) {
    log::info("Coordinator", "session {}: {} more entries queued", session->handle.id,
              playlist.size() - 1);
  }
  if (session->start_offset > 0 && !session->launch.offset_honored) {
    log::warn("Coordinator", "{} cannot seek, starting from the beginning",
              session->driver->name());
  }
  notifications::send_resumed(session->title, effective_offset);

  // The watcher joins the sampler, so the sampler must exist first.
  session->sampler = std::thread(&ResumeCoordinator::run_sampler, this, session);
  session->watcher = std::thread(&ResumeCoordinator::run_watcher, this, session);

  std::lock_guard<std::mutex> lock(sessions_mutex);
  sessions[session->handle.id] = session;
  return session->handle;
}

void ResumeCoordinator::stop(SessionHandle handle) {
  auto session = find(handle);
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    session->stop_requested = true;
  }
  session->cv.notify_all();

  // A player that already exited only leaves the threads to collect.
  if (session->driver->is_alive()) {
    checkpoint(*session);
    session->driver->terminate();
  }

  {
    std::unique_lock<std::mutex> lock(session->mutex);
    session->cv.wait(lock, [&] { return is_over(session->state); });
  }
  join_threads(*session);
}

SessionStatus ResumeCoordinator::status(SessionHandle handle) const {
  return snapshot(*find(handle));
}

SessionStatus ResumeCoordinator::wait(SessionHandle handle) {
  auto session = find(handle);
  {
    std::unique_lock<std::mutex> lock(session->mutex);
    session->cv.wait(lock, [&] { return is_over(session->state); });
  }
  join_threads(*session);
  return snapshot(*session);
}

std::optional<SessionHandle> ResumeCoordinator::active_session() const {
  std::lock_guard<std::mutex> lock(sessions_mutex);
  if (active && sessions.count(active->handle.id) > 0) {
    return active->handle;
  }
  return std::nullopt;
}

std::optional<ResumeInfo>
ResumeCoordinator::resume_info(const PlaybackRequest &request) const {
  ResumeInfo info;
  std::optional<ResumeRecord> record;
  if (request.kind == PlaybackRequest::Kind::Folder) {
    FolderResolver resolver(store, settings);
    FolderResolution resolution = resolver.resolve(request.path);
    info.identity = MediaIdentity{MediaIdentity::Kind::FolderEntry,
                                  resolution.entry, resolution.folder};
    record = resolution.record;
  } else {
    info.identity = MediaIdentity::file(request.path);
    record = store.lookup(info.identity);
  }
  if (!record) {
    return std::nullopt;
  }
  info.record = *record;
  info.metadata = store.lookup_metadata(info.identity);
  return info;
}

bool ResumeCoordinator::forget(const std::string &path) {
  std::string normalized = normalize_path(path);
  bool removed = store.remove(normalized);
  if (removed) {
    log::info("Coordinator", "forgot {}", normalized);
  } else {
    log::info("Coordinator", "nothing stored for {}", normalized);
  }
  return removed;
}

MediaMetadata ResumeCoordinator::update_metadata(const std::string &path,
                                                 const std::optional<std::string> &title,
                                                 std::optional<int> season,
                                                 std::optional<bool> lock) {
  MediaIdentity identity = MediaIdentity::file(path);
  MediaMetadata metadata;
  if (auto existing = store.lookup_metadata(identity)) {
    metadata = *existing;
  } else {
    std::error_code ec;
    metadata = guess_metadata(identity.path, fs::is_directory(identity.path, ec));
  }

  bool unlocking = lock.has_value() && !*lock;
  if (title) {
    if (!metadata.user_locked_title || unlocking) {
      metadata.clean_title = *title;
    } else {
      log::info("Coordinator", "title of {} is locked, keeping \"{}\"",
                identity.path, metadata.clean_title);
    }
  }
  if (season) {
    metadata.season_number = *season;
  }
  if (lock) {
    metadata.user_locked_title = *lock;
  }

  store.commit_metadata(identity, metadata);
  return metadata;
}

std::shared_ptr<ResumeCoordinator::Session>
ResumeCoordinator::find(SessionHandle handle) const {
  std::lock_guard<std::mutex> lock(sessions_mutex);
  auto it = sessions.find(handle.id);
  if (it == sessions.end()) {
    throw CueError(ErrorCode::UnknownSession,
                   fmt::format("no session with id {}", handle.id));
  }
  return it->second;
}

void ResumeCoordinator::run_sampler(const std::shared_ptr<Session> &session) {
  const auto interval = settings.sample_interval();
  std::unique_lock<std::mutex> lock(session->mutex);
  while (true) {
    bool done = session->cv.wait_for(lock, interval, [&] {
      return session->stop_requested || session->process_exited;
    });
    if (done) {
      break;
    }
    lock.unlock();
    checkpoint(*session);
    lock.lock();
  }
}

void ResumeCoordinator::run_watcher(const std::shared_ptr<Session> &session) {
  int exit_status = -1;
  try {
    exit_status = session->driver->wait_for_exit();
  } catch (const std::exception &e) {
    log::error("Coordinator", "waiting for the player failed: {}", e.what());
  }
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    session->process_exited = true;
    session->exit_status = exit_status;
  }
  session->cv.notify_all();

  if (session->sampler.joinable()) {
    session->sampler.join();
  }
  finalize(*session);
}

void ResumeCoordinator::checkpoint(Session &session) {
  MediaIdentity identity;
  std::optional<ResumeRecord> prior;
  {
    std::lock_guard<std::mutex> commit_lock(session.commit_mutex);
    if (session.finalized) {
      return;
    }
    advance_entries(session);
    identity = session.identity;
    prior = session.prior;
  }

  double position = 0.0;
  try {
    position = session.driver->query_position();
  } catch (const CueError &e) {
    if (e.is_transient()) {
      log::debug("Coordinator", "checkpoint skipped: {}", e.what());
    } else {
      log::warn("Coordinator", "checkpoint skipped: {}", e.what());
    }
    return;
  }

  ResumeRecord record;
  record.identity = identity;
  record.position_seconds = position;
  if (auto duration = session.driver->duration()) {
    record.duration_seconds = *duration;
  } else if (prior) {
    record.duration_seconds = prior->duration_seconds;
  }
  record.finished = false;
  record.updated_at = now_ms();

  std::lock_guard<std::mutex> commit_lock(session.commit_mutex);
  if (session.finalized || !(session.identity == identity)) {
    return;
  }
  // The position may already belong to the next entry.
  std::string current = session.driver->current_entry();
  if (!current.empty() && current != identity.path) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(session.mutex);
    session.last_position = position;
  }
  if (commit_entry(session, record, "checkpoint")) {
    log::debug("Coordinator", "checkpoint {} at {}", identity.path,
               log::format_time(position));
  }
}

void ResumeCoordinator::finalize(Session &session) {
  std::optional<ResumeRecord> committed;
  bool nothing_played = false;
  std::string title;
  {
    std::lock_guard<std::mutex> commit_lock(session.commit_mutex);
    advance_entries(session);
    session.finalized = true;
    title = session.title;

    std::optional<double> position = session.driver->last_known_position();
    {
      std::lock_guard<std::mutex> lock(session.mutex);
      if (!position) {
        position = session.last_position;
      }
    }

    if (session.driver->load_failed() && !position) {
      log::error("Coordinator", "session {}: player could not open {}",
                 session.handle.id, session.identity.path);
      {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.warnings.push_back("could not open " + session.identity.path);
      }
      notifications::send_load_failed(title);
      nothing_played = !session.played_any;
    } else {
      ResumeRecord record = settle_record(
          session.identity, position, session.driver->duration(),
          session.driver->reached_end(), session.prior, settings.completion_threshold);
      commit_entry(session, record, "final position");
      committed = record;
    }
  }

  if (committed && committed->finished) {
    log::info("Coordinator", "session {}: {} finished", session.handle.id,
              committed->identity.path);
    notifications::send_finished(title);
  } else if (committed) {
    log::info("Coordinator", "session {}: {} stopped at {}", session.handle.id,
              committed->identity.path, log::format_time(committed->position_seconds));
  }

  {
    std::lock_guard<std::mutex> lock(session.mutex);
    session.final_record = committed;
    session.state = nothing_played ? SessionState::Failed : SessionState::Ended;
  }
  session.cv.notify_all();

  std::lock_guard<std::mutex> lock(sessions_mutex);
  if (active.get() == &session) {
    active.reset();
  }
}

void ResumeCoordinator::advance_entries(Session &session) {
  for (const auto &outcome : session.driver->take_finished_entries()) {
    MediaIdentity identity = identity_for(session, outcome.path);
    if (outcome.load_failed && !outcome.last_position) {
      log::warn("Coordinator", "session {}: player could not open {}, skipped",
                session.handle.id, outcome.path);
      session.pending_metadata.erase(outcome.path);
      std::lock_guard<std::mutex> lock(session.mutex);
      session.warnings.push_back("could not open " + outcome.path);
      continue;
    }

    bool was_current = identity == session.identity;
    std::optional<ResumeRecord> prior =
        was_current ? session.prior : store.lookup(identity);
    std::string title =
        was_current ? session.title : metadata_for(session, identity).clean_title;
    ResumeRecord record =
        settle_record(identity, outcome.last_position, outcome.duration,
                      outcome.reached_end, prior, settings.completion_threshold);
    if (commit_entry(session, record, "final position") && record.finished) {
      log::info("Coordinator", "session {}: {} finished", session.handle.id,
                identity.path);
      notifications::send_finished(title);
    }
  }

  std::string current = session.driver->current_entry();
  if (current.empty() || current == session.identity.path) {
    return;
  }
  MediaIdentity next = identity_for(session, current);
  std::optional<ResumeRecord> prior = store.lookup(next);
  std::string title = metadata_for(session, next).clean_title;
  {
    std::lock_guard<std::mutex> lock(session.mutex);
    session.identity = next;
    session.prior = prior;
    session.title = title;
    session.last_position.reset();
  }
  log::info("Coordinator", "session {}: moved on to {}", session.handle.id, current);
  notifications::send_resumed(title, 0.0);
}

bool ResumeCoordinator::commit_entry(Session &session, const ResumeRecord &record,
                                     const std::string &what) {
  if (!commit_with_retry(session, what, [&] { store.commit(record); })) {
    return false;
  }
  session.played_any = true;

  auto pending = session.pending_metadata.find(record.identity.path);
  if (pending != session.pending_metadata.end()) {
    // A title set while playing wins over the guess.
    if (!store.lookup_metadata(record.identity)) {
      commit_with_retry(session, "metadata", [&] {
        store.commit_metadata(record.identity, pending->second);
      });
    }
    session.pending_metadata.erase(pending);
  }

  if (record.identity.kind == MediaIdentity::Kind::FolderEntry &&
      session.committed_selection != record.identity.path) {
    FolderRecord folder{record.identity.folder, record.identity.path};
    if (commit_with_retry(session, "folder selection",
                          [&] { store.commit_folder(folder); })) {
      session.committed_selection = record.identity.path;
    }
  }
  return true;
}

void ResumeCoordinator::join_threads(Session &session) {
  std::lock_guard<std::mutex> lock(session.join_mutex);
  if (session.watcher.joinable()) {
    session.watcher.join();
  }
}

bool ResumeCoordinator::commit_with_retry(Session &session, const std::string &what,
                                          const std::function<void()> &write) {
  const int attempts = 1 + std::max(0, settings.store_write_retries);
  auto backoff = settings.store_retry_backoff;
  for (int attempt = 1;; ++attempt) {
    try {
      write();
      return true;
    } catch (const CueError &e) {
      if (e.code() != ErrorCode::StoreWriteFailed) {
        throw;
      }
      if (attempt >= attempts) {
        log::error("Coordinator", "{} for {} not saved after {} attempts: {}",
                   what, session.identity.path, attempts, e.what());
        {
          std::lock_guard<std::mutex> lock(session.mutex);
          session.warnings.push_back(e.what());
        }
        notifications::send_store_warning(e.what());
        return false;
      }
      log::warn("Coordinator", "{} not saved, retrying in {}ms: {}", what,
                backoff.count(), e.what());
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
}

MediaIdentity ResumeCoordinator::identity_for(const Session &session,
                                              const std::string &path) const {
  if (session.folder.empty()) {
    return MediaIdentity::file(path);
  }
  return MediaIdentity{MediaIdentity::Kind::FolderEntry, path, session.folder};
}

MediaMetadata ResumeCoordinator::metadata_for(Session &session,
                                              const MediaIdentity &identity) {
  if (auto existing = store.lookup_metadata(identity)) {
    return *existing;
  }

  MediaMetadata guessed = guess_metadata(identity.path, false);
  if (identity.kind == MediaIdentity::Kind::FolderEntry && !guessed.season_number) {
    // "Show/Season 2/ep1.mkv": the folder names the show and season.
    MediaMetadata from_folder = guess_metadata(identity.folder, true);
    if (from_folder.season_number) {
      guessed = from_folder;
    }
  }
  session.pending_metadata[identity.path] = guessed;
  return guessed;
}

SessionStatus ResumeCoordinator::snapshot(const Session &session) const {
  SessionStatus status;
  status.handle = session.handle;
  status.start_offset = session.start_offset;
  status.offset_honored = session.launch.offset_honored;
  status.precision = session.launch.precision;

  std::lock_guard<std::mutex> lock(session.mutex);
  status.identity = session.identity;
  status.title = session.title;
  status.state = session.state;
  status.last_position = session.last_position;
  status.warnings = session.warnings;
  status.final_record = session.final_record;
  status.exit_status = session.exit_status;
  return status;
}

} // namespace cue
