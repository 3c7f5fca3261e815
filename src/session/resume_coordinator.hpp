#pragma once

#include "../core/config/settings.hpp"
#include "../core/media.hpp"
#include "../player/driver_factory.hpp"
#include "../storage/position_store.hpp"
#include "session.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cue {

// Owns playback sessions: resolves what to play and from where, launches the
// player through a driver, checkpoints the position while it runs and
// commits the final state when it exits. One session at a time.
//
// A folder session queues the chosen entry and everything after it. When
// the player moves on, the outgoing entry gets its final record and the
// session follows the new entry.
//
// Ended sessions are kept only until the next start(): the previous session
// stays queryable, older handles become UnknownSession.
class ResumeCoordinator {
public:
  ResumeCoordinator(PositionStore &store, Settings settings,
                    DriverFactory factory = make_driver);
  ~ResumeCoordinator();

  ResumeCoordinator(const ResumeCoordinator &) = delete;
  ResumeCoordinator &operator=(const ResumeCoordinator &) = delete;

  // Blocks until the player is up (bounded by the connect timeout).
  // Throws CueError(SessionActive | NoPlayableEntries | InvalidIdentity |
  // SpawnFailed | ConnectTimeout); the store is untouched when it throws.
  SessionHandle start(const PlaybackRequest &request);

  // Final checkpoint, terminate, wait for Ended. Idempotent.
  void stop(SessionHandle handle);

  SessionStatus status(SessionHandle handle) const;

  // Blocks until the player exits on its own (or is stopped).
  SessionStatus wait(SessionHandle handle);

  std::optional<SessionHandle> active_session() const;

  std::optional<ResumeInfo> resume_info(const PlaybackRequest &request) const;

  // Explicit user deletion. False when nothing was stored for the path.
  bool forget(const std::string &path);

  // A locked title only changes when the same call passes lock = false.
  MediaMetadata update_metadata(const std::string &path,
                                const std::optional<std::string> &title,
                                std::optional<int> season,
                                std::optional<bool> lock);

private:
  struct Session;

  std::shared_ptr<Session> find(SessionHandle handle) const;
  void run_sampler(const std::shared_ptr<Session> &session);
  void run_watcher(const std::shared_ptr<Session> &session);
  void checkpoint(Session &session);
  void finalize(Session &session);
  void advance_entries(Session &session);
  bool commit_entry(Session &session, const ResumeRecord &record,
                    const std::string &what);
  void join_threads(Session &session);
  bool commit_with_retry(Session &session, const std::string &what,
                         const std::function<void()> &write);
  MediaIdentity identity_for(const Session &session, const std::string &path) const;
  MediaMetadata metadata_for(Session &session, const MediaIdentity &identity);
  SessionStatus snapshot(const Session &session) const;

  PositionStore &store;
  Settings settings;
  DriverFactory factory;

  mutable std::mutex sessions_mutex;
  std::map<uint64_t, std::shared_ptr<Session>> sessions;
  std::shared_ptr<Session> active;
  uint64_t next_id = 1;
};

} // namespace cue
