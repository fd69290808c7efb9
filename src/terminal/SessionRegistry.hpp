#ifndef __MT_SESSION_REGISTRY_HPP__
#define __MT_SESSION_REGISTRY_HPP__

#include "Headers.hpp"
#include "Session.hpp"

namespace mt {
/** @brief Smallest zoom factor the panel accepts. */
const double MIN_ZOOM = 0.5;
/** @brief Largest zoom factor the panel accepts. */
const double MAX_ZOOM = 2.0;
const double DEFAULT_ZOOM = 1.0;

/**
 * @brief Keeps track of terminal sessions, the active session, and the
 * panel-wide search and zoom state.
 *
 * The registry only holds state: it never opens or closes backend
 * connections.  Sessions are kept in tab order.
 */
class SessionRegistry {
 public:
  SessionRegistry();

  /**
   * @brief Adds a new session and makes it the active one.
   *
   * `name` is made unique among the live sessions by appending " (n)".
   * @return The id of the new session.
   */
  string create(const string& name, const string& directory,
                const optional<string>& shell = nullopt);
  /**
   * @brief Removes a session.  When it was active, the first remaining
   * non-pinned session (or the first session if all are pinned) becomes
   * active.  Unknown ids are ignored.
   */
  void close(const string& id);
  /** @brief Activates `id` and stamps its activity.  No-op if unknown. */
  void setActive(const string& id);
  /**
   * @brief Merges `fields` into the session.  Stamps `lastActivity` unless
   * the update carries its own value.
   * @return false if the session does not exist.
   */
  bool update(const string& id, const SessionUpdate& fields);
  /** @brief Drops every session and resets search and zoom. */
  void clearAll();

  bool rename(const string& id, const string& name);
  bool setPinned(const string& id, bool pinned);
  /** @brief Sets (or clears, with nullopt) the split partner of `id`. */
  bool setSplit(const string& id, const optional<string>& partnerId);
  /** @brief Moves the session at `fromIndex` to `toIndex`. */
  bool reorder(int fromIndex, int toIndex);
  /** @brief Activates the next session, wrapping around. */
  void next();
  /** @brief Activates the previous session, wrapping around. */
  void previous();
  /** @brief Activates the session at a tab index if there is one. */
  bool activateIndex(int index);

  vector<shared_ptr<const Session>> all() const;
  shared_ptr<const Session> get(const string& id) const;
  shared_ptr<const Session> active() const;
  const string& activeId() const { return activeSessionId; }
  int indexOf(const string& id) const;
  int size() const { return int(sessions.size()); }
  bool empty() const { return sessions.empty(); }
  /** @brief Finds the session bound to a connection id, if any. */
  shared_ptr<const Session> findByConnection(const string& connectionId) const;

  bool isSearchVisible() const { return searchVisible; }
  void setSearchVisible(bool visible) { searchVisible = visible; }
  const string& getSearchQuery() const { return searchQuery; }
  void setSearchQuery(const string& query) { searchQuery = query; }

  double getZoom() const { return zoomLevel; }
  /** @brief Stores `level` clamped to [MIN_ZOOM, MAX_ZOOM]. */
  double setZoom(double level);
  /** @brief Steps to the next zoom level on the ladder. */
  double zoomIn();
  /** @brief Steps to the previous zoom level on the ladder. */
  double zoomOut();
  double resetZoom();
  int getZoomPercentage() const;

  /** @brief Serializes the sessions and panel state for debugging. */
  string toJsonString() const;

 protected:
  shared_ptr<Session> find(const string& id) const;
  string generateId(const string& name);
  string uniqueName(const string& baseName) const;
  void activate(const shared_ptr<Session>& session);

  vector<shared_ptr<Session>> sessions;
  string activeSessionId;
  bool searchVisible;
  string searchQuery;
  double zoomLevel;
  int64_t idCounter;
};
}  // namespace mt

#endif  // __MT_SESSION_REGISTRY_HPP__
