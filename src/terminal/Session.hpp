#ifndef __MT_SESSION_HPP__
#define __MT_SESSION_HPP__

#include "Headers.hpp"

namespace mt {
/**
 * @brief Metadata for one terminal tab.  Pure state, no I/O.
 */
struct Session {
  string id;
  string name;
  string currentDirectory;
  optional<string> shell;
  bool isActive = false;
  bool isPinned = false;
  bool splitMode = false;
  optional<string> splitWithId;
  optional<string> connectionId;
  optional<string> selection;
  optional<string> title;
  WallTime createdAt;
  WallTime lastActivity;
};

/**
 * @brief Partial update merged into a Session by `SessionRegistry::update`.
 *
 * Only the engaged fields are applied.  `connectionId` and `title` use a
 * nested optional so a caller can explicitly clear them.  When
 * `lastActivity` is left empty the registry stamps the current time.
 */
struct SessionUpdate {
  optional<string> name;
  optional<string> currentDirectory;
  optional<optional<string>> shell;
  optional<bool> isPinned;
  optional<optional<string>> connectionId;
  optional<string> selection;
  optional<optional<string>> title;
  optional<WallTime> lastActivity;
};
}  // namespace mt

#endif  // __MT_SESSION_HPP__
