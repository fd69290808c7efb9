#include "SessionRegistry.hpp"

#include "JsonLib.hpp"

namespace mt {
namespace {
const double ZOOM_LEVELS[] = {0.5, 0.75, 0.9, 1.0, 1.1, 1.25, 1.5, 1.75, 2.0};
const int NUM_ZOOM_LEVELS = sizeof(ZOOM_LEVELS) / sizeof(ZOOM_LEVELS[0]);

int64_t toMillis(const WallTime& t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

// First ladder entry strictly above level, the top one if none is
double nextZoomLevel(double level) {
  for (int a = 0; a < NUM_ZOOM_LEVELS; a++) {
    if (ZOOM_LEVELS[a] > level + 1e-9) {
      return ZOOM_LEVELS[a];
    }
  }
  return ZOOM_LEVELS[NUM_ZOOM_LEVELS - 1];
}

// Last ladder entry strictly below level, the bottom one if none is
double previousZoomLevel(double level) {
  for (int a = NUM_ZOOM_LEVELS - 1; a >= 0; a--) {
    if (ZOOM_LEVELS[a] < level - 1e-9) {
      return ZOOM_LEVELS[a];
    }
  }
  return ZOOM_LEVELS[0];
}
}  // namespace

SessionRegistry::SessionRegistry()
    : searchVisible(false), zoomLevel(DEFAULT_ZOOM), idCounter(0) {}

string SessionRegistry::create(const string& name, const string& directory,
                               const optional<string>& shell) {
  auto session = make_shared<Session>();
  session->name = uniqueName(name);
  session->id = generateId(session->name);
  session->currentDirectory = directory;
  if (shell && !shell->empty()) {
    session->shell = shell;
  }
  session->createdAt = std::chrono::system_clock::now();
  session->lastActivity = session->createdAt;

  for (auto& it : sessions) {
    it->isActive = false;
  }
  session->isActive = true;
  sessions.push_back(session);
  activeSessionId = session->id;
  LOG(INFO) << "Created session " << session->id << " (" << session->name
            << ") in " << directory;
  return session->id;
}

void SessionRegistry::close(const string& id) {
  auto it = find_if(sessions.begin(), sessions.end(),
                    [&id](const shared_ptr<Session>& s) { return s->id == id; });
  if (it == sessions.end()) {
    VLOG(1) << "Tried to close unknown session " << id;
    return;
  }
  sessions.erase(it);
  LOG(INFO) << "Closed session " << id;

  if (activeSessionId == id) {
    activeSessionId.clear();
    if (!sessions.empty()) {
      shared_ptr<Session> nextSession = sessions.front();
      for (auto& candidate : sessions) {
        if (!candidate->isPinned) {
          nextSession = candidate;
          break;
        }
      }
      activate(nextSession);
    }
  }

  for (auto& s : sessions) {
    if (s->splitWithId && *(s->splitWithId) == id) {
      s->splitMode = false;
      s->splitWithId.reset();
    }
  }
}

void SessionRegistry::setActive(const string& id) {
  auto session = find(id);
  if (!session) {
    VLOG(1) << "Ignoring activation of unknown session " << id;
    return;
  }
  activate(session);
}

bool SessionRegistry::update(const string& id, const SessionUpdate& fields) {
  auto session = find(id);
  if (!session) {
    return false;
  }
  if (fields.name) {
    session->name = *fields.name;
  }
  if (fields.currentDirectory) {
    session->currentDirectory = *fields.currentDirectory;
  }
  if (fields.shell) {
    session->shell = *fields.shell;
  }
  if (fields.isPinned) {
    session->isPinned = *fields.isPinned;
  }
  if (fields.connectionId) {
    session->connectionId = *fields.connectionId;
  }
  if (fields.selection) {
    session->selection = *fields.selection;
  }
  if (fields.title) {
    session->title = *fields.title;
  }
  if (fields.lastActivity) {
    session->lastActivity = *fields.lastActivity;
  } else {
    session->lastActivity = std::chrono::system_clock::now();
  }
  return true;
}

void SessionRegistry::clearAll() {
  LOG(INFO) << "Clearing " << sessions.size() << " sessions";
  sessions.clear();
  activeSessionId.clear();
  searchVisible = false;
  searchQuery.clear();
  zoomLevel = DEFAULT_ZOOM;
}

bool SessionRegistry::rename(const string& id, const string& name) {
  auto session = find(id);
  if (!session || name.empty()) {
    return false;
  }
  session->name = name;
  return true;
}

bool SessionRegistry::setPinned(const string& id, bool pinned) {
  auto session = find(id);
  if (!session) {
    return false;
  }
  session->isPinned = pinned;
  return true;
}

bool SessionRegistry::setSplit(const string& id,
                               const optional<string>& partnerId) {
  auto session = find(id);
  if (!session) {
    return false;
  }
  session->splitMode = bool(partnerId);
  session->splitWithId = partnerId;
  return true;
}

bool SessionRegistry::reorder(int fromIndex, int toIndex) {
  int count = int(sessions.size());
  if (fromIndex < 0 || fromIndex >= count || toIndex < 0 || toIndex >= count) {
    LOG(WARNING) << "Ignoring reorder " << fromIndex << " -> " << toIndex
                 << " with " << count << " sessions";
    return false;
  }
  if (fromIndex == toIndex) {
    return true;
  }
  auto moved = sessions[fromIndex];
  sessions.erase(sessions.begin() + fromIndex);
  sessions.insert(sessions.begin() + toIndex, moved);
  return true;
}

void SessionRegistry::next() {
  if (sessions.size() <= 1) {
    return;
  }
  int current = indexOf(activeSessionId);
  int nextIndex = (current + 1) % int(sessions.size());
  activate(sessions[nextIndex]);
}

void SessionRegistry::previous() {
  if (sessions.size() <= 1) {
    return;
  }
  int current = indexOf(activeSessionId);
  int prevIndex = current <= 0 ? int(sessions.size()) - 1 : current - 1;
  activate(sessions[prevIndex]);
}

bool SessionRegistry::activateIndex(int index) {
  if (index < 0 || index >= int(sessions.size())) {
    return false;
  }
  activate(sessions[index]);
  return true;
}

vector<shared_ptr<const Session>> SessionRegistry::all() const {
  return vector<shared_ptr<const Session>>(sessions.begin(), sessions.end());
}

shared_ptr<const Session> SessionRegistry::get(const string& id) const {
  return find(id);
}

shared_ptr<const Session> SessionRegistry::active() const {
  if (activeSessionId.empty()) {
    return nullptr;
  }
  return find(activeSessionId);
}

int SessionRegistry::indexOf(const string& id) const {
  for (size_t a = 0; a < sessions.size(); a++) {
    if (sessions[a]->id == id) {
      return int(a);
    }
  }
  return -1;
}

shared_ptr<const Session> SessionRegistry::findByConnection(
    const string& connectionId) const {
  for (auto& it : sessions) {
    if (it->connectionId && *(it->connectionId) == connectionId) {
      return it;
    }
  }
  return nullptr;
}

double SessionRegistry::setZoom(double level) {
  zoomLevel = max(MIN_ZOOM, min(MAX_ZOOM, level));
  return zoomLevel;
}

double SessionRegistry::zoomIn() {
  return setZoom(nextZoomLevel(zoomLevel));
}

double SessionRegistry::zoomOut() {
  return setZoom(previousZoomLevel(zoomLevel));
}

double SessionRegistry::resetZoom() { return setZoom(DEFAULT_ZOOM); }

int SessionRegistry::getZoomPercentage() const {
  return int(zoomLevel * 100.0 + 0.5);
}

string SessionRegistry::toJsonString() const {
  json state;
  state["activeSessionId"] = activeSessionId;
  state["searchVisible"] = searchVisible;
  state["searchQuery"] = searchQuery;
  state["zoomLevel"] = zoomLevel;
  state["sessions"] = json::array();
  for (auto& s : sessions) {
    json session;
    session["id"] = s->id;
    session["name"] = s->name;
    session["currentDirectory"] = s->currentDirectory;
    session["isActive"] = s->isActive;
    session["isPinned"] = s->isPinned;
    session["splitMode"] = s->splitMode;
    if (s->shell) {
      session["shell"] = *(s->shell);
    }
    if (s->splitWithId) {
      session["splitWithId"] = *(s->splitWithId);
    }
    if (s->connectionId) {
      session["connectionId"] = *(s->connectionId);
    }
    if (s->title) {
      session["title"] = *(s->title);
    }
    session["createdAt"] = toMillis(s->createdAt);
    session["lastActivity"] = toMillis(s->lastActivity);
    state["sessions"].push_back(session);
  }
  return state.dump();
}

shared_ptr<Session> SessionRegistry::find(const string& id) const {
  for (auto& it : sessions) {
    if (it->id == id) {
      return it;
    }
  }
  return nullptr;
}

string SessionRegistry::generateId(const string& name) {
  string sanitized = name;
  for (auto& c : sanitized) {
    if (!isalnum(static_cast<unsigned char>(c))) {
      c = '_';
    }
  }
  idCounter++;
  return string("terminal_") + sanitized + "_" +
         to_string(toMillis(std::chrono::system_clock::now())) + "_" +
         to_string(idCounter) + genRandomAlphaNum(4);
}

string SessionRegistry::uniqueName(const string& baseName) const {
  set<string> existingNames;
  for (auto& it : sessions) {
    existingNames.insert(it->name);
  }
  string name = baseName;
  int counter = 0;
  while (existingNames.find(name) != existingNames.end()) {
    counter++;
    name = baseName + " (" + to_string(counter) + ")";
  }
  return name;
}

void SessionRegistry::activate(const shared_ptr<Session>& session) {
  for (auto& it : sessions) {
    it->isActive = false;
  }
  session->isActive = true;
  session->lastActivity = std::chrono::system_clock::now();
  activeSessionId = session->id;
}
}  // namespace mt
