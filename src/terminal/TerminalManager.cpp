#include "TerminalManager.hpp"

namespace mt {
TerminalManager::TerminalManager(shared_ptr<EventLoop> _loop,
                                 shared_ptr<EventBus> _bus,
                                 shared_ptr<TerminalBackend> _backend,
                                 RenderEngineFactory _engineFactory,
                                 shared_ptr<Clipboard> _clipboard,
                                 const TerminalConfig& _config)
    : loop(_loop),
      bus(_bus),
      backend(_backend),
      engineFactory(_engineFactory),
      clipboard(_clipboard),
      config(_config),
      registry(new SessionRegistry()),
      bridge(new ConnectionBridge(_backend, _config.softErrorThreshold)),
      router(new EventRouter(_bus)),
      reorderController(
          [this](int fromIndex, int toIndex) { reorder(fromIndex, toIndex); },
          [this](const string& sessionId, const string& payload,
                 const Point& pointer) {
            if (detachHandler) {
              detachHandler(sessionId, payload, pointer);
            }
          }),
      mounted(false),
      terminalFocused(false),
      panelWidth(0),
      panelHeight(0) {
  dispatcher.reset(new KeyboardDispatcher(this));
  bridge->setSoftErrorHandler(
      [this](const string& connectionId, const string& error) {
        auto session = registry->findByConnection(connectionId);
        if (!session) {
          return;
        }
        LOG(WARNING) << "Session " << session->id
                     << " keeps failing to reach its shell: " << error;
        softErrors.insert(session->id);
      });
}

TerminalManager::~TerminalManager() {
  dispatcher->detach();
  shutdown();
}

void TerminalManager::mount(int width, int height) {
  LOG(INFO) << "Mounting terminal panel at " << width << "x" << height;
  mounted = true;
  setPanelSize(width, height);
  dispatcher->attach();
  if (registry->empty()) {
    openSession();
  }
  for (auto& session : registry->all()) {
    ensureSurface(session->id);
  }
  focusActive();
}

void TerminalManager::unmount() {
  LOG(INFO) << "Unmounting terminal panel";
  mounted = false;
  terminalFocused = false;
  dispatcher->detach();
}

void TerminalManager::setPanelSize(int width, int height) {
  panelWidth = width;
  panelHeight = height;
  for (auto& it : surfaces) {
    it.second.viewport->setSize(width, height);
  }
}

string TerminalManager::openSession(const optional<string>& name,
                                    const optional<string>& directory,
                                    const optional<string>& shell) {
  string sessionDirectory = directory ? *directory : config.startDirectory();
  string sessionName;
  if (name && !name->empty()) {
    sessionName = *name;
  } else {
    sessionName = fs::path(sessionDirectory).filename().string();
    if (sessionName.empty()) {
      sessionName = "terminal";
    }
  }
  optional<string> sessionShell = shell;
  if (!sessionShell && !config.shell.empty()) {
    sessionShell = config.shell;
  }

  string sessionId =
      registry->create(sessionName, sessionDirectory, sessionShell);
  if (mounted) {
    ensureSurface(sessionId);
  }
  focusActive();
  return sessionId;
}

void TerminalManager::closeSession(const string& sessionId) {
  auto it = surfaces.find(sessionId);
  if (it != surfaces.end()) {
    SurfaceEntry entry = it->second;
    surfaces.erase(it);
    try {
      entry.surface->close();
    } catch (const std::exception& ex) {
      STERROR << "Error closing surface of " << sessionId << ": " << ex.what();
    }
  }
  softErrors.erase(sessionId);
  if (!registry->get(sessionId)) {
    VLOG(1) << "Ignoring close of unknown session " << sessionId;
    return;
  }
  registry->close(sessionId);
  focusActive();
}

void TerminalManager::closeSessions(const vector<string>& sessionIds) {
  for (auto& sessionId : sessionIds) {
    closeSession(sessionId);
  }
}

void TerminalManager::closeOthers(const string& sessionId) {
  vector<string> doomed;
  for (auto& session : registry->all()) {
    if (session->id != sessionId && !session->isPinned) {
      doomed.push_back(session->id);
    }
  }
  closeSessions(doomed);
}

void TerminalManager::closeToRight(const string& sessionId) {
  int index = registry->indexOf(sessionId);
  if (index < 0) {
    return;
  }
  vector<string> doomed;
  auto sessions = registry->all();
  for (int a = index + 1; a < int(sessions.size()); a++) {
    if (!sessions[a]->isPinned) {
      doomed.push_back(sessions[a]->id);
    }
  }
  closeSessions(doomed);
}

void TerminalManager::closeAll() {
  vector<string> doomed;
  for (auto& session : registry->all()) {
    if (!session->isPinned) {
      doomed.push_back(session->id);
    }
  }
  closeSessions(doomed);
}

void TerminalManager::shutdown() {
  if (!surfaces.empty() || !registry->empty()) {
    LOG(INFO) << "Shutting down " << registry->size() << " sessions";
  }
  map<string, SurfaceEntry> doomed;
  doomed.swap(surfaces);
  for (auto& it : doomed) {
    try {
      it.second.surface->close();
    } catch (const std::exception& ex) {
      STERROR << "Error closing surface of " << it.first << ": " << ex.what();
    }
  }
  softErrors.clear();
  registry->clearAll();
  terminalFocused = false;
}

void TerminalManager::activate(const string& sessionId) {
  registry->setActive(sessionId);
  focusActive();
}

bool TerminalManager::pin(const string& sessionId, bool pinned) {
  return registry->setPinned(sessionId, pinned);
}

bool TerminalManager::rename(const string& sessionId, const string& name) {
  return registry->rename(sessionId, name);
}

bool TerminalManager::reorder(int fromIndex, int toIndex) {
  if (!registry->reorder(fromIndex, toIndex)) {
    return false;
  }
  registry->activateIndex(toIndex);
  focusActive();
  return true;
}

void TerminalManager::toggleSplit() {
  auto session = registry->active();
  if (!session) {
    return;
  }
  string sessionId = session->id;
  if (session->splitMode) {
    optional<string> partnerId = session->splitWithId;
    registry->setSplit(sessionId, nullopt);
    if (partnerId) {
      closeSession(*partnerId);
    }
    return;
  }
  // The partner shell starts where the active one is
  string partnerId =
      openSession(nullopt, session->currentDirectory, session->shell);
  registry->setSplit(sessionId, partnerId);
  activate(sessionId);
}

bool TerminalManager::search(const string& query, bool forward) {
  registry->setSearchQuery(query);
  auto surface = getActiveSurface();
  if (!surface) {
    return false;
  }
  return forward ? surface->findNext(query) : surface->findPrevious(query);
}

void TerminalManager::sendInput(const string& sessionId, const string& data) {
  auto surface = getSurface(sessionId);
  if (!surface) {
    VLOG(1) << "No surface for " << sessionId;
    return;
  }
  surface->sendInput(data);
}

bool TerminalManager::isTerminalFocused() {
  auto surface = getActiveSurface();
  return terminalFocused && surface &&
         surface->getState() == SurfaceState::READY;
}

void TerminalManager::nextSession() {
  registry->next();
  focusActive();
}

void TerminalManager::previousSession() {
  registry->previous();
  focusActive();
}

void TerminalManager::newSession() {
  auto active = registry->active();
  if (active) {
    openSession(nullopt, active->currentDirectory);
  } else {
    openSession();
  }
}

void TerminalManager::closeActiveSession() {
  string activeId = registry->activeId();
  if (!activeId.empty()) {
    closeSession(activeId);
  }
}

void TerminalManager::openSearch() { registry->setSearchVisible(true); }

void TerminalManager::closeSearch() {
  registry->setSearchVisible(false);
  focusActive();
}

void TerminalManager::zoomIn() {
  registry->zoomIn();
  applyZoom();
}

void TerminalManager::zoomOut() {
  registry->zoomOut();
  applyZoom();
}

void TerminalManager::resetZoom() {
  registry->resetZoom();
  applyZoom();
}

void TerminalManager::activateIndex(int index) {
  if (registry->activateIndex(index)) {
    focusActive();
  }
}

shared_ptr<TerminalSurface> TerminalManager::getSurface(
    const string& sessionId) {
  auto it = surfaces.find(sessionId);
  if (it == surfaces.end()) {
    return nullptr;
  }
  return it->second.surface;
}

shared_ptr<Viewport> TerminalManager::getViewport(const string& sessionId) {
  auto it = surfaces.find(sessionId);
  if (it == surfaces.end()) {
    return nullptr;
  }
  return it->second.viewport;
}

shared_ptr<TerminalSurface> TerminalManager::getActiveSurface() {
  return getSurface(registry->activeId());
}

int TerminalManager::numRunning() {
  int running = 0;
  for (auto& it : surfaces) {
    auto state = it.second.surface->getState();
    if ((state == SurfaceState::READY ||
         state == SurfaceState::INITIALIZING) &&
        !it.second.surface->hasTerminated()) {
      running++;
    }
  }
  return running;
}

void TerminalManager::ensureSurface(const string& sessionId) {
  if (surfaces.find(sessionId) != surfaces.end()) {
    return;
  }
  SurfaceEntry entry;
  entry.viewport.reset(new Viewport(panelWidth, panelHeight));
  entry.surface.reset(new TerminalSurface(sessionId, loop, registry, bridge,
                                          router, engineFactory, clipboard,
                                          config.surfaceConfig()));
  entry.surface->setTerminatedHandler(
      [this](const string& terminatedId, int exitStatus) {
        if (terminatedHandler) {
          terminatedHandler(terminatedId, exitStatus);
        }
      });
  surfaces[sessionId] = entry;
  entry.surface->mount(entry.viewport.get());
}

void TerminalManager::focusActive() {
  auto surface = getActiveSurface();
  if (surface && surface->focus()) {
    terminalFocused = true;
  }
}

void TerminalManager::applyZoom() {
  double level = registry->getZoom();
  LOG(INFO) << "Zoom set to " << registry->getZoomPercentage() << "%";
  for (auto& it : surfaces) {
    if (!registry->get(it.first)) {
      LOG(ERROR) << "Surface without a session: " << it.first;
      continue;
    }
    it.second.surface->setZoom(level);
  }
}
}  // namespace mt
