#include "TerminalSurface.hpp"

namespace mt {
namespace {
const char* ERROR_PREFIX = "\r\n\x1b[31mError: ";
const char* SESSION_CLOSED_LINE = "\r\n\x1b[33mTerminal session closed\x1b[0m";
const char* RESET_ATTRIBUTES = "\x1b[0m";
}  // namespace

string surfaceStateName(SurfaceState state) {
  switch (state) {
    case SurfaceState::UNINITIALIZED:
      return "uninitialized";
    case SurfaceState::INITIALIZING:
      return "initializing";
    case SurfaceState::READY:
      return "ready";
    case SurfaceState::ERRORED:
      return "errored";
    case SurfaceState::CLOSED:
      return "closed";
  }
  return "unknown";
}

TerminalSurface::TerminalSurface(
    const string& _sessionId, shared_ptr<EventLoop> _loop,
    shared_ptr<SessionRegistry> _registry, shared_ptr<ConnectionBridge> _bridge,
    shared_ptr<EventRouter> _router, RenderEngineFactory _engineFactory,
    shared_ptr<Clipboard> _clipboard, const SurfaceConfig& _config)
    : sessionId(_sessionId),
      loop(_loop),
      registry(_registry),
      bridge(_bridge),
      router(_router),
      engineFactory(_engineFactory),
      clipboard(_clipboard),
      config(_config),
      zoom(_registry->getZoom()),
      state(SurfaceState::UNINITIALIZED),
      mountTarget(NULL),
      inputEnabled(false),
      terminated(false),
      reportedRows(-1),
      reportedCols(-1),
      fitAttempts(0),
      alive(new bool(true)) {
  reconciler.reset(new ResizeReconciler(loop, config.resizeDebounce));
}

TerminalSurface::~TerminalSurface() { close(); }

void TerminalSurface::mount(MountTarget* target) {
  if (state == SurfaceState::CLOSED) {
    LOG(WARNING) << "Ignoring mount of closed surface " << sessionId;
    return;
  }
  mountTarget = target;
  if (state == SurfaceState::UNINITIALIZED) {
    initialize();
  }
}

void TerminalSurface::initialize() {
  if (state != SurfaceState::UNINITIALIZED) {
    VLOG(1) << "Surface " << sessionId << " is already "
            << surfaceStateName(state);
    return;
  }
  if (mountTarget == NULL) {
    VLOG(1) << "Surface " << sessionId << " has no mount target yet";
    return;
  }
  auto session = registry->get(sessionId);
  if (!session) {
    LOG(WARNING) << "Not initializing surface for missing session "
                 << sessionId;
    return;
  }

  setState(SurfaceState::INITIALIZING);
  errorMessage.clear();
  terminated = false;
  reportedRows = reportedCols = -1;
  engine = engineFactory(effectiveOptions(), config.capabilities);
  engine->open(mountTarget);
  engine->fit();

  weak_ptr<bool> weakAlive = alive;
  auto localBridge = bridge;
  auto localSessionId = sessionId;
  bridge->open(
      sessionId, session->currentDirectory, session->shell, engine->rows(),
      engine->cols(),
      [this, weakAlive, localBridge, localSessionId](const OpenResult& result) {
        if (weakAlive.expired()) {
          // The surface is gone, do not leak the connection
          if (result.ok()) {
            LOG(INFO) << "Closing connection " << result.connectionId
                      << " opened for destroyed surface " << localSessionId;
            localBridge->close(result.connectionId);
          }
          return;
        }
        handleOpen(result);
      });
}

void TerminalSurface::handleOpen(const OpenResult& result) {
  if (!result.ok()) {
    if (state != SurfaceState::INITIALIZING) {
      return;
    }
    errorMessage = result.error;
    LOG(WARNING) << "Surface " << sessionId
                 << " could not connect: " << errorMessage;
    if (engine) {
      engine->dispose();
      engine.reset();
    }
    setState(SurfaceState::ERRORED);
    return;
  }

  if (state != SurfaceState::INITIALIZING || !registry->get(sessionId)) {
    LOG(INFO) << "Session " << sessionId << " went away while connecting, "
              << "closing " << result.connectionId;
    bridge->close(result.connectionId);
    return;
  }

  connectionId = result.connectionId;
  SessionUpdate update;
  update.connectionId = optional<string>(result.connectionId);
  registry->update(sessionId, update);

  engineCallbacks.push_back(
      engine->onData([this](const string& data) { sendInput(data); }));
  engineCallbacks.push_back(
      engine->onResize([this](int rows, int cols) { sendSize(rows, cols); }));
  engineCallbacks.push_back(
      engine->onSelectionChange([this](const string& text) {
        SessionUpdate selectionUpdate;
        selectionUpdate.selection = text;
        registry->update(sessionId, selectionUpdate);
      }));
  engineCallbacks.push_back(engine->onTitleChange([this](const string& title) {
    auto session = registry->get(sessionId);
    if (!session) {
      return;
    }
    SessionUpdate titleUpdate;
    titleUpdate.title = optional<string>(title);
    titleUpdate.lastActivity = session->lastActivity;
    registry->update(sessionId, titleUpdate);
  }));

  RouteTarget target;
  target.onOutput = [this](const string& data) { handleOutput(data); };
  target.onError = [this](const string& error) { handleError(error); };
  target.onClosed = [this](int exitStatus) { handleClosed(exitStatus); };
  router->subscribe(*connectionId, target);

  // The backend was opened with the engine's size at that time
  reportedRows = engine->rows();
  reportedCols = engine->cols();
  inputEnabled = true;
  setState(SurfaceState::READY);

  reconciler->setReportedSize(reportedRows, reportedCols);
  reconciler->start(mountTarget, engine,
                    [this](int rows, int cols) { sendSize(rows, cols); });
  fitWithRetry(0);
  focus();
}

void TerminalSurface::retry() {
  if (state != SurfaceState::ERRORED) {
    LOG(WARNING) << "Cannot retry surface " << sessionId << " while "
                 << surfaceStateName(state);
    return;
  }
  LOG(INFO) << "Retrying connection for " << sessionId;
  setState(SurfaceState::UNINITIALIZED);
  initialize();
}

void TerminalSurface::close() {
  if (state == SurfaceState::CLOSED) {
    return;
  }
  setState(SurfaceState::CLOSED);
  inputEnabled = false;

  try {
    detach();
  } catch (const std::exception& ex) {
    STERROR << "Error detaching surface " << sessionId << ": " << ex.what();
  }

  try {
    if (connectionId) {
      bridge->close(*connectionId);
    }
  } catch (const std::exception& ex) {
    STERROR << "Error closing connection of " << sessionId << ": "
            << ex.what();
  }

  try {
    if (engine) {
      engine->dispose();
    }
  } catch (const std::exception& ex) {
    STERROR << "Error disposing engine of " << sessionId << ": " << ex.what();
  }
  engine.reset();
  mountTarget = NULL;
}

void TerminalSurface::detach() {
  if (fitRetryTimer) {
    loop->cancel(*fitRetryTimer);
    fitRetryTimer.reset();
  }
  reconciler->stop();
  if (engine) {
    for (auto id : engineCallbacks) {
      engine->removeCallback(id);
    }
  }
  engineCallbacks.clear();
  if (connectionId) {
    router->unsubscribe(*connectionId);
  }
}

void TerminalSurface::applyFont(const string& family, double size) {
  config.render.fontFamily = family;
  config.render.fontSize = size;
  applyOptions();
}

void TerminalSurface::applyTheme(const string& theme) {
  config.render.theme = theme;
  applyOptions();
}

void TerminalSurface::setZoom(double level) {
  zoom = level;
  applyOptions();
}

bool TerminalSurface::focus() {
  if (state != SurfaceState::READY || !engine ||
      registry->activeId() != sessionId) {
    return false;
  }
  engine->focus();
  return true;
}

void TerminalSurface::sendInput(const string& data) {
  if (!isInputEnabled() || !connectionId) {
    VLOG(2) << "Ignoring input for " << sessionId << " while "
            << surfaceStateName(state);
    return;
  }
  bridge->write(*connectionId, data);
}

void TerminalSurface::paste(const string& text) {
  if (!isInputEnabled() || !engine) {
    return;
  }
  engine->paste(text);
}

void TerminalSurface::pasteFromClipboard() {
  if (!config.capabilities.clipboard || !clipboard) {
    return;
  }
  paste(clipboard->readText());
}

bool TerminalSurface::copySelection() {
  if (!engine || !config.capabilities.clipboard || !clipboard) {
    return false;
  }
  string selection = engine->getSelection();
  if (selection.empty()) {
    return false;
  }
  clipboard->writeText(selection);
  return true;
}

bool TerminalSurface::findNext(const string& query) {
  return engine ? engine->findNext(query) : false;
}

bool TerminalSurface::findPrevious(const string& query) {
  return engine ? engine->findPrevious(query) : false;
}

void TerminalSurface::clearSearch() {
  if (engine) {
    engine->clearSearch();
  }
}

string TerminalSurface::serialize() { return engine ? engine->serialize() : ""; }

vector<string> TerminalSurface::links() {
  return engine ? engine->links() : vector<string>();
}

void TerminalSurface::handleOutput(const string& data) {
  if (engine) {
    engine->write(data);
  }
}

void TerminalSurface::handleError(const string& error) {
  LOG(WARNING) << "Terminal error in " << sessionId << ": " << error;
  if (engine) {
    engine->write(string(ERROR_PREFIX) + error + RESET_ATTRIBUTES);
  }
}

void TerminalSurface::handleClosed(int exitStatus) {
  LOG(INFO) << "Shell of " << sessionId << " exited with " << exitStatus;
  if (engine) {
    engine->write(SESSION_CLOSED_LINE);
  }
  inputEnabled = false;
  terminated = true;
  if (terminatedHandler) {
    auto handler = terminatedHandler;
    handler(sessionId, exitStatus);
  }
}

void TerminalSurface::fitWithRetry(int attempt) {
  if (state != SurfaceState::READY || !engine) {
    return;
  }
  fitAttempts++;
  if (engine->fit()) {
    sendSize(engine->rows(), engine->cols());
    return;
  }
  if (attempt >= config.maxFitRetries) {
    LOG(WARNING) << "Mount target of " << sessionId
                 << " still has no size, giving up on fitting";
    return;
  }
  fitRetryTimer = loop->postDelayed(config.fitRetryDelay, [this, attempt]() {
    fitRetryTimer.reset();
    fitWithRetry(attempt + 1);
  });
}

void TerminalSurface::sendSize(int rows, int cols) {
  if (state != SurfaceState::READY || !connectionId) {
    return;
  }
  if (rows == reportedRows && cols == reportedCols) {
    return;
  }
  reportedRows = rows;
  reportedCols = cols;
  reconciler->setReportedSize(rows, cols);
  bridge->resize(*connectionId, rows, cols);
}

void TerminalSurface::applyOptions() {
  if (!engine) {
    return;
  }
  engine->setOptions(effectiveOptions());
  if (state == SurfaceState::READY && engine->fit()) {
    sendSize(engine->rows(), engine->cols());
  }
}

RenderOptions TerminalSurface::effectiveOptions() {
  RenderOptions options = config.render;
  options.fontSize = config.render.fontSize * zoom;
  return options;
}

void TerminalSurface::setState(SurfaceState newState) {
  VLOG(1) << "Surface " << sessionId << ": " << surfaceStateName(state)
          << " -> " << surfaceStateName(newState);
  state = newState;
}
}  // namespace mt
