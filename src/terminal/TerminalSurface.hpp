#ifndef __MT_TERMINAL_SURFACE_HPP__
#define __MT_TERMINAL_SURFACE_HPP__

#include "Clipboard.hpp"
#include "ConnectionBridge.hpp"
#include "EventLoop.hpp"
#include "EventRouter.hpp"
#include "Headers.hpp"
#include "MountTarget.hpp"
#include "RenderEngine.hpp"
#include "ResizeReconciler.hpp"
#include "SessionRegistry.hpp"

namespace mt {
/**
 * @brief Lifecycle of a terminal surface.
 */
enum class SurfaceState {
  /** @brief Waiting for a mount target. */
  UNINITIALIZED = 0,
  /** @brief Engine built, backend connection requested. */
  INITIALIZING = 1,
  /** @brief Connected and accepting input. */
  READY = 2,
  /** @brief The connection could not be opened.  `retry()` starts over. */
  ERRORED = 3,
  /** @brief Torn down.  Terminal state. */
  CLOSED = 4
};

string surfaceStateName(SurfaceState state);

/** @brief Tunables a surface is created with. */
struct SurfaceConfig {
  /** @brief Options before zoom is applied. */
  RenderOptions render;
  EngineCapabilities capabilities;
  std::chrono::milliseconds resizeDebounce = std::chrono::milliseconds(100);
  std::chrono::milliseconds fitRetryDelay = std::chrono::milliseconds(100);
  int maxFitRetries = 20;
};

/**
 * @brief One terminal view bound to one session and, once ready, to one
 * backend connection.
 *
 * The surface owns its render engine and resize reconciler.  Output events
 * reach it through the event router, typed input leaves through the
 * connection bridge.  `close()` may be called in any state and always runs
 * the whole teardown.
 */
class TerminalSurface {
 public:
  typedef std::function<void(const string& sessionId, int exitStatus)>
      TerminatedHandler;

  TerminalSurface(const string& _sessionId, shared_ptr<EventLoop> _loop,
                  shared_ptr<SessionRegistry> _registry,
                  shared_ptr<ConnectionBridge> _bridge,
                  shared_ptr<EventRouter> _router,
                  RenderEngineFactory _engineFactory,
                  shared_ptr<Clipboard> _clipboard,
                  const SurfaceConfig& _config);
  ~TerminalSurface();

  /** @brief Attaches to a mount target and initializes if needed. */
  void mount(MountTarget* target);
  /**
   * @brief Builds the engine and requests a backend connection.  Without a
   * mount target the surface stays uninitialized.
   */
  void initialize();
  /** @brief Leaves `ERRORED` and initializes again. */
  void retry();
  /** @brief Tears everything down.  Idempotent. */
  void close();

  void applyFont(const string& family, double size);
  void applyTheme(const string& theme);
  /** @brief Rescales the font by `level` and refits. */
  void setZoom(double level);
  /** @brief Focuses the engine if ready and the session is active. */
  bool focus();

  /** @brief Sends typed bytes to the backend.  Inert unless ready. */
  void sendInput(const string& data);
  void paste(const string& text);
  /** @brief Pastes the clipboard contents. */
  void pasteFromClipboard();
  /** @brief Copies the current selection.  False if nothing was copied. */
  bool copySelection();
  bool findNext(const string& query);
  bool findPrevious(const string& query);
  void clearSearch();
  string serialize();
  vector<string> links();

  SurfaceState getState() { return state; }
  const string& getSessionId() { return sessionId; }
  const optional<string>& getConnectionId() { return connectionId; }
  const string& getErrorMessage() { return errorMessage; }
  bool isInputEnabled() { return state == SurfaceState::READY && inputEnabled; }
  bool hasTerminated() { return terminated; }
  shared_ptr<RenderEngine> getEngine() { return engine; }
  int getFitAttempts() { return fitAttempts; }
  void setTerminatedHandler(TerminatedHandler handler) {
    terminatedHandler = handler;
  }

 protected:
  void handleOpen(const OpenResult& result);
  void handleOutput(const string& data);
  void handleError(const string& error);
  void handleClosed(int exitStatus);
  void fitWithRetry(int attempt);
  /** @brief Forwards a grid size to the backend unless it was sent already. */
  void sendSize(int rows, int cols);
  void detach();
  void applyOptions();
  RenderOptions effectiveOptions();
  void setState(SurfaceState newState);

  string sessionId;
  shared_ptr<EventLoop> loop;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<ConnectionBridge> bridge;
  shared_ptr<EventRouter> router;
  RenderEngineFactory engineFactory;
  shared_ptr<Clipboard> clipboard;
  SurfaceConfig config;
  double zoom;

  SurfaceState state;
  MountTarget* mountTarget;
  shared_ptr<RenderEngine> engine;
  shared_ptr<ResizeReconciler> reconciler;
  optional<string> connectionId;
  string errorMessage;
  bool inputEnabled;
  bool terminated;
  int reportedRows;
  int reportedCols;
  int fitAttempts;
  optional<EventLoop::TimerId> fitRetryTimer;
  vector<RenderEngine::CallbackId> engineCallbacks;
  TerminatedHandler terminatedHandler;
  shared_ptr<bool> alive;
};
}  // namespace mt

#endif  // __MT_TERMINAL_SURFACE_HPP__
