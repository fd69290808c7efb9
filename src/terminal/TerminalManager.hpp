#ifndef __MT_TERMINAL_MANAGER_HPP__
#define __MT_TERMINAL_MANAGER_HPP__

#include "Clipboard.hpp"
#include "ConnectionBridge.hpp"
#include "EventBus.hpp"
#include "EventLoop.hpp"
#include "EventRouter.hpp"
#include "Headers.hpp"
#include "KeyboardDispatcher.hpp"
#include "ReorderController.hpp"
#include "SessionRegistry.hpp"
#include "TerminalBackend.hpp"
#include "TerminalConfig.hpp"
#include "TerminalSurface.hpp"
#include "Viewport.hpp"

namespace mt {
/**
 * @brief The terminal panel: owns the session registry, the connection
 * bridge, the event router and one surface per session.
 *
 * Creating a session registers it and, once the panel is mounted, builds a
 * surface that connects itself.  Closing a session unwinds the surface,
 * its subscription and its connection before the registry entry goes away.
 */
class TerminalManager : public KeyboardTarget {
 public:
  typedef std::function<void(const string& sessionId, const string& payload,
                             const Point& pointer)>
      DetachHandler;

  TerminalManager(shared_ptr<EventLoop> _loop, shared_ptr<EventBus> _bus,
                  shared_ptr<TerminalBackend> _backend,
                  RenderEngineFactory _engineFactory,
                  shared_ptr<Clipboard> _clipboard,
                  const TerminalConfig& _config);
  virtual ~TerminalManager();

  /**
   * @brief Shows the panel at the given pixel size.  Opens a first session
   * when there is none and attaches the keyboard dispatcher.
   */
  void mount(int width, int height);
  /** @brief Hides the panel.  Sessions keep running. */
  void unmount();
  bool isMounted() { return mounted; }
  void setPanelSize(int width, int height);

  /**
   * @brief Opens a session.  The name defaults to the last component of the
   * directory, the directory and shell to the configured ones.
   * @return The new session id.
   */
  string openSession(const optional<string>& name = nullopt,
                     const optional<string>& directory = nullopt,
                     const optional<string>& shell = nullopt);
  /** @brief Tears down one session.  Unknown ids are ignored. */
  void closeSession(const string& sessionId);
  /** @brief Closes every non-pinned session except `sessionId`. */
  void closeOthers(const string& sessionId);
  /** @brief Closes the non-pinned sessions after `sessionId`. */
  void closeToRight(const string& sessionId);
  /** @brief Closes every non-pinned session. */
  void closeAll();
  /** @brief Closes every session, pinned or not, and clears the registry. */
  void shutdown();

  void activate(const string& sessionId);
  bool pin(const string& sessionId, bool pinned);
  bool rename(const string& sessionId, const string& name);
  /** @brief Moves a tab and activates it. */
  bool reorder(int fromIndex, int toIndex);
  /** @brief Turns split view of the active session on or off. */
  void toggleSplit();

  /** @brief Searches the active session, remembering the query. */
  bool search(const string& query, bool forward = true);
  void setTerminalFocused(bool focused) { terminalFocused = focused; }
  /** @brief Sends input to the session as if typed. */
  void sendInput(const string& sessionId, const string& data);
  /** @brief Routes a key press through the shortcut table. */
  bool handleKey(const KeyEvent& event) { return dispatcher->dispatch(event); }

  // KeyboardTarget
  virtual bool isTerminalFocused();
  virtual bool isSearchOpen() { return registry->isSearchVisible(); }
  virtual void nextSession();
  virtual void previousSession();
  virtual void newSession();
  virtual void closeActiveSession();
  virtual void openSearch();
  virtual void closeSearch();
  virtual void zoomIn();
  virtual void zoomOut();
  virtual void resetZoom();
  virtual void activateIndex(int index);

  shared_ptr<SessionRegistry> getRegistry() { return registry; }
  shared_ptr<ConnectionBridge> getBridge() { return bridge; }
  shared_ptr<EventRouter> getRouter() { return router; }
  shared_ptr<TerminalSurface> getSurface(const string& sessionId);
  shared_ptr<Viewport> getViewport(const string& sessionId);
  shared_ptr<TerminalSurface> getActiveSurface();
  ReorderController& getReorderController() { return reorderController; }
  int numSurfaces() { return int(surfaces.size()); }
  /** @brief Sessions whose shell is still running. */
  int numRunning();
  /** @brief True once a session's connection failed repeatedly. */
  bool hasSoftError(const string& sessionId) {
    return softErrors.find(sessionId) != softErrors.end();
  }
  void setDetachHandler(DetachHandler handler) { detachHandler = handler; }
  void setTerminatedHandler(TerminalSurface::TerminatedHandler handler) {
    terminatedHandler = handler;
  }

 protected:
  struct SurfaceEntry {
    shared_ptr<Viewport> viewport;
    shared_ptr<TerminalSurface> surface;
  };

  void ensureSurface(const string& sessionId);
  void closeSessions(const vector<string>& sessionIds);
  void focusActive();
  void applyZoom();

  shared_ptr<EventLoop> loop;
  shared_ptr<EventBus> bus;
  shared_ptr<TerminalBackend> backend;
  RenderEngineFactory engineFactory;
  shared_ptr<Clipboard> clipboard;
  TerminalConfig config;

  shared_ptr<SessionRegistry> registry;
  shared_ptr<ConnectionBridge> bridge;
  shared_ptr<EventRouter> router;
  shared_ptr<KeyboardDispatcher> dispatcher;
  ReorderController reorderController;
  map<string, SurfaceEntry> surfaces;
  set<string> softErrors;

  bool mounted;
  bool terminalFocused;
  int panelWidth;
  int panelHeight;
  DetachHandler detachHandler;
  TerminalSurface::TerminatedHandler terminatedHandler;
};
}  // namespace mt

#endif  // __MT_TERMINAL_MANAGER_HPP__
