#ifndef __MT_RENDER_ENGINE_HPP__
#define __MT_RENDER_ENGINE_HPP__

#include "Headers.hpp"
#include "MountTarget.hpp"

namespace mt {
/** @brief Options the surface pushes into its engine. */
struct RenderOptions {
  string fontFamily = "monospace";
  /** @brief Effective font size in pixels, zoom already applied. */
  double fontSize = 14.0;
  string theme = "default";
  int scrollback = 1000;
};

/** @brief Optional engine features a surface asks for. */
struct EngineCapabilities {
  bool search = true;
  bool clipboard = true;
  bool serialize = true;
  bool unicodeWidth = true;
  bool links = true;
};

/**
 * @brief A terminal emulator engine: parses shell output into a screen,
 * turns user input into bytes and reports geometry, selection and title
 * changes.
 *
 * Callback registrations return an id that `removeCallback()` disposes.
 * Nothing is delivered after `dispose()`.
 */
class RenderEngine {
 public:
  typedef int64_t CallbackId;
  typedef std::function<void(const string& data)> DataCallback;
  typedef std::function<void(int rows, int cols)> ResizeCallback;
  typedef std::function<void(const string& text)> TextCallback;

  virtual ~RenderEngine() {}

  /** @brief Attaches the engine to a mount target. */
  virtual void open(MountTarget* target) = 0;
  /** @brief Feeds shell output into the screen. */
  virtual void write(const string& data) = 0;
  /** @brief Simulates typed input; delivered through `onData`. */
  virtual void input(const string& data) = 0;
  /** @brief Pastes text, bracketed when the shell asked for it. */
  virtual void paste(const string& text) = 0;
  /**
   * @brief Measures the mount target and recomputes rows and columns.
   * @return false when there is no target or it measures zero.
   */
  virtual bool fit() = 0;
  virtual int rows() = 0;
  virtual int cols() = 0;
  virtual void focus() = 0;
  virtual bool hasFocus() = 0;

  virtual void setOptions(const RenderOptions& options) = 0;
  virtual RenderOptions getOptions() = 0;

  virtual CallbackId onData(DataCallback callback) = 0;
  virtual CallbackId onResize(ResizeCallback callback) = 0;
  virtual CallbackId onSelectionChange(TextCallback callback) = 0;
  virtual CallbackId onTitleChange(TextCallback callback) = 0;
  virtual void removeCallback(CallbackId id) = 0;

  /** @brief Selects `length` cells of buffer line `row` from `col`. */
  virtual void select(int row, int col, int length) = 0;
  virtual void selectAll() = 0;
  virtual void clearSelection() = 0;
  virtual string getSelection() = 0;

  virtual bool findNext(const string& query) = 0;
  virtual bool findPrevious(const string& query) = 0;
  virtual void clearSearch() = 0;

  /** @brief Returns the buffer contents (scrollback included) as text. */
  virtual string serialize() = 0;
  /** @brief Returns the URLs currently visible in the buffer. */
  virtual vector<string> links() = 0;

  virtual void dispose() = 0;
  virtual bool isDisposed() = 0;
};

typedef std::function<shared_ptr<RenderEngine>(const RenderOptions&,
                                               const EngineCapabilities&)>
    RenderEngineFactory;
}  // namespace mt

#endif  // __MT_RENDER_ENGINE_HPP__
