#ifndef __MT_HEADLESS_RENDER_ENGINE_HPP__
#define __MT_HEADLESS_RENDER_ENGINE_HPP__

#include <vterm.h>

#if !defined(VTERM_VERSION_MAJOR) || \
    (VTERM_VERSION_MAJOR == 0 && VTERM_VERSION_MINOR < 3)
#error "libvterm 0.3 or newer is required"
#endif

#include "Headers.hpp"
#include "RenderEngine.hpp"

namespace mt {
/**
 * @brief Keeps CSI numeric parameters within what a terminal can use.
 *
 * Shell output passes through unchanged except for digit runs inside a
 * control sequence, which are capped at `MAX_PARAMETER`.  The filter is
 * streaming: a parameter split across two writes is still capped.
 */
class CsiParameterClamp {
 public:
  static constexpr int MAX_PARAMETER = 65535;

  CsiParameterClamp() : state(TEXT), value(0), haveDigits(false) {}

  /** @brief Returns the bytes that can be handed to the parser now. */
  string filter(const string& data);

 protected:
  enum State { TEXT, ESCAPE, CSI };

  void flushDigits(string* out);

  State state;
  int value;
  bool haveDigits;
};

/**
 * @brief A render engine without glyphs, backed by libvterm.
 *
 * libvterm parses shell output into its screen.  Lines scrolled off the
 * top are kept here as scrollback, bounded by the `scrollback` option.
 * Geometry is derived from the font size.  Search, selection and link
 * detection work on the text of scrollback plus screen.  Line feed
 * implies carriage return.  Character widths always come from libvterm's
 * Unicode table.
 */
class HeadlessRenderEngine : public RenderEngine {
 public:
  HeadlessRenderEngine(const RenderOptions& _options,
                       const EngineCapabilities& _capabilities);
  virtual ~HeadlessRenderEngine();

  virtual void open(MountTarget* _target);
  virtual void write(const string& data);
  virtual void input(const string& data);
  virtual void paste(const string& text);
  virtual bool fit();
  virtual int rows() { return numRows; }
  virtual int cols() { return numCols; }
  virtual void focus();
  virtual bool hasFocus() { return focused; }

  virtual void setOptions(const RenderOptions& _options);
  virtual RenderOptions getOptions() { return options; }

  virtual CallbackId onData(DataCallback callback);
  virtual CallbackId onResize(ResizeCallback callback);
  virtual CallbackId onSelectionChange(TextCallback callback);
  virtual CallbackId onTitleChange(TextCallback callback);
  virtual void removeCallback(CallbackId id);

  virtual void select(int row, int col, int length);
  virtual void selectAll();
  virtual void clearSelection();
  virtual string getSelection() { return selection; }

  virtual bool findNext(const string& query);
  virtual bool findPrevious(const string& query);
  virtual void clearSearch();

  virtual string serialize();
  virtual vector<string> links();

  virtual void dispose();
  virtual bool isDisposed() { return disposed; }

  /** @brief Sets the grid size directly and notifies resize listeners. */
  void resize(int _rows, int _cols);
  void blur() { focused = false; }
  /** @brief Scrollback lines plus the screen rows in use. */
  int numLines();
  /** @brief Text of one buffer line, trailing blanks removed. */
  string lineText(int row);
  int getCursorRow();
  int getCursorCol();
  string getTitle() { return title; }
  double cellWidth() { return options.fontSize * 0.6; }
  double cellHeight() { return options.fontSize * 1.2; }

 protected:
  typedef vector<VTermScreenCell> CellLine;

  static int onSetTermProp(VTermProp prop, VTermValue* val, void* user);
  static int onPushLine(int cols, const VTermScreenCell* cells, void* user);
  static int onPopLine(int cols, VTermScreenCell* cells, void* user);
  static int onClearScrollback(void* user);
  static void onOutput(const char* s, size_t len, void* user);

  CellLine screenLine(int row);
  int usedScreenRows();
  /** @brief Scrollback lines followed by the screen rows in use. */
  vector<CellLine> bufferLines();
  string cellsToString(const CellLine& line, int fromCol, int toCol);
  /** @brief All lines joined by newlines, trailing blank lines dropped. */
  string contents();
  void trimScrollback();
  void flushOutput();
  bool find(const string& query, bool forward);
  void setSelection(const string& text);

  RenderOptions options;
  EngineCapabilities capabilities;
  MountTarget* target;
  int numRows;
  int numCols;
  bool focused;
  bool disposed;

  VTerm* vt;
  VTermScreen* screen;
  VTermScreenCallbacks screenCallbacks;
  CsiParameterClamp clamp;
  deque<CellLine> scrollback;
  string pendingOutput;
  string titleFragments;
  string title;
  bool titleChanged;

  string selection;
  string lastQuery;
  optional<pair<int, size_t>> lastMatch;

  CallbackId nextCallbackId;
  map<CallbackId, DataCallback> dataCallbacks;
  map<CallbackId, ResizeCallback> resizeCallbacks;
  map<CallbackId, TextCallback> selectionCallbacks;
  map<CallbackId, TextCallback> titleCallbacks;
};

/** @brief Factory producing HeadlessRenderEngine instances. */
RenderEngineFactory headlessRenderEngineFactory();
}  // namespace mt

#endif  // __MT_HEADLESS_RENDER_ENGINE_HPP__
