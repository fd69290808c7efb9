#include "HeadlessRenderEngine.hpp"

#include <cstring>
#include <regex>

namespace mt {
namespace {
const int DEFAULT_ROWS = 24;
const int DEFAULT_COLS = 80;
const size_t MAX_TITLE_LENGTH = 4096;
const uint32_t WIDE_CONTINUATION = uint32_t(-1);
const uint32_t REPLACEMENT_CHARACTER = 0xFFFD;
// LNM: line feed also returns the carriage
const char NEWLINE_MODE[] = "\x1b[20h";

void encodeUtf8(uint32_t c, string* out) {
  if (c > 0x10FFFF || (c >= 0xD800 && c <= 0xDFFF)) {
    c = REPLACEMENT_CHARACTER;
  }
  if (c < 0x80) {
    out->push_back(char(c));
  } else if (c < 0x800) {
    out->push_back(char(0xC0 | (c >> 6)));
    out->push_back(char(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out->push_back(char(0xE0 | (c >> 12)));
    out->push_back(char(0x80 | ((c >> 6) & 0x3F)));
    out->push_back(char(0x80 | (c & 0x3F)));
  } else {
    out->push_back(char(0xF0 | (c >> 18)));
    out->push_back(char(0x80 | ((c >> 12) & 0x3F)));
    out->push_back(char(0x80 | ((c >> 6) & 0x3F)));
    out->push_back(char(0x80 | (c & 0x3F)));
  }
}

// Invokes every callback still registered when its turn comes, so a
// callback may remove itself or others.
template <typename Callback, typename... Args>
void fire(map<RenderEngine::CallbackId, Callback>* callbacks, Args... args) {
  vector<RenderEngine::CallbackId> ids;
  for (auto& it : *callbacks) {
    ids.push_back(it.first);
  }
  for (auto id : ids) {
    auto it = callbacks->find(id);
    if (it == callbacks->end()) {
      continue;
    }
    auto callback = it->second;
    callback(args...);
  }
}
}  // namespace

string CsiParameterClamp::filter(const string& data) {
  string out;
  out.reserve(data.size());
  for (char ch : data) {
    unsigned char c = ch;
    switch (state) {
      case TEXT:
        out.push_back(ch);
        if (c == 0x1B) {
          state = ESCAPE;
        }
        break;
      case ESCAPE:
        out.push_back(ch);
        if (c == '[') {
          state = CSI;
        } else if (c != 0x1B) {
          state = TEXT;
        }
        break;
      case CSI:
        if (c >= '0' && c <= '9') {
          if (value <= MAX_PARAMETER) {
            value = value * 10 + (c - '0');
          }
          haveDigits = true;
          break;
        }
        flushDigits(&out);
        out.push_back(ch);
        if (c >= 0x40 && c <= 0x7E) {
          state = TEXT;
        } else if (c == 0x1B) {
          state = ESCAPE;
        } else if (c == 0x18 || c == 0x1A) {
          // CAN and SUB abort the sequence
          state = TEXT;
        }
        break;
    }
  }
  return out;
}

void CsiParameterClamp::flushDigits(string* out) {
  if (!haveDigits) {
    return;
  }
  *out += to_string(min(value, MAX_PARAMETER));
  value = 0;
  haveDigits = false;
}

HeadlessRenderEngine::HeadlessRenderEngine(
    const RenderOptions& _options, const EngineCapabilities& _capabilities)
    : options(_options),
      capabilities(_capabilities),
      target(NULL),
      numRows(DEFAULT_ROWS),
      numCols(DEFAULT_COLS),
      focused(false),
      disposed(false),
      vt(NULL),
      screen(NULL),
      titleChanged(false),
      nextCallbackId(1) {
  vt = vterm_new(numRows, numCols);
  if (vt == NULL) {
    throw std::runtime_error("Could not create a vterm");
  }
  vterm_set_utf8(vt, 1);
  vterm_output_set_callback(vt, &HeadlessRenderEngine::onOutput, this);

  screen = vterm_obtain_screen(vt);
  memset(&screenCallbacks, 0, sizeof(screenCallbacks));
  screenCallbacks.settermprop = &HeadlessRenderEngine::onSetTermProp;
  screenCallbacks.sb_pushline = &HeadlessRenderEngine::onPushLine;
  screenCallbacks.sb_popline = &HeadlessRenderEngine::onPopLine;
  screenCallbacks.sb_clear = &HeadlessRenderEngine::onClearScrollback;
  vterm_screen_set_callbacks(screen, &screenCallbacks, this);
  vterm_screen_enable_altscreen(screen, 1);
  vterm_screen_reset(screen, 1);
  vterm_input_write(vt, NEWLINE_MODE, sizeof(NEWLINE_MODE) - 1);

  if (!capabilities.unicodeWidth) {
    VLOG(1) << "Unicode widths cannot be turned off, libvterm applies them";
  }
}

HeadlessRenderEngine::~HeadlessRenderEngine() {
  if (vt) {
    vterm_free(vt);
  }
}

void HeadlessRenderEngine::open(MountTarget* _target) {
  if (disposed) {
    return;
  }
  target = _target;
  VLOG(1) << "Render engine attached to a " << target->width() << "x"
          << target->height() << " target";
}

void HeadlessRenderEngine::write(const string& data) {
  if (disposed) {
    VLOG(1) << "Dropping " << data.length() << " bytes for disposed engine";
    return;
  }
  string bytes = clamp.filter(data);
  if (!bytes.empty()) {
    vterm_input_write(vt, bytes.data(), bytes.size());
    vterm_screen_flush_damage(screen);
  }
  // Listeners run once libvterm is done with the input
  if (titleChanged) {
    titleChanged = false;
    fire(&titleCallbacks, title);
  }
  flushOutput();
}

void HeadlessRenderEngine::input(const string& data) {
  if (disposed) {
    return;
  }
  fire(&dataCallbacks, data);
}

void HeadlessRenderEngine::paste(const string& text) {
  if (disposed) {
    return;
  }
  string normalized;
  for (size_t a = 0; a < text.size(); a++) {
    if (text[a] == '\r' && a + 1 < text.size() && text[a + 1] == '\n') {
      continue;
    }
    normalized.push_back(text[a] == '\n' ? '\r' : text[a]);
  }
  // The markers only come out when the shell enabled bracketed paste
  vterm_keyboard_start_paste(vt);
  pendingOutput += normalized;
  vterm_keyboard_end_paste(vt);
  flushOutput();
}

bool HeadlessRenderEngine::fit() {
  if (disposed || target == NULL) {
    return false;
  }
  int width = target->width();
  int height = target->height();
  if (width <= 0 || height <= 0) {
    return false;
  }
  int newCols = max(2, int(width / cellWidth()));
  int newRows = max(1, int(height / cellHeight()));
  resize(newRows, newCols);
  return true;
}

void HeadlessRenderEngine::resize(int _rows, int _cols) {
  _rows = max(1, _rows);
  _cols = max(1, _cols);
  if (disposed || (_rows == numRows && _cols == numCols)) {
    return;
  }
  numRows = _rows;
  numCols = _cols;
  vterm_set_size(vt, numRows, numCols);
  vterm_screen_flush_damage(screen);
  trimScrollback();
  VLOG(2) << "Render engine resized to " << numRows << "x" << numCols;
  fire(&resizeCallbacks, numRows, numCols);
}

void HeadlessRenderEngine::focus() {
  if (disposed || target == NULL) {
    return;
  }
  focused = true;
}

void HeadlessRenderEngine::setOptions(const RenderOptions& _options) {
  options = _options;
  trimScrollback();
}

RenderEngine::CallbackId HeadlessRenderEngine::onData(DataCallback callback) {
  CallbackId id = nextCallbackId++;
  dataCallbacks[id] = callback;
  return id;
}

RenderEngine::CallbackId HeadlessRenderEngine::onResize(
    ResizeCallback callback) {
  CallbackId id = nextCallbackId++;
  resizeCallbacks[id] = callback;
  return id;
}

RenderEngine::CallbackId HeadlessRenderEngine::onSelectionChange(
    TextCallback callback) {
  CallbackId id = nextCallbackId++;
  selectionCallbacks[id] = callback;
  return id;
}

RenderEngine::CallbackId HeadlessRenderEngine::onTitleChange(
    TextCallback callback) {
  CallbackId id = nextCallbackId++;
  titleCallbacks[id] = callback;
  return id;
}

void HeadlessRenderEngine::removeCallback(CallbackId id) {
  dataCallbacks.erase(id);
  resizeCallbacks.erase(id);
  selectionCallbacks.erase(id);
  titleCallbacks.erase(id);
}

void HeadlessRenderEngine::select(int row, int col, int length) {
  if (disposed) {
    return;
  }
  vector<CellLine> lines = bufferLines();
  if (row < 0 || row >= int(lines.size()) || col < 0 || length <= 0) {
    setSelection("");
    return;
  }
  int end = int(min<int64_t>(int64_t(col) + length, lines[row].size()));
  setSelection(cellsToString(lines[row], col, end));
}

void HeadlessRenderEngine::selectAll() {
  if (disposed) {
    return;
  }
  setSelection(contents());
}

void HeadlessRenderEngine::clearSelection() {
  if (disposed) {
    return;
  }
  setSelection("");
}

bool HeadlessRenderEngine::findNext(const string& query) {
  return find(query, true);
}

bool HeadlessRenderEngine::findPrevious(const string& query) {
  return find(query, false);
}

void HeadlessRenderEngine::clearSearch() {
  lastQuery.clear();
  lastMatch.reset();
  clearSelection();
}

string HeadlessRenderEngine::serialize() {
  if (!capabilities.serialize || disposed) {
    return "";
  }
  return contents();
}

vector<string> HeadlessRenderEngine::links() {
  vector<string> urls;
  if (!capabilities.links || disposed) {
    return urls;
  }
  static const std::regex urlPattern("(https?|ftp)://[^\\s\"'<>]+");
  for (auto& line : bufferLines()) {
    string text = cellsToString(line, 0, int(line.size()));
    for (auto it = std::sregex_iterator(text.begin(), text.end(), urlPattern);
         it != std::sregex_iterator(); ++it) {
      string url = it->str();
      while (!url.empty() &&
             string(".,;:!?)").find(url.back()) != string::npos) {
        url.pop_back();
      }
      urls.push_back(url);
    }
  }
  return urls;
}

void HeadlessRenderEngine::dispose() {
  if (disposed) {
    return;
  }
  disposed = true;
  dataCallbacks.clear();
  resizeCallbacks.clear();
  selectionCallbacks.clear();
  titleCallbacks.clear();
  target = NULL;
  focused = false;
  vterm_free(vt);
  vt = NULL;
  screen = NULL;
  scrollback.clear();
  VLOG(1) << "Render engine disposed";
}

int HeadlessRenderEngine::numLines() {
  if (disposed) {
    return 0;
  }
  return int(scrollback.size()) + usedScreenRows();
}

string HeadlessRenderEngine::lineText(int row) {
  if (disposed || row < 0) {
    return "";
  }
  if (row < int(scrollback.size())) {
    const CellLine& line = scrollback[row];
    return cellsToString(line, 0, int(line.size()));
  }
  row -= int(scrollback.size());
  if (row >= usedScreenRows()) {
    return "";
  }
  return cellsToString(screenLine(row), 0, numCols);
}

int HeadlessRenderEngine::getCursorRow() {
  if (disposed) {
    return 0;
  }
  VTermPos pos;
  vterm_state_get_cursorpos(vterm_obtain_state(vt), &pos);
  return pos.row;
}

int HeadlessRenderEngine::getCursorCol() {
  if (disposed) {
    return 0;
  }
  VTermPos pos;
  vterm_state_get_cursorpos(vterm_obtain_state(vt), &pos);
  return pos.col;
}

int HeadlessRenderEngine::onSetTermProp(VTermProp prop, VTermValue* val,
                                        void* user) {
  auto engine = static_cast<HeadlessRenderEngine*>(user);
  if (prop != VTERM_PROP_TITLE) {
    return 0;
  }
  const VTermStringFragment& fragment = val->string;
  if (fragment.initial) {
    engine->titleFragments.clear();
  }
  size_t used = engine->titleFragments.size();
  size_t room = used < MAX_TITLE_LENGTH ? MAX_TITLE_LENGTH - used : 0;
  size_t length = min(room, size_t(fragment.len));
  if (length > 0) {
    engine->titleFragments.append(fragment.str, length);
  }
  if (fragment.final) {
    engine->title = engine->titleFragments;
    engine->titleFragments.clear();
    engine->titleChanged = true;
  }
  return 1;
}

int HeadlessRenderEngine::onPushLine(int cols, const VTermScreenCell* cells,
                                     void* user) {
  auto engine = static_cast<HeadlessRenderEngine*>(user);
  engine->scrollback.push_back(CellLine(cells, cells + cols));
  engine->trimScrollback();
  return 1;
}

int HeadlessRenderEngine::onPopLine(int cols, VTermScreenCell* cells,
                                    void* user) {
  auto engine = static_cast<HeadlessRenderEngine*>(user);
  if (engine->scrollback.empty()) {
    return 0;
  }
  const CellLine& line = engine->scrollback.back();
  VTermScreenCell blank;
  memset(&blank, 0, sizeof(blank));
  blank.width = 1;
  vterm_state_get_default_colors(vterm_obtain_state(engine->vt), &blank.fg,
                                 &blank.bg);
  for (int a = 0; a < cols; a++) {
    cells[a] = a < int(line.size()) ? line[a] : blank;
  }
  engine->scrollback.pop_back();
  if (engine->lastMatch &&
      engine->lastMatch->first >= int(engine->scrollback.size())) {
    engine->lastMatch.reset();
  }
  return 1;
}

int HeadlessRenderEngine::onClearScrollback(void* user) {
  auto engine = static_cast<HeadlessRenderEngine*>(user);
  engine->scrollback.clear();
  engine->lastMatch.reset();
  return 1;
}

void HeadlessRenderEngine::onOutput(const char* s, size_t len, void* user) {
  auto engine = static_cast<HeadlessRenderEngine*>(user);
  engine->pendingOutput.append(s, len);
}

HeadlessRenderEngine::CellLine HeadlessRenderEngine::screenLine(int row) {
  CellLine line(numCols);
  VTermPos pos;
  pos.row = row;
  for (int col = 0; col < numCols; col++) {
    pos.col = col;
    vterm_screen_get_cell(screen, pos, &line[col]);
  }
  return line;
}

int HeadlessRenderEngine::usedScreenRows() {
  int used = getCursorRow() + 1;
  VTermPos pos;
  pos.col = 0;
  for (int row = numRows - 1; row >= used; row--) {
    pos.row = row;
    if (!vterm_screen_is_eol(screen, pos)) {
      return row + 1;
    }
  }
  return used;
}

vector<HeadlessRenderEngine::CellLine> HeadlessRenderEngine::bufferLines() {
  vector<CellLine> lines(scrollback.begin(), scrollback.end());
  int used = usedScreenRows();
  for (int row = 0; row < used; row++) {
    lines.push_back(screenLine(row));
  }
  return lines;
}

string HeadlessRenderEngine::cellsToString(const CellLine& line, int fromCol,
                                           int toCol) {
  string text;
  toCol = min(toCol, int(line.size()));
  for (int col = max(0, fromCol); col < toCol; col++) {
    const VTermScreenCell& cell = line[col];
    if (cell.chars[0] == WIDE_CONTINUATION) {
      continue;
    }
    if (cell.chars[0] == 0) {
      text.push_back(' ');
      continue;
    }
    for (int a = 0; a < VTERM_MAX_CHARS_PER_CELL && cell.chars[a]; a++) {
      encodeUtf8(cell.chars[a], &text);
    }
  }
  while (!text.empty() && text.back() == ' ') {
    text.pop_back();
  }
  return text;
}

string HeadlessRenderEngine::contents() {
  vector<string> text;
  for (auto& line : bufferLines()) {
    text.push_back(cellsToString(line, 0, int(line.size())));
  }
  while (!text.empty() && text.back().empty()) {
    text.pop_back();
  }
  string joined;
  for (size_t a = 0; a < text.size(); a++) {
    if (a) {
      joined += "\n";
    }
    joined += text[a];
  }
  return joined;
}

void HeadlessRenderEngine::trimScrollback() {
  size_t limit = size_t(max(0, options.scrollback));
  while (scrollback.size() > limit) {
    scrollback.pop_front();
    if (lastMatch) {
      if (lastMatch->first == 0) {
        lastMatch.reset();
      } else {
        lastMatch->first--;
      }
    }
  }
}

void HeadlessRenderEngine::flushOutput() {
  if (pendingOutput.empty()) {
    return;
  }
  string data;
  data.swap(pendingOutput);
  fire(&dataCallbacks, data);
}

bool HeadlessRenderEngine::find(const string& query, bool forward) {
  if (disposed || !capabilities.search || query.empty()) {
    return false;
  }
  if (query != lastQuery) {
    lastQuery = query;
    lastMatch.reset();
  }
  vector<string> text;
  for (auto& line : bufferLines()) {
    text.push_back(cellsToString(line, 0, int(line.size())));
  }
  int count = int(text.size());
  if (lastMatch && lastMatch->first >= count) {
    lastMatch.reset();
  }

  // Scan every line once starting from the previous match, then wrap
  // around to the start line again.
  for (int a = 0; a <= count; a++) {
    size_t pos = string::npos;
    int row;
    if (forward) {
      int startRow = lastMatch ? lastMatch->first : 0;
      row = (startRow + a) % count;
      size_t from = (a == 0 && lastMatch) ? lastMatch->second + 1 : 0;
      if (from <= text[row].size()) {
        pos = text[row].find(query, from);
      }
    } else {
      int startRow = lastMatch ? lastMatch->first : count - 1;
      row = ((startRow - a) % count + count) % count;
      if (a == 0 && lastMatch) {
        if (lastMatch->second > 0) {
          pos = text[row].rfind(query, lastMatch->second - 1);
        }
      } else {
        pos = text[row].rfind(query);
      }
    }
    if (pos != string::npos) {
      lastMatch = make_pair(row, pos);
      setSelection(text[row].substr(pos, query.size()));
      return true;
    }
  }
  lastMatch.reset();
  return false;
}

void HeadlessRenderEngine::setSelection(const string& text) {
  if (text == selection) {
    return;
  }
  selection = text;
  fire(&selectionCallbacks, selection);
}

RenderEngineFactory headlessRenderEngineFactory() {
  return [](const RenderOptions& options,
            const EngineCapabilities& capabilities) -> shared_ptr<RenderEngine> {
    return make_shared<HeadlessRenderEngine>(options, capabilities);
  };
}
}  // namespace mt
