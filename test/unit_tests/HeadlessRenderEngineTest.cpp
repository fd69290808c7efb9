#include "HeadlessRenderEngine.hpp"

#include "TestHeaders.hpp"
#include "Viewport.hpp"

using namespace mt;

namespace {
shared_ptr<HeadlessRenderEngine> createEngine(
    RenderOptions options = RenderOptions(),
    EngineCapabilities capabilities = EngineCapabilities()) {
  return make_shared<HeadlessRenderEngine>(options, capabilities);
}
}  // namespace

TEST_CASE("HeadlessRenderEngine writes lines", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("hello\r\nworld\n");
  REQUIRE(engine->lineText(0) == "hello");
  REQUIRE(engine->lineText(1) == "world");
  REQUIRE(engine->serialize() == "hello\nworld");
}

TEST_CASE("HeadlessRenderEngine handles carriage return and backspace",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("abc\rX");
  REQUIRE(engine->lineText(0) == "Xbc");
  engine->write("\b\bYZ");
  REQUIRE(engine->lineText(0) == "YZc");
  engine->write("\tq");
  REQUIRE(engine->lineText(0) == "YZc     q");
}

TEST_CASE("HeadlessRenderEngine erase sequences", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("prompt$ typed");
  engine->write("\x1b[5D\x1b[K");
  REQUIRE(engine->lineText(0) == "prompt$");

  engine->write("\r\nmore\x1b[H\x1b[2J");
  REQUIRE(engine->numLines() == 1);
  REQUIRE(engine->serialize() == "");
}

TEST_CASE("HeadlessRenderEngine drops color sequences",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("\x1b[31mred\x1b[0m \x1b(Bplain");
  REQUIRE(engine->lineText(0) == "red plain");
}

TEST_CASE("HeadlessRenderEngine wraps at the column count",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->resize(24, 5);
  engine->write("abcdefg");
  REQUIRE(engine->lineText(0) == "abcde");
  REQUIRE(engine->lineText(1) == "fg");
}

TEST_CASE("HeadlessRenderEngine keeps bounded scrollback",
          "[HeadlessRenderEngine]") {
  RenderOptions options;
  options.scrollback = 2;
  auto engine = createEngine(options);
  engine->resize(3, 10);
  for (int a = 0; a < 10; a++) {
    if (a) {
      engine->write("\n");
    }
    engine->write(string("l") + to_string(a));
  }
  REQUIRE(engine->numLines() == 5);
  REQUIRE(engine->lineText(0) == "l5");
  REQUIRE(engine->lineText(4) == "l9");
}

TEST_CASE("HeadlessRenderEngine decodes split UTF-8", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  string snowman = "\xe2\x98\x83";
  engine->write(snowman.substr(0, 1));
  engine->write(snowman.substr(1));
  REQUIRE(engine->lineText(0) == snowman);
}

TEST_CASE("HeadlessRenderEngine character widths", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("a\xe4\xb8\xad");
  REQUIRE(engine->getCursorCol() == 3);
  engine->write("\r\ne\xcc\x81");
  REQUIRE(engine->getCursorCol() == 1);
  REQUIRE(engine->lineText(1) == "e\xcc\x81");

  engine->resize(24, 3);
  engine->write("\x1b[H\x1b[2J");
  // Two wide characters do not fit in three columns
  engine->write("\xe4\xb8\xad\xe4\xb8\xad");
  REQUIRE(engine->lineText(0) == "\xe4\xb8\xad");
  REQUIRE(engine->lineText(1) == "\xe4\xb8\xad");
}

TEST_CASE("HeadlessRenderEngine fits its mount target",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  REQUIRE_FALSE(engine->fit());

  Viewport viewport(0, 0);
  engine->open(&viewport);
  REQUIRE_FALSE(engine->fit());

  vector<pair<int, int>> resizes;
  engine->onResize(
      [&resizes](int rows, int cols) { resizes.push_back({rows, cols}); });
  viewport.setSize(800, 480);
  REQUIRE(engine->fit());
  REQUIRE(engine->cols() == 95);
  REQUIRE(engine->rows() == 28);
  REQUIRE(resizes.size() == 1);

  // Same geometry, no event
  REQUIRE(engine->fit());
  REQUIRE(resizes.size() == 1);

  viewport.setSize(1, 1);
  REQUIRE(engine->fit());
  REQUIRE(engine->cols() == 2);
  REQUIRE(engine->rows() == 1);
}

TEST_CASE("HeadlessRenderEngine paste", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  vector<string> sent;
  engine->onData([&sent](const string& data) { sent.push_back(data); });

  engine->paste("one\r\ntwo\nthree");
  REQUIRE(sent.back() == "one\rtwo\rthree");

  engine->write("\x1b[?2004h");
  engine->paste("x");
  REQUIRE(sent.back() == "\x1b[200~x\x1b[201~");

  engine->write("\x1b[?2004l");
  engine->paste("y");
  REQUIRE(sent.back() == "y");
}

TEST_CASE("HeadlessRenderEngine answers terminal queries",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  vector<string> sent;
  engine->onData([&sent](const string& data) { sent.push_back(data); });
  engine->write("abc\x1b[6n");
  // Cursor position report, 1-based
  REQUIRE(sent == vector<string>({"\x1b[1;4R"}));
}

TEST_CASE("HeadlessRenderEngine reports titles", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  vector<string> titles;
  engine->onTitleChange([&titles](const string& t) { titles.push_back(t); });
  engine->write("\x1b]0;vim notes.txt\x07");
  engine->write("\x1b]2;htop\x1b\\");
  REQUIRE(titles == vector<string>({"vim notes.txt", "htop"}));
  REQUIRE(engine->getTitle() == "htop");
  REQUIRE(engine->serialize() == "");
}

TEST_CASE("HeadlessRenderEngine search wraps around",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  vector<string> selections;
  engine->onSelectionChange(
      [&selections](const string& s) { selections.push_back(s); });
  engine->write("foo bar\nbaz foo");

  REQUIRE(engine->findNext("foo"));
  REQUIRE(engine->getSelection() == "foo");
  REQUIRE(engine->findNext("foo"));
  REQUIRE(engine->findNext("foo"));
  REQUIRE(engine->findPrevious("foo"));
  REQUIRE_FALSE(engine->findNext("missing"));
  REQUIRE(selections.size() == 1);

  engine->clearSearch();
  REQUIRE(engine->getSelection().empty());
  REQUIRE(selections.back().empty());

  EngineCapabilities noSearch;
  noSearch.search = false;
  auto limited = createEngine(RenderOptions(), noSearch);
  limited->write("foo");
  REQUIRE_FALSE(limited->findNext("foo"));
}

TEST_CASE("HeadlessRenderEngine selection", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("hello world\nsecond");
  engine->select(0, 6, 5);
  REQUIRE(engine->getSelection() == "world");
  engine->selectAll();
  REQUIRE(engine->getSelection() == "hello world\nsecond");
  engine->select(7, 0, 1);
  REQUIRE(engine->getSelection().empty());
  engine->select(1, 0, 100);
  REQUIRE(engine->getSelection() == "second");
  engine->clearSelection();
  REQUIRE(engine->getSelection().empty());
}

TEST_CASE("HeadlessRenderEngine finds links", "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("see https://example.com/docs, or (ftp://host/file).\n");
  auto urls = engine->links();
  REQUIRE(urls ==
          vector<string>({"https://example.com/docs", "ftp://host/file"}));
}

TEST_CASE("HeadlessRenderEngine is inert once disposed",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  Viewport viewport(800, 480);
  engine->open(&viewport);
  int calls = 0;
  auto id = engine->onData([&calls](const string&) { calls++; });
  engine->input("a");
  REQUIRE(calls == 1);

  engine->removeCallback(id);
  engine->input("b");
  REQUIRE(calls == 1);

  engine->onData([&calls](const string&) { calls++; });
  engine->focus();
  REQUIRE(engine->hasFocus());
  engine->dispose();
  REQUIRE(engine->isDisposed());
  REQUIRE_FALSE(engine->hasFocus());
  engine->input("c");
  engine->write("ignored");
  REQUIRE(calls == 1);
  REQUIRE_FALSE(engine->fit());
  REQUIRE(engine->serialize() == "");
}

TEST_CASE("HeadlessRenderEngine clamps huge cursor movements",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->resize(5, 10);
  engine->write("ab\x1b[2147483647C");
  engine->write("x");
  REQUIRE(engine->getCursorCol() <= engine->cols());
  REQUIRE(engine->lineText(0).find("ab") == 0);
  REQUIRE(engine->lineText(0).back() == 'x');
  REQUIRE(engine->lineText(0).size() <= size_t(engine->cols()));

  engine->write("\r\n\x1b[99999999999999999999999999G");
  engine->write("y\x1b[99999999999999999999D");
  engine->write("z");
  REQUIRE(engine->lineText(1) == "z        y");

  engine->write("\x1b[999999999999;999999999999H");
  REQUIRE(engine->getCursorRow() == engine->rows() - 1);
  REQUIRE(engine->getCursorCol() == engine->cols() - 1);
}

TEST_CASE("HeadlessRenderEngine holds a parameter split across writes",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("\x1b[1");
  engine->write("0Gx");
  REQUIRE(engine->lineText(0) == "         x");

  CsiParameterClamp clamp;
  REQUIRE(clamp.filter("\x1b[12") == "\x1b[");
  REQUIRE(clamp.filter("3456789;4H") == "65535;4H");
  REQUIRE(clamp.filter("plain 99999999 text") == "plain 99999999 text");
  REQUIRE(clamp.filter("\x1b[007m") == "\x1b[7m");
}

TEST_CASE("HeadlessRenderEngine survives malformed sequences",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->resize(5, 20);

  // Negative and intermediate-laden parameters
  engine->write("ab\x1b[-5D\x1b[-3;-4Hcd");
  REQUIRE(engine->lineText(0).find("ab") == 0);
  REQUIRE(engine->getCursorCol() < engine->cols());
  REQUIRE(engine->getCursorRow() < engine->rows());

  // A control character inside a sequence runs without ending it
  engine->write("\x1b[H\x1b[2Jabcdef\r\x1b[\x08"
                "2CX");
  REQUIRE(engine->lineText(0) == "abXdef");

  // An unfinished CSI at the end of a write completes with the next one
  engine->write("\r\x1b[");
  engine->write("4CY");
  REQUIRE(engine->lineText(0) == "abXdYf");
}

TEST_CASE("HeadlessRenderEngine bounds window titles",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  vector<string> titles;
  engine->onTitleChange([&titles](const string& t) { titles.push_back(t); });

  // Unterminated until a later write
  engine->write("\x1b]2;partial");
  REQUIRE(titles.empty());
  engine->write(" title\x07after");
  REQUIRE(titles == vector<string>({"partial title"}));
  REQUIRE(engine->lineText(0) == "after");

  engine->write("\x1b]0;" + string(1024 * 1024, 't') + "\x07");
  REQUIRE(titles.size() == 2);
  REQUIRE(titles.back().size() <= 4096);
  engine->write("\r\nvisible");
  REQUIRE(engine->lineText(1) == "visible");
}

TEST_CASE("HeadlessRenderEngine replaces invalid UTF-8",
          "[HeadlessRenderEngine]") {
  auto engine = createEngine();
  engine->write("a\xf5\x80\x80\x80\xf7\xbf\xbf\xbf\xff\xc0\xafb");
  string text = engine->lineText(0);
  REQUIRE(text.front() == 'a');
  REQUIRE(text.back() == 'b');
  for (char c : text) {
    unsigned char byte = c;
    // Only lead bytes of code points up to U+10FFFF may appear
    REQUIRE(byte != 0xC0);
    REQUIRE(byte != 0xC1);
    REQUIRE(byte < 0xF5);
  }
}
