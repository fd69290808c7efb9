#ifndef __MT_CLIPBOARD_HPP__
#define __MT_CLIPBOARD_HPP__

#include "Headers.hpp"

namespace mt {
/** @brief System clipboard as seen by a terminal surface. */
class Clipboard {
 public:
  virtual ~Clipboard() {}

  virtual void writeText(const string& text) = 0;
  virtual string readText() = 0;
};

/** @brief Process-local clipboard for headless runs and tests. */
class InMemoryClipboard : public Clipboard {
 public:
  virtual void writeText(const string& text) { contents = text; }
  virtual string readText() { return contents; }

 protected:
  string contents;
};
}  // namespace mt

#endif  // __MT_CLIPBOARD_HPP__
