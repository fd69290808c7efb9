#ifndef __MT_RAW_SOCKET_UTILS__
#define __MT_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace mt {
/**
 * @brief Write helpers over a raw non-blocking descriptor such as a pty
 * master.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes as much of the buffer as the descriptor accepts without
   * blocking and returns the number of bytes written.  Throws
   * std::runtime_error when the descriptor is unusable.
   */
  static size_t writeSome(int fd, const char* buf, size_t count);

  /**
   * @brief Switches the descriptor to non-blocking mode.
   */
  static void setNonBlocking(int fd);
};
}  // namespace mt
#endif  // __MT_RAW_SOCKET_UTILS__
