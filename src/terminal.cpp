#include "terminal.hpp"
#include <sys/ioctl.h>
#include <unistd.h>

size_t get_terminal_width() {
#if defined(TIOCGWINSZ)
  struct winsize ts;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ts) == 0)
    return ts.ws_col;
#endif
  return 0;
}
