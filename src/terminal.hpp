#ifndef TERMINAL_HPP
#define TERMINAL_HPP

#include <cstddef>

/** Width of the controlling terminal; 0 if it can not be determined */
size_t get_terminal_width();

#endif
