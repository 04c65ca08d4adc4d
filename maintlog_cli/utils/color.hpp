#ifndef MAINTLOG_COLOR_HPP
#define MAINTLOG_COLOR_HPP

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif
#include <cstdio>

// ANSI escape sequences
#define RESET  "\033[0m"
#define RED    "\033[1;31m"
#define GREEN  "\033[1;32m"
#define YELLOW "\033[1;33m"
#define CYAN   "\033[1;36m"

inline bool stderr_is_tty() {
    return isatty(fileno(stderr)) != 0;
}

#endif // MAINTLOG_COLOR_HPP
