// src/Terminal.cpp

#include "Terminal.h"

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace pkgreport {

    int Terminal::columns() {
        struct winsize ws{};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
            return ws.ws_col;

        if (const char* env = std::getenv("COLUMNS"); env && *env) {
            try {
                const int cols = std::stoi(env);
                if (cols > 0) return cols;
            } catch (const std::exception&) {
                // not a number, fall through
            }
        }
        return 80;
    }

    bool Terminal::isColorCapable(int fd) {
        if (!isatty(fd)) return false;
        const char* term = std::getenv("TERM");
        return term && std::strcmp(term, "dumb") != 0;
    }

} // namespace pkgreport
