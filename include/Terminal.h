// include/Terminal.h

#ifndef TERMINAL_H
#define TERMINAL_H

namespace pkgreport {

    class Terminal {
    public:
        /// Current width of stdout: TIOCGWINSZ, then $COLUMNS, then 80.
        /// Not cached, the terminal can be resized between invocations.
        static int columns();

        static bool isColorCapable(int fd);
    };

} // namespace pkgreport

#endif //TERMINAL_H
