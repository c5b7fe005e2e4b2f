#pragma once
#include <string>
#include <iostream>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <termios.h>
  #include <unistd.h>
#endif

// Returns false on end of input.
inline bool read_line(std::string& out) {
    if (!std::getline(std::cin, out)) {
        out.clear();
        return false;
    }
    if (!out.empty() && out.back() == '\r') out.pop_back();
    return true;
}

inline std::string prompt_line(const std::string& message) {
    std::cout << message << std::flush;
    std::string s;
    read_line(s);
    return s;
}

inline bool prompt_yes_no(const std::string& message) {
    const std::string answer = prompt_line(message + " (y/N): ");
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

// Reads a line with terminal echo disabled (master passwords).
inline std::string prompt_hidden(const std::string& message) {
    std::cout << message << std::flush;
    std::string out;

#if defined(_WIN32)
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    const bool console = GetConsoleMode(hStdin, &mode) != 0;
    if (console) SetConsoleMode(hStdin, mode & ~ENABLE_ECHO_INPUT);
    read_line(out);
    if (console) SetConsoleMode(hStdin, mode);
#else
    termios oldt{};
    const bool tty = tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        termios newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }
    read_line(out);
    if (tty) tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
#endif

    std::cout << "\n";
    return out;
}
