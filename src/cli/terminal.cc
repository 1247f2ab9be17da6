#include <cli/terminal.h>
#include <iostream>

namespace depotprogress::cli {

#ifdef _WIN32
Terminal::Terminal()
    : hOut(GetStdHandle(STD_OUTPUT_HANDLE)) {}
#else
Terminal::Terminal() = default;
#endif

void Terminal::PrintLine(const std::string& message) {
    std::cout << message << std::endl;
}

void Terminal::PrintInfo(const std::string& message) {
#ifdef _WIN32
    SetConsoleTextAttribute(hOut, FOREGROUND_GREEN);
    std::cout << "[INFO] " << message << std::endl;
    SetConsoleTextAttribute(hOut, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#else
    std::cout << "\033[32m[INFO] " << message << "\033[0m" << std::endl;
#endif
}

void Terminal::PrintError(const std::string& message) {
#ifdef _WIN32
    SetConsoleTextAttribute(hOut, FOREGROUND_RED);
    std::cerr << "[ERROR] " << message << std::endl;
    SetConsoleTextAttribute(hOut, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#else
    std::cerr << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
#endif
}

} // namespace depotprogress::cli
