#pragma once

#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

namespace depotprogress::cli {

class Terminal {
public:
    Terminal();

    void PrintLine(const std::string& message);
    void PrintInfo(const std::string& message);
    void PrintError(const std::string& message);

private:
#ifdef _WIN32
    HANDLE hOut;
#endif
};

} // namespace depotprogress::cli
