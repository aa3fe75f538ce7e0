#include "polyvid/cli_colors.hpp"

#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace polyvid::cli {

namespace {
    bool g_colors_forced_off = false;
    bool g_stdout_checked = false;
    bool g_stdout_tty = false;
    bool g_stderr_checked = false;
    bool g_stderr_tty = false;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors(DWORD handle_id) {
        HANDLE handle = GetStdHandle(handle_id);
        if (handle == INVALID_HANDLE_VALUE) {
            return false;
        }
        DWORD mode = 0;
        if (!GetConsoleMode(handle, &mode)) {
            return false;
        }
        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(handle, mode) != 0;
    }
#endif

    bool DetectTty(FILE* stream) {
        bool is_tty = isatty(fileno(stream)) != 0;
#if defined(_WIN32) || defined(_WIN64)
        if (is_tty) {
            is_tty = EnableWindowsAnsiColors(stream == stderr ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
        }
#endif
        return is_tty;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_colors_forced_off) {
        return false;
    }
    // Streams other than the two consoles never get escape codes.
    if (&os == &std::cout) {
        if (!g_stdout_checked) {
            g_stdout_tty = DetectTty(stdout);
            g_stdout_checked = true;
        }
        return g_stdout_tty;
    }
    if (&os == &std::cerr) {
        if (!g_stderr_checked) {
            g_stderr_tty = DetectTty(stderr);
            g_stderr_checked = true;
        }
        return g_stderr_tty;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_colors_forced_off = !enabled;
}

namespace {

const char* AnsiCode(Style style) {
    switch (style) {
        case Style::Green:
            return "\033[0;32m";
        case Style::Yellow:
            return "\033[0;33m";
        case Style::Cyan:
            return "\033[0;36m";
        case Style::Dim:
            return "\033[0;90m";
        case Style::BoldRed:
            return "\033[1;31m";
        case Style::BoldYellow:
            return "\033[1;33m";
    }
    return "";
}

}  // namespace

std::string Paint(const std::string& text, Style style, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return AnsiCode(style) + text + "\033[0m";
}

}  // namespace polyvid::cli
