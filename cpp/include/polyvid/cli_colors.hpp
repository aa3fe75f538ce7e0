#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace polyvid::cli {

enum class Style {
    Green,
    Yellow,
    Cyan,
    Dim,
    BoldRed,
    BoldYellow
};

// True when os is a console stream attached to a terminal and colors were not turned off.
bool ColorsEnabled(std::ostream& os = std::cout);

// --no-color and NO_COLOR end up here.
void SetColorsEnabled(bool enabled);

std::string Paint(const std::string& text, Style style, std::ostream& os = std::cout);

inline std::string Green(const std::string& text) { return Paint(text, Style::Green); }
inline std::string Yellow(const std::string& text) { return Paint(text, Style::Yellow); }
inline std::string Cyan(const std::string& text) { return Paint(text, Style::Cyan); }
inline std::string Dim(const std::string& text) { return Paint(text, Style::Dim); }
inline std::string BoldRed(const std::string& text) { return Paint(text, Style::BoldRed); }
inline std::string BoldYellow(const std::string& text) { return Paint(text, Style::BoldYellow); }

}  // namespace polyvid::cli
