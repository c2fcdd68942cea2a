#pragma once

#include <FL/Fl.H>

namespace ThemeColors {
constexpr Fl_Color BG_WINDOW = 0x1c1d22FF;
constexpr Fl_Color BG_PANEL = 0x15161aFF;
constexpr Fl_Color BG_INPUT = 0x26272dFF;

constexpr Fl_Color TEXT_PRIMARY = 0xE2E2E6FF;
constexpr Fl_Color TEXT_SECONDARY = 0x8e939cFF;

constexpr Fl_Color BTN_PRIMARY = 0x3f7ee8FF;
constexpr Fl_Color BTN_SECONDARY = 0x44454cFF;

constexpr Fl_Color STATUS_OK = 0x3ba55cFF;
constexpr Fl_Color STATUS_PENDING = 0xd9a33aFF;
constexpr Fl_Color STATUS_ERROR = 0xe5484dFF;

inline constexpr unsigned char red(Fl_Color color) { return (color >> 24) & 0xFF; }
inline constexpr unsigned char green(Fl_Color color) { return (color >> 16) & 0xFF; }
inline constexpr unsigned char blue(Fl_Color color) { return (color >> 8) & 0xFF; }
} // namespace ThemeColors

void init_theme();
