#include "ui/Theme.h"

void init_theme() {
    Fl::scheme("gtk+");

    Fl::background(ThemeColors::red(ThemeColors::BG_WINDOW), ThemeColors::green(ThemeColors::BG_WINDOW),
                   ThemeColors::blue(ThemeColors::BG_WINDOW));
    Fl::background2(ThemeColors::red(ThemeColors::BG_INPUT), ThemeColors::green(ThemeColors::BG_INPUT),
                    ThemeColors::blue(ThemeColors::BG_INPUT));
    Fl::foreground(ThemeColors::red(ThemeColors::TEXT_PRIMARY), ThemeColors::green(ThemeColors::TEXT_PRIMARY),
                   ThemeColors::blue(ThemeColors::TEXT_PRIMARY));

    FL_NORMAL_SIZE = 13;
}
