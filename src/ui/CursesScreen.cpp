#include "ui/CursesScreen.hpp"
#include <clocale>
#include <stdexcept>
#define NCURSES_WIDECHAR 1
#define NCURSES_NOMACROS 1
#include <curses.h>

namespace NewsDeck {

CursesScreen::CursesScreen() {
    setlocale(LC_ALL, "");
    if (!initscr()) throw std::runtime_error("cannot initialise the terminal");
    cbreak();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(Normal, -1, -1);
        init_pair(Highlight, COLOR_BLACK, COLOR_CYAN);
        init_pair(Dim, COLOR_BLUE, -1);
        init_pair(Accent, COLOR_YELLOW, -1);
        init_pair(Error, COLOR_RED, -1);
        init_pair(Bar, COLOR_BLACK, COLOR_WHITE);
    }
}

CursesScreen::~CursesScreen() {
    endwin();
}

}
