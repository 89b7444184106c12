#pragma once

namespace NewsDeck {

// Owns curses mode for the lifetime of the object.
class CursesScreen {
public:
    CursesScreen();
    ~CursesScreen();
    CursesScreen(const CursesScreen&) = delete;
    CursesScreen& operator=(const CursesScreen&) = delete;

    enum Pair {
        Normal = 1,
        Highlight,
        Dim,
        Accent,
        Error,
        Bar
    };
};

}
