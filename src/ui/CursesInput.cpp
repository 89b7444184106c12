#include "ui/CursesInput.hpp"
#include <glib.h>
#include <unistd.h>
#define NCURSES_WIDECHAR 1
#define NCURSES_NOMACROS 1
#include <curses.h>

namespace NewsDeck {

int CursesInput::fd() const {
    return STDIN_FILENO;
}

static KeyEvent functionKey(wint_t code) {
    KeyEvent event;
    event.raw = static_cast<int>(code);
    switch (code) {
        case KEY_UP: event.key = Key::Up; break;
        case KEY_DOWN: event.key = Key::Down; break;
        case KEY_LEFT: event.key = Key::Left; break;
        case KEY_RIGHT: event.key = Key::Right; break;
        case KEY_PPAGE: event.key = Key::PageUp; break;
        case KEY_NPAGE: event.key = Key::PageDown; break;
        case KEY_HOME: event.key = Key::Home; break;
        case KEY_END: event.key = Key::End; break;
        case KEY_ENTER: event.key = Key::Enter; break;
        case KEY_BACKSPACE: event.key = Key::Backspace; break;
        case KEY_BTAB: event.key = Key::BackTab; break;
        case KEY_RESIZE: event.key = Key::Resize; break;
        default: event.key = Key::Unknown; break;
    }
    return event;
}

static KeyEvent characterKey(wint_t code) {
    KeyEvent event;
    event.raw = static_cast<int>(code);
    switch (code) {
        case '\n':
        case '\r': event.key = Key::Enter; return event;
        case 27: event.key = Key::Escape; return event;
        case 127:
        case 8: event.key = Key::Backspace; return event;
        case '\t': event.key = Key::Tab; return event;
        case 6: event.key = Key::PageDown; return event;     // ^F
        case 2: event.key = Key::PageUp; return event;       // ^B
        default: break;
    }
    if (code < 0x20 || !g_unichar_validate(static_cast<gunichar>(code))) {
        event.key = Key::Unknown;
        return event;
    }
    char buffer[8] = {0};
    gint length = g_unichar_to_utf8(static_cast<gunichar>(code), buffer);
    event.key = Key::Char;
    event.text.assign(buffer, static_cast<size_t>(length));
    return event;
}

std::optional<KeyEvent> CursesInput::poll() {
    wint_t code = 0;
    int rc = wget_wch(stdscr, &code);
    if (rc == ERR) return std::nullopt;
    return rc == KEY_CODE_YES ? functionKey(code) : characterKey(code);
}

}
