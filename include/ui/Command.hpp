#pragma once
#include <string>

namespace NewsDeck {

enum class Key {
    Char,
    Up,
    Down,
    Left,
    Right,
    PageUp,
    PageDown,
    Home,
    End,
    Enter,
    Escape,
    Backspace,
    Tab,
    BackTab,
    Resize,
    Unknown
};

struct KeyEvent {
    Key key = Key::Unknown;
    std::string text;         // UTF-8 of the typed character when key == Char
    int raw = 0;
};

enum class CommandKind {
    None,
    Quit,
    MoveUp,
    MoveDown,
    PageUp,
    PageDown,
    Top,
    Bottom,
    NextFocus,
    PrevFocus,
    Open,
    Back,
    ToggleCollapse,
    StartSearch,
    StartSubscribe,
    InputChar,
    InputBackspace,
    InputCommit,
    InputCancel,
    RefreshAll,
    RefreshFeed,
    Delete,
    NewCategory,
    Rename,
    MoveToCategory,
    Confirm,
    Deny,
    ToggleStar,
    ToggleRead,
    MarkAllRead,
    ToggleStarredOnly,
    ToggleUnreadOnly,
    OpenInBrowser,
    ReloadContent,
    ExportOpml,
    Resize
};

struct Command {
    CommandKind kind = CommandKind::None;
    std::string text;         // for InputChar
};

}
