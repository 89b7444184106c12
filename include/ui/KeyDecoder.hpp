#pragma once
#include "app/AppState.hpp"
#include "ui/Command.hpp"

namespace NewsDeck {

// Maps a key press to a command for the current input mode. Unbound keys
// decode to CommandKind::None.
Command decodeKey(const KeyEvent& event, InputMode mode);

}
