#include "ui/KeyDecoder.hpp"

namespace NewsDeck {

static Command make(CommandKind kind) {
    return Command{kind, ""};
}

static Command decodePrompt(const KeyEvent& event) {
    switch (event.key) {
        case Key::Char: return Command{CommandKind::InputChar, event.text};
        case Key::Backspace: return make(CommandKind::InputBackspace);
        case Key::Enter: return make(CommandKind::InputCommit);
        case Key::Escape: return make(CommandKind::InputCancel);
        default: return make(CommandKind::None);
    }
}

static Command decodePicker(const KeyEvent& event) {
    switch (event.key) {
        case Key::Up: return make(CommandKind::MoveUp);
        case Key::Down: return make(CommandKind::MoveDown);
        case Key::Enter: return make(CommandKind::InputCommit);
        case Key::Escape: return make(CommandKind::InputCancel);
        case Key::Char:
            if (event.text == "k") return make(CommandKind::MoveUp);
            if (event.text == "j") return make(CommandKind::MoveDown);
            return make(CommandKind::None);
        default: return make(CommandKind::None);
    }
}

static Command decodeConfirm(const KeyEvent& event) {
    if (event.key == Key::Escape) return make(CommandKind::Deny);
    if (event.key != Key::Char) return make(CommandKind::None);
    if (event.text == "y" || event.text == "Y") return make(CommandKind::Confirm);
    if (event.text == "n" || event.text == "N") return make(CommandKind::Deny);
    return make(CommandKind::None);
}

static Command decodeNormal(const KeyEvent& event) {
    switch (event.key) {
        case Key::Up: return make(CommandKind::MoveUp);
        case Key::Down: return make(CommandKind::MoveDown);
        case Key::PageUp: return make(CommandKind::PageUp);
        case Key::PageDown: return make(CommandKind::PageDown);
        case Key::Home: return make(CommandKind::Top);
        case Key::End: return make(CommandKind::Bottom);
        case Key::Tab: return make(CommandKind::NextFocus);
        case Key::BackTab: return make(CommandKind::PrevFocus);
        case Key::Enter:
        case Key::Right: return make(CommandKind::Open);
        case Key::Escape:
        case Key::Left:
        case Key::Backspace: return make(CommandKind::Back);
        case Key::Char: break;
        default: return make(CommandKind::None);
    }

    if (event.text.size() != 1) return make(CommandKind::None);
    switch (event.text[0]) {
        case 'q': return make(CommandKind::Quit);
        case 'k': return make(CommandKind::MoveUp);
        case 'j': return make(CommandKind::MoveDown);
        case 'g': return make(CommandKind::Top);
        case 'G': return make(CommandKind::Bottom);
        case 'l': return make(CommandKind::Open);
        case 'h': return make(CommandKind::Back);
        case ' ': return make(CommandKind::ToggleCollapse);
        case '/': return make(CommandKind::StartSearch);
        case 'a': return make(CommandKind::StartSubscribe);
        case 'R': return make(CommandKind::RefreshAll);
        case 'r': return make(CommandKind::RefreshFeed);
        case 'd': return make(CommandKind::Delete);
        case 'c': return make(CommandKind::NewCategory);
        case 'E': return make(CommandKind::Rename);
        case 'v': return make(CommandKind::MoveToCategory);
        case 'S': return make(CommandKind::ToggleStarredOnly);
        case 'U': return make(CommandKind::ToggleUnreadOnly);
        case 's': return make(CommandKind::ToggleStar);
        case 'm': return make(CommandKind::ToggleRead);
        case 'M': return make(CommandKind::MarkAllRead);
        case 'o': return make(CommandKind::OpenInBrowser);
        case 'L': return make(CommandKind::ReloadContent);
        case 'e': return make(CommandKind::ExportOpml);
        default: return make(CommandKind::None);
    }
}

Command decodeKey(const KeyEvent& event, InputMode mode) {
    if (event.key == Key::Resize) return make(CommandKind::Resize);
    switch (mode) {
        case InputMode::Search:
        case InputMode::Subscribe:
        case InputMode::NewCategory:
        case InputMode::Rename: return decodePrompt(event);
        case InputMode::PickCategory: return decodePicker(event);
        case InputMode::ConfirmDelete: return decodeConfirm(event);
        case InputMode::Normal: return decodeNormal(event);
    }
    return make(CommandKind::None);
}

}
