#pragma once
#include "ui/TerminalInput.hpp"

namespace NewsDeck {

class CursesInput : public TerminalInput {
public:
    CursesInput() = default;

    int fd() const override;
    std::optional<KeyEvent> poll() override;
};

}
