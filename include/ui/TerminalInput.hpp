#pragma once
#include "ui/Command.hpp"
#include <optional>

namespace NewsDeck {

// Source of key and resize events. poll() never blocks; the loop watches
// fd() for readability.
class TerminalInput {
public:
    virtual ~TerminalInput() = default;

    virtual int fd() const = 0;
    virtual std::optional<KeyEvent> poll() = 0;
};

}
