#pragma once
#include "app/AppState.hpp"
#include <cstddef>

namespace NewsDeck {

class TerminalView {
public:
    virtual ~TerminalView() = default;

    virtual void render(const AppState& state) = 0;
    // Rows in one page of the focused list.
    virtual size_t pageSize() const = 0;
};

}
