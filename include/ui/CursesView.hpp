#pragma once
#include "ui/TerminalView.hpp"
#include <string>
#include <vector>

namespace NewsDeck {

class CursesView : public TerminalView {
public:
    void render(const AppState& state) override;
    size_t pageSize() const override;

    static std::vector<std::string> wrap(const std::string& text, size_t width);
    static std::string fit(const std::string& text, size_t width);

private:
    void drawBrowse(const AppState& state, int top, int height);
    void drawReader(const AppState& state, int top, int height);
    void drawPicker(const AppState& state, int top, int height);
    void drawStatus(const AppState& state);
    void drawList(const std::vector<std::string>& items, const std::vector<int>& attrs, size_t cursor,
                  bool focused, int top, int left, int height, int width);
};

}
