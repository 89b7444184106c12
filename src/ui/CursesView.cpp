#include "ui/CursesView.hpp"
#include "app/ContentLoader.hpp"
#include "ui/CursesScreen.hpp"
#include <glib.h>
#include <algorithm>
#include <sstream>
#define NCURSES_WIDECHAR 1
#define NCURSES_NOMACROS 1
#include <curses.h>

namespace NewsDeck {

static const char* const kSpinner[] = {"|", "/", "-", "\\"};

static size_t displayWidth(gunichar c) {
    if (g_unichar_iszerowidth(c)) return 0;
    return g_unichar_iswide(c) ? 2 : 1;
}

std::string CursesView::fit(const std::string& text, size_t width) {
    std::string out;
    size_t used = 0;
    for (const char* p = text.c_str(); *p; p = g_utf8_next_char(p)) {
        gunichar c = g_utf8_get_char_validated(p, -1);
        if (c == static_cast<gunichar>(-1) || c == static_cast<gunichar>(-2)) break;
        if (c == '\n' || c == '\t') c = ' ';
        size_t w = displayWidth(c);
        if (used + w > width) break;
        char buffer[8];
        out.append(buffer, static_cast<size_t>(g_unichar_to_utf8(c, buffer)));
        used += w;
    }
    return out;
}

std::vector<std::string> CursesView::wrap(const std::string& text, size_t width) {
    std::vector<std::string> lines;
    if (width == 0) return lines;
    std::istringstream paragraphs(text);
    std::string paragraph;
    while (std::getline(paragraphs, paragraph)) {
        std::istringstream words(paragraph);
        std::string word, line;
        size_t lineWidth = 0;
        while (words >> word) {
            size_t w = static_cast<size_t>(g_utf8_strlen(word.c_str(), -1));
            if (lineWidth > 0 && lineWidth + 1 + w > width) {
                lines.push_back(line);
                line.clear();
                lineWidth = 0;
            }
            while (w > width) {
                lines.push_back(fit(word, width));
                word = g_utf8_offset_to_pointer(word.c_str(), static_cast<glong>(width));
                w = static_cast<size_t>(g_utf8_strlen(word.c_str(), -1));
            }
            if (lineWidth > 0) {
                line += ' ';
                ++lineWidth;
            }
            line += word;
            lineWidth += w;
        }
        lines.push_back(line);
    }
    return lines;
}

static std::string formatTime(std::int64_t unixSeconds) {
    if (unixSeconds <= 0) return "";
    GDateTime* dt = g_date_time_new_from_unix_local(unixSeconds);
    if (!dt) return "";
    gchar* text = g_date_time_format(dt, "%Y-%m-%d %H:%M");
    std::string result = text ? text : "";
    g_free(text);
    g_date_time_unref(dt);
    return result;
}

size_t CursesView::pageSize() const {
    return LINES > 4 ? static_cast<size_t>(LINES - 4) : 1;
}

void CursesView::render(const AppState& state) {
    erase();
    int height = LINES - 2;
    attron(COLOR_PAIR(CursesScreen::Bar));
    mvhline(0, 0, ' ', COLS);
    std::string title = " NewsDeck";
    if (!state.search.empty()) title += "  search: " + state.search;
    if (state.starredOnly) title += "  [starred]";
    if (state.unreadOnly) title += "  [unread]";
    if (state.refreshPending > 0) {
        title += "  refreshing " + std::to_string(state.refreshPending) + " " + kSpinner[state.spinnerFrame % 4];
    }
    mvaddstr(0, 0, fit(title, static_cast<size_t>(COLS)).c_str());
    attroff(COLOR_PAIR(CursesScreen::Bar));

    if (height > 0) {
        if (state.view == View::Reader) {
            drawReader(state, 1, height);
        } else {
            drawBrowse(state, 1, height);
        }
        if (state.mode == InputMode::PickCategory) drawPicker(state, 1, height);
    }
    drawStatus(state);
    refresh();
}

void CursesView::drawList(const std::vector<std::string>& items, const std::vector<int>& attrs, size_t cursor,
                          bool focused, int top, int left, int height, int width) {
    if (width <= 2 || height <= 0) return;
    size_t rows = static_cast<size_t>(height);
    size_t offset = cursor >= rows ? cursor - rows + 1 : 0;
    for (size_t i = 0; i < rows && offset + i < items.size(); ++i) {
        size_t index = offset + i;
        int attr = attrs[index];
        if (index == cursor) attr = static_cast<int>(focused ? COLOR_PAIR(CursesScreen::Highlight) : A_REVERSE);
        attron(attr);
        mvhline(top + static_cast<int>(i), left, ' ', width - 1);
        mvaddstr(top + static_cast<int>(i), left, fit(items[index], static_cast<size_t>(width - 1)).c_str());
        attroff(attr);
    }
}

void CursesView::drawBrowse(const AppState& state, int top, int height) {
    int catWidth = COLS / 5;
    int feedWidth = COLS * 3 / 10;
    int articleLeft = catWidth + feedWidth;

    std::vector<std::string> items;
    std::vector<int> attrs;
    for (const auto& row : state.categoryRows()) {
        std::string marker = row.hasChildren ? (row.collapsed ? "+ " : "- ") : "  ";
        std::string label = std::string(static_cast<size_t>(row.depth) * 2, ' ') + marker + row.name;
        if (row.unread) label += " (" + std::to_string(row.unread) + ")";
        items.push_back(label);
        attrs.push_back(static_cast<int>(row.unread ? A_BOLD : A_NORMAL));
    }
    drawList(items, attrs, state.categoryCursor, state.focus == Focus::Categories, top, 0, height, catWidth);

    items.clear();
    attrs.clear();
    for (const Feed* feed : state.visibleFeeds()) {
        std::string label = feed->lastError ? "! " : "  ";
        label += feed->title;
        if (feed->unreadCount) label += " (" + std::to_string(feed->unreadCount) + ")";
        items.push_back(label);
        attrs.push_back(static_cast<int>(feed->lastError ? COLOR_PAIR(CursesScreen::Error)
                                                         : (feed->unreadCount ? A_BOLD : A_NORMAL)));
    }
    drawList(items, attrs, state.feedCursor, state.focus == Focus::Feeds, top, catWidth, height, feedWidth);

    items.clear();
    attrs.clear();
    for (const auto& article : state.articles) {
        std::string label = article.starred ? "* " : "  ";
        std::string when = formatTime(article.published);
        if (!when.empty()) label += when.substr(0, 10) + "  ";
        label += article.title;
        items.push_back(label);
        attrs.push_back(static_cast<int>(article.read ? COLOR_PAIR(CursesScreen::Dim) : A_BOLD));
    }
    if (items.empty()) {
        attron(COLOR_PAIR(CursesScreen::Dim));
        mvaddstr(top, articleLeft, fit(state.search.empty() ? "No articles" : "No matches",
                                       static_cast<size_t>(COLS - articleLeft)).c_str());
        attroff(COLOR_PAIR(CursesScreen::Dim));
        return;
    }
    drawList(items, attrs, state.articleCursor, state.focus == Focus::Articles, top, articleLeft, height,
             COLS - articleLeft);
}

void CursesView::drawPicker(const AppState& state, int top, int height) {
    int width = std::max(COLS / 3, 24);
    std::vector<std::string> items;
    std::vector<int> attrs;
    for (const auto& row : state.pickerRows()) {
        items.push_back(std::string(static_cast<size_t>(row.depth) * 2, ' ') + row.name);
        attrs.push_back(static_cast<int>(A_NORMAL));
    }
    for (int i = 0; i < height; ++i) mvhline(top + i, 0, ' ', width);
    attron(COLOR_PAIR(CursesScreen::Accent));
    mvaddstr(top, 0, fit("Move to:", static_cast<size_t>(width)).c_str());
    attroff(COLOR_PAIR(CursesScreen::Accent));
    drawList(items, attrs, state.pickerCursor, true, top + 1, 0, height - 1, width);
}

void CursesView::drawReader(const AppState& state, int top, int height) {
    const Article* article = state.readerArticle();
    if (!article) return;
    size_t width = COLS > 4 ? static_cast<size_t>(COLS - 4) : 1;

    attron(A_BOLD);
    mvaddstr(top, 2, fit(article->title, width).c_str());
    attroff(A_BOLD);
    attron(COLOR_PAIR(CursesScreen::Dim));
    mvaddstr(top + 1, 2, fit(formatTime(article->published) + "  " + article->link, width).c_str());
    attroff(COLOR_PAIR(CursesScreen::Dim));

    ContentState content = state.contentOf(article->id);
    int bodyTop = top + 3;
    if (content.phase == ContentPhase::Loading) {
        attron(COLOR_PAIR(CursesScreen::Accent));
        mvaddstr(top + 2, 2, (std::string(kSpinner[state.spinnerFrame % 4]) + " loading full text").c_str());
        attroff(COLOR_PAIR(CursesScreen::Accent));
    } else if (content.phase == ContentPhase::Failed) {
        attron(COLOR_PAIR(CursesScreen::Error));
        mvaddstr(top + 2, 2, fit("Summary shown: " + content.error, width).c_str());
        attroff(COLOR_PAIR(CursesScreen::Error));
    }

    std::vector<std::string> lines = wrap(ContentLoader::displayBody(state, *article), width);
    int rows = height - (bodyTop - top);
    size_t scroll = lines.empty() ? 0 : std::min(state.readerScroll, lines.size() - 1);
    for (int i = 0; i < rows && scroll + static_cast<size_t>(i) < lines.size(); ++i) {
        mvaddstr(bodyTop + i, 2, lines[scroll + static_cast<size_t>(i)].c_str());
    }
}

void CursesView::drawStatus(const AppState& state) {
    int line = LINES - 1;
    size_t width = static_cast<size_t>(COLS);
    move(line, 0);
    clrtoeol();
    switch (state.mode) {
        case InputMode::Search:
            mvaddstr(line, 0, fit("/" + state.input, width).c_str());
            return;
        case InputMode::Subscribe:
            mvaddstr(line, 0, fit("Subscribe to URL: " + state.input, width).c_str());
            return;
        case InputMode::NewCategory:
            mvaddstr(line, 0, fit("New category: " + state.input, width).c_str());
            return;
        case InputMode::Rename:
            mvaddstr(line, 0, fit("Rename to: " + state.input, width).c_str());
            return;
        case InputMode::PickCategory:
            mvaddstr(line, 0, fit("j/k choose  enter move  esc cancel", width).c_str());
            return;
        case InputMode::ConfirmDelete: {
            std::string question = "Delete?";
            if (state.target && state.target->kind == TargetKind::Feed) {
                for (const auto& f : state.feeds) {
                    if (f.id == state.target->id) question = "Delete " + f.title + " and its articles? (y/n)";
                }
            } else if (state.target) {
                for (const auto& c : state.categories) {
                    if (c.id == state.target->id) question = "Delete category " + c.name + "? (y/n)";
                }
            }
            attron(COLOR_PAIR(CursesScreen::Accent));
            mvaddstr(line, 0, fit(question, width).c_str());
            attroff(COLOR_PAIR(CursesScreen::Accent));
            return;
        }
        case InputMode::Normal:
            break;
    }
    if (!state.status.empty()) {
        int attr = static_cast<int>(state.statusIsError ? COLOR_PAIR(CursesScreen::Error) : A_NORMAL);
        attron(attr);
        mvaddstr(line, 0, fit(state.status, width).c_str());
        attroff(attr);
        return;
    }
    attron(COLOR_PAIR(CursesScreen::Dim));
    const char* help = state.view == View::Reader
        ? "j/k scroll  h back  s star  m read  o browser  L reload  q quit"
        : "tab focus  enter open  / search  a add  c category  E rename  v move  d delete  r/R refresh  "
          "S starred  U unread  M all read  e export  q quit";
    mvaddstr(line, 0, fit(help, width).c_str());
    attroff(COLOR_PAIR(CursesScreen::Dim));
}

}
