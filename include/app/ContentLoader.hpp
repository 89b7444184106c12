#pragma once
#include "app/AppState.hpp"
#include "app/TaskPool.hpp"
#include "services/ContentExtractor.hpp"
#include <memory>
#include <optional>
#include <string>

namespace NewsDeck {

// Per-article full-text lifecycle: Idle -> Loading -> Loaded | Failed, with
// Loaded and Failed re-entering Loading on a forced reload.
class ContentLoader {
public:
    enum class Result {
        Started,
        AlreadyLoading,
        FromStore,
        Cached
    };

    ContentLoader(TaskPool& pool, std::shared_ptr<ContentExtractor> extractor,
                  std::optional<std::string> apiKey);

    Result request(AppState& state, const Article& article, bool force);

    // Records the outcome on the article it belongs to. Never changes the view
    // or the article on screen. Returns true when that article is on screen.
    bool apply(AppState& state, const ContentExtracted& event) const;

    // Extracted text once loaded, otherwise the feed's own summary.
    static std::string displayBody(const AppState& state, const Article& article);

private:
    TaskPool& pool_;
    std::shared_ptr<ContentExtractor> extractor_;
    std::optional<std::string> apiKey_;
};

}
