#include "app/ContentLoader.hpp"
#include <glib.h>

namespace NewsDeck {

ContentLoader::ContentLoader(TaskPool& pool, std::shared_ptr<ContentExtractor> extractor,
                             std::optional<std::string> apiKey)
    : pool_(pool), extractor_(std::move(extractor)), apiKey_(std::move(apiKey)) {}

ContentLoader::Result ContentLoader::request(AppState& state, const Article& article, bool force) {
    ContentState& cs = state.content[article.id];
    if (cs.phase == ContentPhase::Loading) return Result::AlreadyLoading;
    if (!force) {
        if (cs.phase == ContentPhase::Loaded) return Result::Cached;
        if (article.content && !article.content->empty()) {
            cs.phase = ContentPhase::Loaded;
            cs.content = *article.content;
            cs.error.clear();
            return Result::FromStore;
        }
    }

    cs.phase = ContentPhase::Loading;
    cs.error.clear();

    auto extractor = extractor_;
    auto apiKey = apiKey_;
    ArticleId id = article.id;
    std::string link = article.link;

    TaskSpec spec;
    spec.tag = "extract:" + std::to_string(id);
    spec.work = [extractor, apiKey, id, link]() -> AppEvent {
        ExtractOutcome outcome = extractor->extract(link, apiKey);
        ContentExtracted event;
        event.articleId = id;
        event.success = outcome.success;
        event.text = std::move(outcome.text);
        event.error = outcome.error;
        return event;
    };
    spec.recover = [id](const TaskError& error) -> AppEvent {
        ContentExtracted event;
        event.articleId = id;
        event.error = error;
        return event;
    };
    pool_.spawn(std::move(spec));
    g_debug("Loading content of article %" G_GINT64_FORMAT, id);
    return Result::Started;
}

bool ContentLoader::apply(AppState& state, const ContentExtracted& event) const {
    ContentState& cs = state.content[event.articleId];
    if (event.success) {
        cs.phase = ContentPhase::Loaded;
        cs.content = event.text;
        cs.error.clear();
        if (Article* article = state.findArticle(event.articleId)) article->content = event.text;
    } else {
        cs.phase = ContentPhase::Failed;
        cs.content.clear();
        cs.error = event.error.describe();
    }

    bool onScreen = state.view == View::Reader && state.readerArticleId == event.articleId;
    if (!onScreen) g_debug("Content for article %" G_GINT64_FORMAT " arrived off screen", event.articleId);
    return onScreen;
}

std::string ContentLoader::displayBody(const AppState& state, const Article& article) {
    ContentState cs = state.contentOf(article.id);
    if (cs.phase == ContentPhase::Loaded) return cs.content;
    return article.summary;
}

}
