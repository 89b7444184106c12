#pragma once
#include "storage/Database.hpp"
#include "utils/Opml.hpp"
#include <string>

namespace NewsDeck {

struct ImportSummary {
    size_t categories = 0;
    size_t feeds = 0;
};

// Persists an outline tree: folders become categories (reused when a category
// of the same name already exists under the same parent), feeds are upserted.
ImportSummary importOpml(Database& db, const OpmlDocument& document);

// Subscriptions as an outline tree mirroring the category forest.
// Uncategorised feeds sit at the top level.
OpmlDocument exportOpml(const Database& db);

}
