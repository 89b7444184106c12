#include "app/Application.hpp"
#include "app/AppState.hpp"
#include "app/ContentLoader.hpp"
#include "app/Controller.hpp"
#include "app/EventChannel.hpp"
#include "app/EventLoop.hpp"
#include "app/RefreshCoordinator.hpp"
#include "app/TaskPool.hpp"
#include "services/ContentExtractor.hpp"
#include "services/FeedFetcher.hpp"
#include "storage/Database.hpp"
#include "storage/OpmlImport.hpp"
#include "ui/CursesInput.hpp"
#include "ui/CursesScreen.hpp"
#include "ui/CursesView.hpp"
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logging.hpp"
#include "utils/Opml.hpp"
#include <glib.h>
#include <libxml/parser.h>
#include <iostream>

namespace NewsDeck {

static const int kMaxConcurrentFetches = 10;
static const int kMaxConcurrentExtractions = 4;

Application::Application() {}

Application::~Application() {
    shutdownLogging();
}

bool Application::parseOptions(int argc, char* argv[], Options& options) {
    gchar* importPath = nullptr;
    gchar* exportPath = nullptr;
    gchar* configPath = nullptr;
    gboolean resetDb = FALSE;
    gboolean verbose = FALSE;

    GOptionEntry entries[] = {
        {"import", 'i', 0, G_OPTION_ARG_FILENAME, &importPath, "Import subscriptions from an OPML file", "FILE"},
        {"export", 'e', 0, G_OPTION_ARG_FILENAME, &exportPath, "Export subscriptions to an OPML file and exit", "FILE"},
        {"reset-db", 0, 0, G_OPTION_ARG_NONE, &resetDb, "Delete all stored feeds and articles before starting", nullptr},
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &configPath, "Use an alternate configuration file", "FILE"},
        {"verbose", 'v', 0, G_OPTION_ARG_NONE, &verbose, "Write debug messages to the log", nullptr},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}
    };

    GOptionContext* context = g_option_context_new("- terminal feed reader");
    g_option_context_add_main_entries(context, entries, nullptr);
    GError* error = nullptr;
    bool ok = g_option_context_parse(context, &argc, &argv, &error);
    if (!ok) {
        std::cerr << "newsdeck: " << (error ? error->message : "invalid arguments") << std::endl;
        g_clear_error(&error);
    }
    g_option_context_free(context);

    if (importPath) options.importPath = importPath;
    if (exportPath) options.exportPath = exportPath;
    if (configPath) options.configPath = configPath;
    options.resetDb = resetDb;
    options.verbose = verbose;
    g_free(importPath);
    g_free(exportPath);
    g_free(configPath);
    return ok;
}

int Application::run(int argc, char* argv[]) {
    if (!parseOptions(argc, argv, options_)) return 1;

    Config* config = &Config::getInstance();
    if (!options_.configPath.empty()) {
        ownedConfig_ = std::make_unique<Config>(options_.configPath);
        config = ownedConfig_.get();
    }
    config->load();

    gchar* configDir = g_path_get_dirname(config->path().c_str());
    std::string dir = configDir;
    g_free(configDir);
    initLogging(dir + "/newsdeck.log", options_.verbose ? LogLevel::Debug : config->getLogLevel());
    g_message("Starting NewsDeck");

    // Both libraries keep global state that must be set up before any worker starts.
    HttpClient::globalInit();
    xmlInitParser();

    std::string dbPath = config->getDatabasePath();
    if (options_.resetDb) Database::destroy(dbPath);
    Database db(dbPath);

    if (!options_.importPath.empty()) {
        OpmlDocument document = Opml::readFile(options_.importPath);
        ImportSummary summary = importOpml(db, document);
        std::cout << "Imported " << summary.feeds << " feeds in " << summary.categories << " categories from "
                  << options_.importPath << std::endl;
    }

    if (!options_.exportPath.empty()) {
        OpmlDocument document = exportOpml(db);
        Opml::writeFile(options_.exportPath, document);
        std::cout << "Exported " << Opml::countFeeds(document.outlines) << " feeds to " << options_.exportPath
                  << std::endl;
        return 0;
    }

    return runInteractive(*config, db);
}

int Application::runInteractive(Config& config, Database& db) {
    auto channel = std::make_shared<EventChannel>();
    TaskPool fetchPool(channel, kMaxConcurrentFetches);
    TaskPool contentPool(channel, kMaxConcurrentExtractions);

    auto fetcher = std::make_shared<HttpFeedFetcher>(config.getUserAgent(), config.getFetchTimeoutSeconds());
    auto extractor = std::make_shared<HttpContentExtractor>(config.getExtractorBaseUrl(), config.getUserAgent(),
                                                            config.getExtractTimeoutSeconds());
    RefreshCoordinator refresher(fetchPool, channel, fetcher);
    ContentLoader loader(contentPool, extractor, config.getApiKey());

    ControllerSettings settings;
    settings.refreshIntervalMinutes = config.getRefreshIntervalMinutes();
    settings.markReadOnOpen = config.getMarkReadOnOpen();
    settings.statusTimeoutSeconds = config.getStatusTimeoutSeconds();
    settings.browser = config.getBrowser();
    gchar* dir = g_path_get_dirname(config.path().c_str());
    settings.exportPath = std::string(dir) + "/subscriptions.opml";
    g_free(dir);

    AppState state;
    Controller controller(state, db, refresher, loader, settings);
    controller.loadFromStorage();

    {
        CursesScreen screen;
        CursesInput input;
        CursesView view;
        EventLoop loop(state, controller, *channel, input, view);
        loop.run();
    }

    // Workers still running hold their own references to the channel and
    // collaborators; their results are refused from here on.
    channel->close();
    int stillRunning = fetchPool.running() + contentPool.running();
    fetchPool.shutdown(false);
    contentPool.shutdown(false);
    if (stillRunning == 0) HttpClient::globalCleanup();
    g_message("Shut down with %d tasks still running", stillRunning);
    return 0;
}

} // namespace NewsDeck
