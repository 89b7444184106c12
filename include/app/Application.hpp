#pragma once

#include <memory>
#include <string>

namespace NewsDeck {

class Config;
class Database;

class Application {
public:
    Application();
    ~Application();

    // Process exit code: 0 on a clean quit, 1 when startup fails.
    int run(int argc, char* argv[]);

private:
    struct Options {
        std::string importPath;
        std::string exportPath;
        std::string configPath;
        bool resetDb = false;
        bool verbose = false;
    };

    bool parseOptions(int argc, char* argv[], Options& options);
    int runInteractive(Config& config, Database& db);

    Options options_;
    std::unique_ptr<Config> ownedConfig_;
};

} // namespace NewsDeck
