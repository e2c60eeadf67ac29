// File: src/cli/main.cpp
//
// pitchsim_cli [--config file.yaml] <corpus.db>

#include "cli/corpus_cli.hpp"
#include "config/engine_config.hpp"
#include "storage/sqlite_corpus_store.hpp"
#include <iostream>
#include <string>

using namespace pitchsim;

static void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config file.yaml] <corpus.db>\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string db_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (db_path.empty() && arg[0] != '-') {
            db_path = arg;
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (db_path.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    EngineConfig config = EngineConfig::Default();
    if (!config_path.empty()) {
        auto loaded = EngineConfig::LoadFromFile(config_path);
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    }

    try {
        SqliteCorpusStore::Config store_config;
        store_config.db_path = db_path;
        auto store = std::make_shared<SqliteCorpusStore>(store_config);

        std::cout << "Corpus: " << db_path << " (" << store->Count() << " sequences)\n";

        auto engine = std::make_shared<SimilarityEngine>(store, config);
        engine->StartWarmup();

        CorpusCli cli(engine, std::cout);
        cli.Run(std::cin);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
