#include "kernel/Engine.h"
#include "domain/FrostDomain.h"
#include "io/Snapshot.h"
#include "kernel/Queries.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <memory>
#include <stdexcept>

static void printHelp() {
    std::cerr << "World Commands:\n"
              << "  step N             # advance N ticks\n"
              << "  run                # run until the tick, epoch or entity limit\n"
              << "  state              # print JSON snapshot\n"
              << "  metrics            # print current metrics\n"
              << "  history [N]        # print the last N history events (default 10)\n"
              << "  entity ID          # show one entity and its relationships\n"
              << "  pressures          # show pressure values\n"
              << "  validate           # run structural validation\n"
              << "  reset              # restore the seed world\n"
              << "  quit               # exit\n"
              << "\nOptions: --seed=N --ticks=N --target=N --log=FILE --verbose --help\n"
              << "Environment: WORLD_SEED and WORLD_MAX_TICKS override the defaults\n";
}

static void printEntity(const WorldEngine& engine, const std::string& id) {
    const WorldGraph& graph = engine.graph();
    const Entity* e = graph.getEntity(id);
    if (!e) {
        std::cout << "No entity '" << id << "'\n";
        return;
    }
    std::cout << e->name << " [" << e->id << "]\n"
              << "  " << e->kind << "/" << e->subtype << ", " << e->status
              << ", " << prominenceName(e->prominence) << "\n";
    if (!e->description.empty()) {
        std::cout << "  " << e->description << "\n";
    }
    if (!e->tags.empty()) {
        std::cout << "  tags:";
        for (const auto& [key, value] : e->tags.entries()) {
            std::cout << " " << key << "=" << formatTagValue(value);
        }
        std::cout << "\n";
    }
    for (const Relationship* rel : graph.getEntityRelationships(id, Direction::Both)) {
        const bool outgoing = rel->src == id;
        const Entity* other = graph.getEntity(outgoing ? rel->dst : rel->src);
        std::cout << "  " << (outgoing ? "-> " : "<- ") << rel->kind << " "
                  << (other ? other->name : std::string("<missing>"))
                  << std::fixed << std::setprecision(2) << " (" << rel->strength
                  << (rel->status == RelationshipStatus::Historical ? ", historical" : "") << ")\n";
    }
}

static void printMetrics(const WorldEngine& engine) {
    const auto m = engine.computeMetrics();
    std::cout << "Tick: " << m.tick << " (epoch " << m.epoch << ", " << m.era << ")\n"
              << "Entities: " << m.entities << "\n";
    for (const auto& [kind, count] : m.entitiesByKind) {
        std::cout << "  " << kind << ": " << count << "\n";
    }
    std::cout << "Relationships: " << m.relationships << " (" << m.historicalRelationships << " historical)\n"
              << "Avg growth: " << std::fixed << std::setprecision(2) << m.averageGrowth << "/tick\n";
}

int main(int argc, char** argv) {
    EngineConfig cfg;
    std::string logPath;
    const char* scriptArg = nullptr;

    try {
        if (const char* envSeed = std::getenv("WORLD_SEED")) {
            cfg.seed = std::stoull(envSeed);
        }
        if (const char* envTicks = std::getenv("WORLD_MAX_TICKS")) {
            cfg.maxTicks = std::stoull(envTicks);
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--seed=", 0) == 0) {
                cfg.seed = std::stoull(arg.substr(7));
            } else if (arg.rfind("--ticks=", 0) == 0) {
                cfg.maxTicks = std::stoull(arg.substr(8));
            } else if (arg.rfind("--target=", 0) == 0) {
                cfg.targetEntitiesPerKind = std::stod(arg.substr(9));
            } else if (arg.rfind("--log=", 0) == 0) {
                logPath = arg.substr(6);
            } else if (arg == "--verbose") {
                cfg.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Invalid numeric option: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<WorldEngine> engine;
    try {
        engine = std::make_unique<WorldEngine>(cfg, makeFrostWorld());
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    registerFrostSystems(*engine);
    registerFrostTemplates(*engine);

    std::ofstream logFile;
    if (!logPath.empty()) {
        logFile.open(logPath);
        if (!logFile.is_open()) {
            std::cerr << "Error: Could not open log file '" << logPath << "'\n";
            return 1;
        }
        logMetricsHeader(*engine, logFile);
    }

    // Check if there's a script file argument
    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        // Interactive mode
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    auto tick = [&]() {
        engine->step();
        if (logFile.is_open()) logMetrics(*engine, logFile);
    };

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) continue;
        if (cfg.verbose) {
            std::cerr << "[DEBUG] Command: '" << cmd << "'\n";
        }

        try {
            if (cmd == "step") {
                int n = 1;
                iss >> n;
                if (n < 1) n = 1;
                for (int i = 0; i < n; ++i) {
                    tick();
                }
                std::cout << worldToJson(*engine) << "\n";
                std::cout.flush();

            } else if (cmd == "run") {
                while (engine->shouldContinue()) {
                    tick();
                    if (engine->graph().tick() % 50 == 0) {
                        std::cerr << "Tick " << engine->graph().tick() << "\r";
                        std::cerr.flush();
                    }
                }
                std::cerr << "\n";
                std::cout << worldToJson(*engine) << "\n";
                std::cout << formatReport(engine->validate());
                std::cout.flush();

            } else if (cmd == "state") {
                std::cout << worldToJson(*engine) << "\n";
                std::cout.flush();

            } else if (cmd == "metrics") {
                printMetrics(*engine);
                std::cout.flush();

            } else if (cmd == "history") {
                std::size_t n = 10;
                iss >> n;
                for (const HistoryEvent* e : engine->eventLog().recent(n)) {
                    std::cout << "[" << std::setw(4) << e->tick << "] " << std::setw(10)
                              << historyEventTypeName(e->type) << "  " << e->description << "\n";
                }
                std::cout.flush();

            } else if (cmd == "entity") {
                std::string id;
                iss >> id;
                printEntity(*engine, id);
                std::cout.flush();

            } else if (cmd == "pressures") {
                for (const auto& [id, value] : engine->graph().pressures().values()) {
                    std::cout << std::setw(20) << id << "  " << std::fixed << std::setprecision(1) << value << "\n";
                }
                std::cout.flush();

            } else if (cmd == "validate") {
                std::cout << formatReport(engine->validate());
                std::cout.flush();

            } else if (cmd == "reset") {
                engine->reset();
                std::cout << worldToJson(*engine) << "\n";
                std::cout.flush();

            } else if (cmd == "quit" || cmd == "exit") {
                break;

            } else if (cmd == "help") {
                printHelp();

            } else {
                std::cerr << "Unknown command: " << cmd << " (try 'help')\n";
            }
        } catch (const ConfigurationError& e) {
            std::cerr << "[ERROR] Configuration error: " << e.what() << "\n";
            return 2;
        }
    }

    return 0;
}
