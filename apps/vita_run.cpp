// vita_run: drive the organism for a number of ticks with a random
// environment and print the final vitals and memory status.
//
//   vita_run [--config FILE] [--ticks N] [--seed S] [--events-per-tick K]
//            [--resume] [--load-hierarchy FILE] [--save-hierarchy FILE]
//
// --load-hierarchy restores semantic and procedural memory saved by an
// earlier --save-hierarchy; pair it with --resume for a full restart.

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "environment/event_generator.hpp"
#include "memory/hierarchy_manager.hpp"
#include "memory/hierarchy_serializer.hpp"
#include "meaning/meaning_engine.hpp"
#include "runtime/snapshot_manager.hpp"
#include "runtime/snapshot_store.hpp"
#include "runtime/structured_log.hpp"
#include "runtime/tick_engine.hpp"
#include "state/event_queue.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct Options {
    std::string config_path;
    uint64_t ticks = 100;
    uint32_t seed = 42;
    size_t events_per_tick = 1;
    bool resume = false;
    std::string load_hierarchy_path;
    std::string hierarchy_path;
};

void usage() {
    std::cerr << "usage: vita_run [--config FILE] [--ticks N] [--seed S] "
                 "[--events-per-tick K] [--resume]\n"
                 "                [--load-hierarchy FILE] [--save-hierarchy FILE]\n";
}

Options parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw vita::InvalidArgumentError("missing value for " + arg);
            return argv[++i];
        };
        if (arg == "--config") {
            opts.config_path = next();
        } else if (arg == "--ticks") {
            opts.ticks = std::stoull(next());
        } else if (arg == "--seed") {
            opts.seed = static_cast<uint32_t>(std::stoul(next()));
        } else if (arg == "--events-per-tick") {
            opts.events_per_tick = std::stoul(next());
        } else if (arg == "--resume") {
            opts.resume = true;
        } else if (arg == "--load-hierarchy") {
            opts.load_hierarchy_path = next();
        } else if (arg == "--save-hierarchy") {
            opts.hierarchy_path = next();
        } else {
            throw vita::InvalidArgumentError("unknown argument: " + arg);
        }
    }
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    vita::VitaConfig config;
    try {
        opts = parseArgs(argc, argv);
        if (!opts.config_path.empty()) config = vita::loadConfig(opts.config_path);
        vita::logging::init(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "vita_run: " << e.what() << "\n";
        usage();
        return 2;
    }

    try {
        auto log = std::make_shared<vita::StructuredLog>(config.logging);
        auto queue = std::make_shared<vita::EventQueue>(config.runtime.event_queue_capacity);
        auto store = std::make_shared<vita::FileSnapshotStore>(config.runtime.snapshot_dir);
        auto snapshots = std::make_shared<vita::SnapshotManager>(
            store, config.runtime.snapshot_period_ticks,
            config.runtime.snapshot_queue_capacity, log);
        auto memory = std::make_shared<vita::MemoryHierarchyManager>(config, vita::defaultClock(), log);

        vita::TickEngine engine(config, queue, std::make_shared<vita::DefaultMeaningEngine>(),
                                memory, snapshots, log, vita::defaultClock(), opts.seed);

        if (opts.resume && store->latestTick()) {
            engine.restoreState(store->loadLatestSnapshot());
            spdlog::info("resumed from tick {}", engine.snapshot().ticks);
        }
        if (!opts.load_hierarchy_path.empty()) {
            vita::HierarchySerializer::loadFromFile(*memory, opts.load_hierarchy_path);
            spdlog::info("loaded hierarchy from {}", opts.load_hierarchy_path);
        }

        vita::EventGenerator generator(opts.seed);
        for (uint64_t t = 0; t < opts.ticks; t++) {
            for (const auto& event : generator.generateBatch(opts.events_per_tick)) {
                queue->push(event);
            }
            engine.runTick();
            if (!engine.snapshot().isAlive()) {
                spdlog::warn("organism died at tick {}", engine.snapshot().ticks);
                break;
            }
        }

        snapshots->flush();
        if (!opts.hierarchy_path.empty()) {
            vita::HierarchySerializer::saveToFile(*memory, opts.hierarchy_path);
        }

        vita::SelfState final_state = engine.snapshot();
        nlohmann::json report = {
            {"ticks", final_state.ticks},
            {"energy", final_state.energy},
            {"stability", final_state.stability},
            {"integrity", final_state.integrity},
            {"episodic_entries", final_state.memory.count()},
            {"pending_actions", final_state.pending_actions},
            {"tick_errors", engine.tickErrors()},
            {"smoothed_intensity", engine.smoothedIntensity()},
            {"last_snapshot", snapshots->lastOperationStatus().message},
            {"hierarchy", memory->hierarchyStatus()},
        };
        std::cout << report.dump(2) << std::endl;
    } catch (const std::exception& e) {
        spdlog::critical("vita_run failed: {}", e.what());
        return 1;
    }
    return 0;
}
