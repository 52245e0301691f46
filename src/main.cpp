#include <iostream>
#include <atomic>
#include <csignal>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "SimulatorEngine.hpp"
#include "SimulationConfigJson.hpp"
#include "db/Database.hpp"

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }

    constexpr uint64_t kDefaultTicks = 3600;
    constexpr uint64_t kStatusInterval = 600;
    // Pacing used when running until interrupted
    constexpr std::chrono::milliseconds kRealtimeTick{16};

    bool readFile(const std::string &path, std::string &content)
    {
        std::ifstream in(path);
        if (!in.good())
        {
            return false;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        content = buffer.str();
        return true;
    }

    bool parseTicks(const std::string &text, uint64_t &ticks)
    {
        try
        {
            size_t consumed = 0;
            const unsigned long long value = std::stoull(text, &consumed);
            if (consumed != text.size())
            {
                return false;
            }
            ticks = value;
            return true;
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    void printErrors(const std::vector<std::string> &errors)
    {
        for (const auto &error : errors)
        {
            std::cerr << "  - " << error << std::endl;
        }
    }

    void printStatus(const junction::SimulatorEngine &engine)
    {
        const junction::SimulatorMetrics metrics = engine.getMetrics();
        size_t waiting = 0;
        for (size_t count : metrics.waiting)
        {
            waiting += count;
        }

        std::cout << "[tick " << metrics.ticks << "] active=" << metrics.vehicles_active
                  << " finished=" << metrics.vehicles_finished
                  << " waiting=" << waiting
                  << " backlog=" << metrics.backlog
                  << " overlapping=" << metrics.overlapping_vehicles << std::endl;
    }

    void printSummary(const junction::SimulatorEngine &engine)
    {
        const junction::SimulatorMetrics metrics = engine.getMetrics();
        std::cout << std::endl;
        std::cout << "Ticks simulated:    " << metrics.ticks << std::endl;
        std::cout << "Vehicles generated: " << metrics.vehicles_generated << std::endl;
        std::cout << "Vehicles spawned:   " << metrics.vehicles_spawned << std::endl;
        std::cout << "Vehicles finished:  " << metrics.vehicles_finished << std::endl;
        std::cout << "Vehicles active:    " << metrics.vehicles_active << std::endl;
        std::cout << "Backlog:            " << metrics.backlog << std::endl;
        std::cout << "Safety violations:  " << metrics.safety_violations << std::endl;
    }
}

int main(int argc, char **argv)
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "=== Junction Traffic Simulator ===" << std::endl;
    std::cout << std::endl;

    if (argc > 3)
    {
        std::cerr << "Usage: " << argv[0] << " [config.json] [ticks]" << std::endl;
        return 2;
    }

    uint64_t ticks = kDefaultTicks;
    if (argc > 2 && !parseTicks(argv[2], ticks))
    {
        std::cerr << "Invalid tick count: " << argv[2] << std::endl;
        return 2;
    }

    junction::db::Database database("junction.db");
    std::string db_error;
    if (!database.initialize(&db_error))
    {
        std::cerr << "Warning: failed to initialize config database: " << db_error << std::endl;
    }

    junction::JunctionConfig config = junction::makeDefaultJunctionConfig();
    db_error.clear();
    if (auto stored = database.loadActiveConfigJson(&db_error); stored.has_value())
    {
        junction::ConfigParseResult parsed = junction::junctionConfigFromJson(*stored);
        if (parsed.ok)
        {
            config = parsed.config;
        }
        else
        {
            std::cerr << "Warning: stored config is invalid, using defaults" << std::endl;
            printErrors(parsed.errors);
        }
    }
    else if (!db_error.empty())
    {
        std::cerr << "Warning: failed to load config from database: " << db_error << std::endl;
    }
    else if (!database.saveActiveConfigJson(junction::junctionConfigToJson(config), &db_error))
    {
        std::cerr << "Warning: failed to store default config: " << db_error << std::endl;
    }

    if (argc > 1)
    {
        std::string content;
        if (!readFile(argv[1], content))
        {
            std::cerr << "Failed to read config file: " << argv[1] << std::endl;
            return 1;
        }

        junction::ConfigParseResult parsed = junction::junctionConfigFromJson(content);
        if (!parsed.ok)
        {
            std::cerr << "Config file rejected: " << argv[1] << std::endl;
            printErrors(parsed.errors);
            return 1;
        }

        config = parsed.config;
        db_error.clear();
        if (!database.saveActiveConfigJson(junction::junctionConfigToJson(config), &db_error))
        {
            std::cerr << "Warning: failed to store config: " << db_error << std::endl;
        }
        std::cout << "Loaded config from " << argv[1] << std::endl;
    }

    junction::SimulatorEngine engine(config);
    engine.handleCommand(junction::SimulatorEngine::UICommand::Start);

    if (ticks == 0)
    {
        std::cout << "Running until interrupted, press Ctrl+C to stop..." << std::endl;
    }
    else
    {
        std::cout << "Running " << ticks << " ticks..." << std::endl;
    }

    size_t reported_violations = 0;
    for (uint64_t i = 0; g_keep_running && (ticks == 0 || i < ticks); ++i)
    {
        engine.tick();

        const size_t violations = engine.getMetrics().safety_violations;
        if (violations != reported_violations)
        {
            std::cerr << "Warning: unsafe light state at tick " << i
                      << ", falling back to all-red control" << std::endl;
            reported_violations = violations;
        }

        if ((i + 1) % kStatusInterval == 0)
        {
            printStatus(engine);
        }

        if (ticks == 0)
        {
            std::this_thread::sleep_for(kRealtimeTick);
        }
    }

    engine.handleCommand(junction::SimulatorEngine::UICommand::Stop);
    printSummary(engine);
    return reported_violations == 0 ? 0 : 3;
}
