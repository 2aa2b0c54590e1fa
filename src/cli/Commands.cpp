#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "project/Artifact.hpp"
#include "project/Entry.hpp"
#include "project/Project.hpp"
#include "project/errors.hpp"
#include "render/Renderer.hpp"
#include "services/Watcher.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <thread>

using namespace pith::cli;
using namespace pith::config;
using namespace pith::log;
using namespace pith::project;
using namespace pith::services;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<Project> openProject(const Args& args) {
    auto project = std::make_shared<Project>(args.source, args.output, args.attributes);
    project->setLogger(Registry::sync());
    return project;
}

}

int pith::cli::runBuild(const Args& args, std::ostream& out, std::ostream& err) {
    const auto project = openProject(args);
    project->build();

    size_t failed = 0;
    for (const auto& artifact : project->artifacts()) {
        if (!artifact->hasError()) continue;
        ++failed;
        err << fmt::format("FAILED {}: {}\n", artifact->path().generic_string(), *artifact->error());
    }

    const auto total = project->artifacts().size();
    Registry::build()->info("[build] {} artifacts written to {}, {} failed",
                            total - failed, project->outputRoot().string(), failed);
    out << fmt::format("Built {} of {} artifacts into {}\n", total - failed, total, project->outputRoot().string());

    return project->hasErrors() ? exit_code::BUILD_FAILED : exit_code::OK;
}

int pith::cli::runStatus(const Args& args, std::ostream& out, std::ostream&) {
    const auto project = openProject(args);
    project->sync();

    if (args.json) {
        out << nlohmann::json(*project).dump(2) << '\n';
        return exit_code::OK;
    }

    for (const auto& entry : project->entries()) {
        if (const auto& artifact = entry->artifact())
            out << fmt::format("{} -> {} [{}]\n", entry->path().generic_string(),
                               artifact->path().generic_string(), artifact->renderer().name());
        else out << fmt::format("{} (no output)\n", entry->path().generic_string());
    }
    return exit_code::OK;
}

int pith::cli::runWatch(const Args& args, const std::atomic<bool>& shouldExit) {
    const auto interval = args.interval.value_or(ConfigRegistry::get().watch.interval);
    Watcher watcher(openProject(args), interval);
    watcher.start();

    while (!shouldExit.load() && watcher.isRunning())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    watcher.stop();
    return exit_code::OK;
}

int pith::cli::dispatch(const int argc, char** argv, const std::atomic<bool>& shouldExit) {
    std::optional<Args> parsed;
    try {
        parsed.emplace(parseArgs(std::vector<std::string>(argv + 1, argv + argc)));
    } catch (const std::invalid_argument& e) {
        std::cerr << "pith: " << e.what() << "\n\n" << usage();
        return exit_code::USAGE;
    } catch (const YAML::Exception& e) {
        std::cerr << "pith: bad option value: " << e.what() << "\n\n" << usage();
        return exit_code::USAGE;
    }

    const auto& args = *parsed;

    if (args.help) {
        std::cout << usage();
        return exit_code::OK;
    }

    if (!fs::is_directory(args.source)) {
        std::cerr << "pith: source root is not a directory: " << args.source.string() << '\n';
        return exit_code::USAGE;
    }

    if (args.config && !fs::is_regular_file(*args.config)) {
        std::cerr << "pith: config file not found: " << args.config->string() << '\n';
        return exit_code::USAGE;
    }

    try {
        ConfigRegistry::init(args.config);
        Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "pith: failed to load configuration: " << e.what() << '\n';
        return exit_code::CONFIG_ERROR;
    }

    try {
        if (args.command == "build") return runBuild(args, std::cout, std::cerr);
        if (args.command == "status") return runStatus(args, std::cout, std::cerr);
        return runWatch(args, shouldExit);
    } catch (const ConfigurationError& e) {
        Registry::pith()->error("[pith] Configuration error: {}", e.what());
        return exit_code::CONFIG_ERROR;
    } catch (const fs::filesystem_error& e) {
        Registry::pith()->error("[pith] Filesystem error: {}", e.what());
        return exit_code::IO_ERROR;
    }
}
