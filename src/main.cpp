#include "config.hpp"
#include "errors.hpp"
#include "settings.hpp"
#include "verbose.hpp"
#include "watch_manager.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <cstdlib>
#include <csignal>
#include <thread>
#include <atomic>
#include <chrono>
#include <mutex>

using namespace stackwatch;

// ========== Signal Handling ==========

static std::atomic<bool> g_stop_requested{false};

// Handles SIGINT (Ctrl+C) and SIGTERM for graceful shutdown.
void signal_handler(int) {
    g_stop_requested.store(true);
}

// ========== Output ==========

// Prints the watch targets, one per line.
void print_targets(const WatchManager& manager) {
    for (const auto& target : manager.targets()) {
        std::cout << target.path.string()
                  << (target.recursive ? "  recursive" : "  single")
                  << (target.static_folder ? " static" : "")
                  << "  match=" << target.match_rule.pattern()
                  << std::endl;
    }
    for (const auto& skipped : manager.skipped_resources()) {
        std::cout << "skipped  " << skipped << std::endl;
    }
}

// Runs the user command. A failing command is reported, not fatal.
void run_exec(const std::string& command) {
    std::cerr << "[stackwatch] Running: " << command << std::endl;
    int status = std::system(command.c_str());
    if (status != 0) {
        std::cerr << "[stackwatch] Command exited with status " << status << std::endl;
    }
}

// ========== Main ==========

int main(int argc, char** argv) {
    CLI::App app{"Watches a serverless template and its code, reporting meaningful changes"};
    app.footer("\nExamples:\n"
               "  stackwatch                          Watch every resource in template.yaml\n"
               "  stackwatch -t infra/app.yaml -r Fn1 Watch one function\n"
               "  stackwatch -x 'make deploy'         Run a command after each change\n"
               "  stackwatch --list                   Print the watch targets and exit");

    Settings settings = load_settings(SETTINGS_FILE).value_or(Settings{});

    std::string template_file = settings.template_file.empty() ? DEFAULT_TEMPLATE_FILE : settings.template_file;
    app.add_option("-t,--template", template_file, "Template file to watch")
        ->check(CLI::ExistingFile);

    std::vector<std::string> resources;
    app.add_option("-r,--resource", resources,
        "Resource to watch, e.g. 'Fn1' or 'ChildStack/Fn1' (repeatable, default: all)");

    std::string exec = settings.exec;
    app.add_option("-x,--exec", exec, "Shell command to run after a change");

    bool verbose = settings.verbose;
    app.add_flag("-v,--verbose", verbose, "Show debug output for stack loading and events");

    bool list_only = false;
    app.add_flag("--list", list_only, "Print the watch targets and exit");

    bool save = false;
    app.add_flag("--save", save, std::string("Save these options to ") + SETTINGS_FILE);

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);

    if (resources.empty()) {
        resources = settings.resources;
    }

    if (save) {
        Settings updated{template_file, resources, exec, verbose};
        if (!save_settings(updated, SETTINGS_FILE)) {
            std::cerr << "Error: Cannot write " << SETTINGS_FILE << std::endl;
            return 1;
        }
    }

    std::mutex pending_mutex;
    bool change_pending = false;

    WatchManager manager(
        WatchOptions{template_file, resources},
        [&](const std::string& name, const std::optional<FileEvent>& event) {
            std::cout << "[Change] " << name;
            if (event) {
                std::cout << ": " << to_string(event->type) << " " << event->src_path;
            }
            std::cout << std::endl;

            std::lock_guard<std::mutex> lock(pending_mutex);
            change_pending = true;
        }
    );

    if (list_only) {
        try {
            manager.rebuild();
        } catch (const TemplateLoadError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        print_targets(manager);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        manager.start();
    } catch (const TemplateLoadError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Watching " << manager.watched_resources().size() << " resources in "
              << template_file << " (Ctrl+C to stop)" << std::endl;

    while (!g_stop_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        manager.poll();

        bool run = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex);
            run = change_pending;
            change_pending = false;
        }
        if (run && !exec.empty()) {
            run_exec(exec);
        }
    }

    manager.stop();
    std::cerr << "Stopped." << std::endl;
    return 0;
}
