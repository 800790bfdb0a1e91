#include "watch_manager.hpp"
#include "errors.hpp"
#include "resource_trigger.hpp"
#include "template_loader.hpp"
#include "trigger_factory.hpp"
#include "verbose.hpp"
#include <iostream>
#include <memory>

namespace stackwatch {

WatchManager::WatchManager(WatchOptions options, ChangeCallback on_change)
    : options_(std::move(options))
    , on_change_(std::move(on_change))
{
}

WatchManager::~WatchManager() {
    stop();
}

void WatchManager::rebuild() {
    std::vector<Stack> stacks = load_stacks(options_.template_file);

    std::vector<WatchTarget> targets;
    std::vector<std::string> watched;
    std::vector<std::string> skipped;

    // Every template in the nesting tree gets its own trigger.
    for (const auto& stack : stacks) {
        if (stack.location.empty()) {
            continue;
        }
        std::string location = stack.location;
        TemplateTrigger trigger(location, [this, location](const std::optional<FileEvent>& event) {
            template_changed_.store(true);
            if (on_change_) {
                on_change_(location, event);
            }
        });
        for (auto& target : trigger.resolve()) {
            targets.push_back(std::move(target));
        }
    }

    std::vector<ResourceIdentifier> ids;
    if (options_.resources.empty()) {
        for (const auto& id : list_resource_ids(stacks)) {
            const nlohmann::json* resource = get_resource_by_id(stacks, id, true);
            if (resource && TriggerFactory::kind_of(*resource) != TriggerKind::None) {
                ids.push_back(id);
            }
        }
    } else {
        ids.assign(options_.resources.begin(), options_.resources.end());
    }

    for (const auto& id : ids) {
        std::string name = id.to_string();
        try {
            auto trigger = TriggerFactory::create(id, stacks, [this, name](const std::optional<FileEvent>& event) {
                if (on_change_) {
                    on_change_(name, event);
                }
            });
            if (!trigger) {
                skipped.push_back(name + ": resource type has no files to watch");
                continue;
            }
            for (auto& target : trigger->resolve()) {
                targets.push_back(std::move(target));
            }
            watched.push_back(name);
        } catch (const TriggerError& e) {
            std::cerr << "[WatchManager] Skipping " << name << ": " << e.what() << std::endl;
            skipped.push_back(name + ": " + e.what());
        }
    }

    verbose_log("WatchManager", std::to_string(watched.size()) + " resources, " +
                std::to_string(targets.size()) + " targets");

    std::lock_guard<std::mutex> lock(state_mutex_);
    targets_ = std::move(targets);
    watched_ = std::move(watched);
    skipped_ = std::move(skipped);
}

void WatchManager::schedule_all() {
    observer_.unschedule_all();
    observer_.schedule(targets());
}

void WatchManager::start() {
    if (observer_.is_running()) {
        return;
    }
    rebuild();
    schedule_all();
    observer_.start();
}

void WatchManager::stop() {
    observer_.stop();
}

bool WatchManager::poll() {
    if (!template_changed_.exchange(false)) {
        return false;
    }

    try {
        rebuild();
    } catch (const TemplateLoadError& e) {
        std::cerr << "[WatchManager] Keeping previous watches: " << e.what() << std::endl;
        return false;
    }
    schedule_all();
    std::cerr << "[WatchManager] Template changed, watching "
              << watched_resources().size() << " resources" << std::endl;
    return true;
}

std::vector<WatchTarget> WatchManager::targets() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return targets_;
}

std::vector<std::string> WatchManager::watched_resources() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return watched_;
}

std::vector<std::string> WatchManager::skipped_resources() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return skipped_;
}

} // namespace stackwatch
