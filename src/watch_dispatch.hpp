#pragma once

/**
 * Routing of filesystem events to watch targets.
 */

#include "watch_target.hpp"
#include <filesystem>

namespace stackwatch {

// Returns true if path equals base or lies beneath it.
bool is_within(const std::filesystem::path& path, const std::filesystem::path& base);

/**
 * Delivers an event to a watch target if it belongs to it.
 *
 * Creation or deletion of the target path itself goes to on_create or
 * on_delete. Any other event must be in scope (anywhere below a recursive
 * target, directly inside a non-recursive one) and pass the match rule to
 * reach on_event. Returns true if a callback was invoked.
 */
bool deliver_event(const WatchTarget& target, const FileEvent& event);

} // namespace stackwatch
