#include "dsync/sync/diff.hpp"

namespace dsync::sync {
namespace {

SyncAction make_action(ActionKind kind,
                       const std::string& name,
                       const FileState* current,
                       const FileState* previous) {
    SyncAction action;
    action.kind = kind;
    action.name = name;
    if (current != nullptr) {
        action.current = *current;
    }
    if (previous != nullptr) {
        action.previous = *previous;
    }
    return action;
}

} // namespace

SyncPlan plan_actions(const Snapshot& cache, const Snapshot& current) {
    SyncPlan plan;

    auto cached_it = cache.begin();
    auto current_it = current.begin();

    while (cached_it != cache.end() || current_it != current.end()) {
        if (cached_it == cache.end() ||
            (current_it != current.end() && current_it->first < cached_it->first)) {
            plan.actions.push_back(make_action(ActionKind::Upload, current_it->first,
                                               &current_it->second, nullptr));
            ++current_it;
            continue;
        }

        if (current_it == current.end() || cached_it->first < current_it->first) {
            plan.actions.push_back(make_action(ActionKind::Delete, cached_it->first,
                                               nullptr, &cached_it->second));
            ++cached_it;
            continue;
        }

        if (current_it->second.same_content(cached_it->second)) {
            ++plan.unchanged;
        } else {
            plan.actions.push_back(make_action(ActionKind::Overwrite, current_it->first,
                                               &current_it->second, &cached_it->second));
        }
        ++cached_it;
        ++current_it;
    }

    return plan;
}

} // namespace dsync::sync
