// src/ship/subsystem_manager.cpp
#include "ship/subsystem_manager.hpp"
#include "ship/ship_errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace ship {

ShipSubsystem* SubsystemManager::register_subsystem(std::unique_ptr<ShipSubsystem> subsystem) {
    if (!subsystem) {
        LOG_WARN("[SubsystemManager] Attempted to register null subsystem");
        return nullptr;
    }

    if (find_subsystem(subsystem->name())) {
        throw DuplicateSubsystemError(
            "Could not register '" + subsystem->name() + "': name already in use");
    }

    LOG_INFO("[SubsystemManager] Registering subsystem: %s (priority %d)",
             subsystem->name().c_str(), subsystem->priority());

    ShipSubsystem* raw = subsystem.get();
    subsystems_.push_back(std::move(subsystem));

    // Sort after each registration to maintain priority order
    sort_by_priority();
    return raw;
}

void SubsystemManager::initialize_all(ShipState& s) {
    LOG_INFO("[SubsystemManager] Initializing %zu subsystems", subsystems_.size());

    for (auto& subsystem : subsystems_) {
        if (subsystem->enabled()) {
            LOG_DEBUG("[SubsystemManager] Initializing: %s", subsystem->name().c_str());
            subsystem->initialize(s);
        }
    }
}

void SubsystemManager::reset_all(ShipState& s) {
    LOG_INFO("[SubsystemManager] Resetting %zu subsystems", subsystems_.size());

    for (auto& subsystem : subsystems_) {
        if (subsystem->enabled()) {
            LOG_DEBUG("[SubsystemManager] Resetting: %s", subsystem->name().c_str());
            subsystem->reset(s);
        }
    }
}

void SubsystemManager::step_all(ShipState& s, double dt) {
    for (auto& subsystem : subsystems_) {
        if (subsystem->enabled()) {
            subsystem->step(s, dt);
        }
    }
}

ShipSubsystem* SubsystemManager::find_subsystem(const std::string& name) {
    for (auto& subsystem : subsystems_) {
        if (subsystem->name() == name) {
            return subsystem.get();
        }
    }
    return nullptr;
}

const ShipSubsystem* SubsystemManager::find_subsystem(const std::string& name) const {
    for (const auto& subsystem : subsystems_) {
        if (subsystem->name() == name) {
            return subsystem.get();
        }
    }
    return nullptr;
}

ShipSubsystem* SubsystemManager::get_subsystem(size_t index) {
    if (index >= subsystems_.size()) {
        return nullptr;
    }
    return subsystems_[index].get();
}

const ShipSubsystem* SubsystemManager::get_subsystem(size_t index) const {
    if (index >= subsystems_.size()) {
        return nullptr;
    }
    return subsystems_[index].get();
}

size_t SubsystemManager::enabled_count() const {
    size_t count = 0;
    for (const auto& subsystem : subsystems_) {
        if (subsystem->enabled()) {
            ++count;
        }
    }
    return count;
}

void SubsystemManager::sort_by_priority() {
    std::stable_sort(subsystems_.begin(), subsystems_.end(),
                     [](const std::unique_ptr<ShipSubsystem>& a,
                        const std::unique_ptr<ShipSubsystem>& b) {
                         return a->priority() < b->priority();
                     });

    LOG_DEBUG("[SubsystemManager] Execution order:");
    for (size_t i = 0; i < subsystems_.size(); ++i) {
        LOG_DEBUG("  %zu. %s (priority %d)",
                  i + 1, subsystems_[i]->name().c_str(), subsystems_[i]->priority());
    }
}

} // namespace ship
