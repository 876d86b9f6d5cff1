// src/ship/navigation_subsystem.cpp
#include "ship/navigation_subsystem.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <cstdio>

namespace ship {

NavigationSubsystem::NavigationSubsystem(std::string name)
    : ShipSubsystem(std::move(name))
{
}

void NavigationSubsystem::initialize(ShipState& s) {
    LOG_INFO("[%s] Initializing with %zu pending waypoints", name().c_str(),
             s.path.empty() ? size_t{0} : s.path.size() - 1);
    rebuild_projection(s);
}

void NavigationSubsystem::reset(ShipState& s) {
    LOG_INFO("[%s] Clearing waypoints", name().c_str());
    s.path.clear();
    rebuild_projection(s);
}

void NavigationSubsystem::step(ShipState& s, double dt) {
    (void)dt;
    rebuild_projection(s);
}

std::vector<sim::CommandType> NavigationSubsystem::declared_commands() const {
    return {sim::CommandType::AddWaypoint};
}

void NavigationSubsystem::handle_command(const sim::Command& cmd, ShipState& s) {
    if (cmd.type != sim::CommandType::AddWaypoint) {
        reject(cmd);
    }

    if (!std::isfinite(cmd.a) || !std::isfinite(cmd.b)) {
        LOG_WARN("[%s] ADD_WAYPOINT(%.2f, %.2f) ignored: coordinates must be finite",
                 name().c_str(), cmd.a, cmd.b);
        return;
    }

    if (s.path.empty()) {
        s.path.push_back(s.position());
    }
    s.path.push_back({cmd.a, cmd.b});

    LOG_INFO("[%s] Waypoint added: (%.1f, %.1f), %zu pending",
             name().c_str(), cmd.a, cmd.b, s.path.size() - 1);
}

void NavigationSubsystem::accept_fields(FieldVisitor& visitor) const {
    visitor.visit("projected_path", format_path(projected_));
    visitor.visit("waypoint_count", projected_.empty() ? 0 : static_cast<int>(projected_.size() - 1));
}

void NavigationSubsystem::rebuild_projection(const ShipState& s) {
    projected_.clear();
    projected_.push_back(s.position());
    if (s.path.size() > 1) {
        projected_.insert(projected_.end(), s.path.begin() + 1, s.path.end());
    }
}

std::string NavigationSubsystem::format_path(const geom::Path& path) {
    std::string out;
    char buf[64];
    for (size_t i = 0; i < path.size(); ++i) {
        std::snprintf(buf, sizeof(buf), "%s(%.2f,%.2f)", i == 0 ? "" : " ", path[i].x, path[i].y);
        out += buf;
    }
    return out;
}

} // namespace ship
