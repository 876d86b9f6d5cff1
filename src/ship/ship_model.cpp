// src/ship/ship_model.cpp
#include "ship/ship_model.hpp"
#include "ship/navigation_subsystem.hpp"
#include "ship/rudder_subsystem.hpp"
#include "ship/ship_errors.hpp"
#include "ship/weapons_subsystem.hpp"
#include "utils/logging.hpp"

#include <optional>
#include <stdexcept>

namespace ship {

namespace {

bool require_bool(const FieldValue& value, const std::string& key) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b;
    }
    throw std::invalid_argument("Attribute '" + key + "' expects a boolean");
}

double require_double(const FieldValue& value, const std::string& key) {
    if (const double* d = std::get_if<double>(&value)) {
        return *d;
    }
    throw std::invalid_argument("Attribute '" + key + "' expects a number");
}

} // namespace

geom::Polygon default_hull(double width_m, double length_m) {
    const double w = width_m;
    const double l = length_m;

    // Bow point, shoulders, full beam, stern taper (clockwise from the bow)
    geom::Polygon outline = {
        {w * 0.5, l},
        {w * 0.8, l * 0.87},
        {w,       l * 0.375},
        {w * 0.9, l * 0.15},
        {w * 0.8, 0.0},
        {w * 0.2, 0.0},
        {w * 0.1, l * 0.15},
        {0.0,     l * 0.375},
        {w * 0.2, l * 0.87},
    };
    return geom::transform(outline, -w / 2.0, -l / 2.0);
}

ShipModel::ShipModel(ShipParams p)
    : p_(std::move(p))
{
    geom::validate_polygon(p_.hull, "hull");

    // Ship origin is the hull centroid
    const geom::Point2D c = geom::centroid(p_.hull);
    hull_ = geom::transform(p_.hull, -c.x, -c.y);
    margin_ = geom::build_safety_margin(hull_, p_.safety_clearance_m);

    p_.heading_deg = geom::normalize_deg(p_.heading_deg);
    state_ = initial_state();
    update_world_geometry();

    LOG_INFO("[ShipModel] '%s' at (%.1f, %.1f) heading %.1f deg, hull %zu vertices, margin %.0f m",
             p_.name.c_str(), p_.x_m, p_.y_m, p_.heading_deg, hull_.size(), p_.safety_clearance_m);
}

ShipState ShipModel::initial_state() const {
    ShipState s{};
    s.x_m = p_.x_m;
    s.y_m = p_.y_m;
    s.heading_deg = p_.heading_deg;
    return s;
}

// ============================================================================
// Assembly
// ============================================================================

ShipSubsystem& ShipModel::attach(std::unique_ptr<ShipSubsystem> subsystem) {
    if (!subsystem) {
        throw std::invalid_argument("Cannot attach a null subsystem to '" + p_.name + "'");
    }
    if (subsystems_.find_subsystem(subsystem->name())) {
        throw DuplicateSubsystemError("Subsystem '" + subsystem->name() +
                                      "' already attached to '" + p_.name + "'");
    }

    // Registry first: it is all-or-nothing, so a clash leaves the ship untouched
    registry_.attach(*subsystem);
    ShipSubsystem* sub = subsystems_.register_subsystem(std::move(subsystem));
    sub->initialize(state_);
    return *sub;
}

void attach_default_subsystems(ShipModel& ship, const EngineParams& engine) {
    ship.attach(std::make_unique<RudderSubsystem>());
    ship.attach(std::make_unique<EngineSubsystem>(engine));
    ship.attach(std::make_unique<NavigationSubsystem>());
    ship.attach(std::make_unique<WeaponsSubsystem>());

    LOG_INFO("[ShipModel] '%s' fitted with %zu subsystems, %zu commands",
             ship.name().c_str(),
             ship.subsystem_manager().subsystem_count(),
             ship.command_registry().command_count());
}

// ============================================================================
// Commands
// ============================================================================

bool ShipModel::dispatch(const sim::Command& cmd) {
    return registry_.dispatch(cmd, state_);
}

bool ShipModel::dispatch(const std::string& token, const std::vector<double>& args) {
    auto type = sim::parse_token(token);
    if (!type) {
        LOG_WARN("[ShipModel] Unknown command '%s'", token.c_str());
        return false;
    }

    auto cmd = sim::parse_command(token, args);
    if (!cmd) {
        LOG_WARN("[ShipModel] Command '%s' takes %zu argument(s), got %zu",
                 token.c_str(), sim::arg_count(*type), args.size());
        return false;
    }
    return dispatch(*cmd);
}

// ============================================================================
// Simulation
// ============================================================================

void ShipModel::step(double dt, const std::vector<geom::Polygon>& obstacles) {
    if (dt < 0.0) {
        LOG_WARN("[ShipModel] '%s': negative dt %.4f ignored", p_.name.c_str(), dt);
        return;
    }

    // 1-2. Geometry and collision flags at the pre-step pose
    update_world_geometry();
    update_collisions(obstacles);

    // 3. Subsystems (Rudder 50 -> Engine 100 -> Navigation 150 -> Weapons 200)
    subsystems_.step_all(state_, dt);

    // 4. Motion
    follow_path(dt);

    ++ticks_;
}

void ShipModel::update_world_geometry() {
    const auto pivot = geom::TransformOrigin::at(state_.position());
    world_hull_ = geom::transform(hull_, state_.x_m, state_.y_m, state_.heading_deg, 1.0, pivot);
    world_margin_ = geom::transform(margin_, state_.x_m, state_.y_m, state_.heading_deg, 1.0, pivot);
}

void ShipModel::update_collisions(const std::vector<geom::Polygon>& obstacles) {
    bool warning = false;
    bool event = false;

    for (const auto& obstacle : obstacles) {
        if (!warning && geom::intersects(world_margin_, obstacle)) {
            warning = true;
        }
        if (!event && geom::intersects(world_hull_, obstacle)) {
            event = true;
        }
        if (warning && event) {
            break;
        }
    }

    if (warning && !state_.collision_warning) {
        LOG_WARN("[ShipModel] '%s': obstacle inside safety margin at (%.1f, %.1f)",
                 p_.name.c_str(), state_.x_m, state_.y_m);
    }
    if (event && !state_.collision_event) {
        LOG_ERROR("[ShipModel] '%s': COLLISION at (%.1f, %.1f)",
                  p_.name.c_str(), state_.x_m, state_.y_m);
    }

    state_.collision_warning = warning;
    state_.collision_event = event;

    if (warning) ++warning_ticks_;
    if (event) ++collision_ticks_;
}

void ShipModel::follow_path(double dt) {
    if (state_.path.size() < 2) {
        state_.path.clear();
        return;
    }

    geom::PathStep st = geom::advance(state_.path, state_.current_speed_mps, dt);
    state_.x_m = st.position.x;
    state_.y_m = st.position.y;
    if (st.has_facing) {
        state_.heading_deg = st.facing_deg;
    }
    const bool arrived = st.arrived();
    state_.path = std::move(st.path);

    if (arrived) {
        LOG_INFO("[ShipModel] '%s' reached final waypoint (%.1f, %.1f)",
                 p_.name.c_str(), state_.x_m, state_.y_m);
    }
}

void ShipModel::reset() {
    state_ = initial_state();
    subsystems_.reset_all(state_);
    ticks_ = 0;
    warning_ticks_ = 0;
    collision_ticks_ = 0;
    update_world_geometry();

    LOG_INFO("[ShipModel] '%s' reset", p_.name.c_str());
}

// ============================================================================
// Attribute surface
// ============================================================================

FieldValue ShipModel::get_attribute(const std::string& key) const {
    auto sep = key.find(':');
    if (sep != std::string::npos) {
        const std::string sub_name = key.substr(0, sep);
        const std::string field = key.substr(sep + 1);

        const ShipSubsystem* sub = subsystems_.find_subsystem(sub_name);
        if (!sub) {
            throw UnknownFieldError("No subsystem '" + sub_name + "' on '" + p_.name + "'");
        }
        auto value = sub->get_field(field);
        if (!value) {
            throw UnknownFieldError("Subsystem '" + sub_name + "' has no field '" + field + "'");
        }
        return *value;
    }

    std::optional<FieldValue> found;
    FieldVisitor v([&](const char* name, const FieldValue& value) {
        if (!found && key == name) {
            found = value;
        }
    });
    state_.accept_fields(v);

    if (!found) {
        throw UnknownFieldError("Unknown attribute '" + key + "' on '" + p_.name + "'");
    }
    return *found;
}

void ShipModel::set_attribute(const std::string& key, const FieldValue& value) {
    auto sep = key.find(':');
    if (sep != std::string::npos) {
        const std::string sub_name = key.substr(0, sep);
        const std::string field = key.substr(sep + 1);

        ShipSubsystem* sub = subsystems_.find_subsystem(sub_name);
        if (!sub) {
            throw UnknownFieldError("No subsystem '" + sub_name + "' on '" + p_.name + "'");
        }
        if (!sub->set_field(field, value)) {
            throw UnknownFieldError("Field '" + key + "' is unknown or read-only");
        }
        return;
    }

    if (key == "x") {
        state_.x_m = require_double(value, key);
    } else if (key == "y") {
        state_.y_m = require_double(value, key);
    } else if (key == "heading_deg") {
        state_.heading_deg = geom::normalize_deg(require_double(value, key));
    } else if (key == "current_speed") {
        state_.current_speed_mps = require_double(value, key);
    } else if (key == "desired_speed") {
        state_.desired_speed_mps = require_double(value, key);
    } else if (key == "collision_warning") {
        state_.collision_warning = require_bool(value, key);
    } else if (key == "collision_event") {
        state_.collision_event = require_bool(value, key);
    } else {
        throw UnknownFieldError("Unknown attribute '" + key + "' on '" + p_.name + "'");
    }

    // Path head tracks the pose
    if ((key == "x" || key == "y") && !state_.path.empty()) {
        state_.path.front() = state_.position();
    }
}

FieldList ShipModel::telemetry() const {
    FieldList out;

    FieldVisitor ship_fields([&](const char* name, const FieldValue& value) {
        out.emplace_back(name, value);
    });
    state_.accept_fields(ship_fields);

    for (size_t i = 0; i < subsystems_.subsystem_count(); ++i) {
        const ShipSubsystem* sub = subsystems_.get_subsystem(i);
        const std::string prefix = sub->name() + ".";
        FieldVisitor sub_fields([&](const char* name, const FieldValue& value) {
            out.emplace_back(prefix + name, value);
        });
        sub->accept_fields(sub_fields);
    }

    return out;
}

} // namespace ship
