// src/ship/engine_subsystem.cpp
#include "ship/engine_subsystem.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace ship {

EngineSubsystem::EngineSubsystem(const EngineParams& params, std::string name)
    : ShipSubsystem(std::move(name)),
      params_(params)
{
    validate(params_);
}

void EngineSubsystem::initialize(ShipState& s) {
    LOG_INFO("[%s] Initializing: speed range=[%.1f, %.1f] m/s, accel=%.2f m/s^2",
             name().c_str(), params_.min_speed_mps, params_.max_speed_mps,
             params_.acceleration_mps2);
    (void)s;
}

void EngineSubsystem::reset(ShipState& s) {
    LOG_INFO("[%s] Resetting to zero speed", name().c_str());

    s.current_speed_mps = 0.0;
    s.desired_speed_mps = 0.0;
    rejected_orders_ = 0;
}

void EngineSubsystem::step(ShipState& s, double dt) {
    if (s.collision_event) {
        if (s.current_speed_mps != 0.0) {
            LOG_WARN("[%s] Collision: all stop (was %.2f m/s)", name().c_str(), s.current_speed_mps);
        }
        s.current_speed_mps = 0.0;
        return;
    }

    if (dt <= 0.0) return;

    const double max_change = params_.acceleration_mps2 * dt;
    const double delta = s.desired_speed_mps - s.current_speed_mps;
    s.current_speed_mps += std::clamp(delta, -max_change, +max_change);

    LOG_TRACE("[%s] v=%.2f m/s (desired %.2f)", name().c_str(),
              s.current_speed_mps, s.desired_speed_mps);
}

std::vector<sim::CommandType> EngineSubsystem::declared_commands() const {
    return {sim::CommandType::SetSpeed};
}

void EngineSubsystem::handle_command(const sim::Command& cmd, ShipState& s) {
    if (cmd.type != sim::CommandType::SetSpeed) {
        reject(cmd);
    }

    const double v = cmd.a;
    if (!(v >= params_.min_speed_mps && v <= params_.max_speed_mps)) {
        ++rejected_orders_;
        LOG_WARN("[%s] SET_SPEED(%.2f) ignored: outside [%.1f, %.1f] m/s",
                 name().c_str(), v, params_.min_speed_mps, params_.max_speed_mps);
        return;
    }

    s.desired_speed_mps = v;
    LOG_INFO("[%s] Desired speed: %.2f m/s", name().c_str(), v);
}

void EngineSubsystem::accept_fields(FieldVisitor& visitor) const {
    visitor.visit("min_speed", params_.min_speed_mps);
    visitor.visit("max_speed", params_.max_speed_mps);
    visitor.visit("acceleration", params_.acceleration_mps2);
    visitor.visit("rejected_orders", rejected_orders_);
}

bool EngineSubsystem::set_field(const std::string& field, const FieldValue& value) {
    EngineParams p = params_;
    if (field == "min_speed") {
        p.min_speed_mps = as_double(value, field);
    } else if (field == "max_speed") {
        p.max_speed_mps = as_double(value, field);
    } else if (field == "acceleration") {
        p.acceleration_mps2 = as_double(value, field);
    } else {
        return false;
    }

    set_params(p);
    return true;
}

void EngineSubsystem::set_params(const EngineParams& params) {
    validate(params);
    params_ = params;
}

void EngineSubsystem::validate(const EngineParams& params) {
    if (params.min_speed_mps < 0.0) {
        throw std::invalid_argument("Invalid min_speed_mps: must be >= 0");
    }
    if (params.max_speed_mps < params.min_speed_mps) {
        throw std::invalid_argument("Invalid speed range: max_speed_mps < min_speed_mps");
    }
    if (params.acceleration_mps2 <= 0.0) {
        throw std::invalid_argument("Invalid acceleration_mps2: must be > 0");
    }
}

} // namespace ship
