// src/ship/rudder_subsystem.cpp
#include "ship/rudder_subsystem.hpp"
#include "geom/polygon.hpp"
#include "utils/logging.hpp"

namespace ship {

RudderSubsystem::RudderSubsystem(std::string name)
    : ShipSubsystem(std::move(name))
{
}

void RudderSubsystem::initialize(ShipState& s) {
    (void)s;
    heading_deg_ = 0.0;
    LOG_INFO("[%s] Initializing: step=%.1f deg per order", name().c_str(), kTurnStepDeg);
}

void RudderSubsystem::reset(ShipState& s) {
    (void)s;
    LOG_INFO("[%s] Resetting ordered heading", name().c_str());
    heading_deg_ = 0.0;
}

void RudderSubsystem::step(ShipState& s, double dt) {
    // Orders are applied when received; nothing to integrate
    (void)s; (void)dt;
}

std::vector<sim::CommandType> RudderSubsystem::declared_commands() const {
    return {sim::CommandType::TurnRight, sim::CommandType::TurnLeft};
}

void RudderSubsystem::handle_command(const sim::Command& cmd, ShipState& s) {
    (void)s;
    switch (cmd.type) {
        case sim::CommandType::TurnRight:
            turn(+kTurnStepDeg);
            break;
        case sim::CommandType::TurnLeft:
            turn(-kTurnStepDeg);
            break;
        default:
            reject(cmd);
    }
}

void RudderSubsystem::turn(double delta_deg) {
    heading_deg_ = geom::normalize_deg(heading_deg_ + delta_deg);
    LOG_DEBUG("[%s] Ordered heading: %.1f deg", name().c_str(), heading_deg_);
}

void RudderSubsystem::accept_fields(FieldVisitor& visitor) const {
    visitor.visit("heading_deg", heading_deg_);
}

bool RudderSubsystem::set_field(const std::string& field, const FieldValue& value) {
    if (field == "heading_deg") {
        heading_deg_ = geom::normalize_deg(as_double(value, field));
        return true;
    }
    return false;
}

} // namespace ship
