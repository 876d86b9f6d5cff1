// src/ship/weapons_subsystem.cpp
#include "ship/weapons_subsystem.hpp"
#include "utils/logging.hpp"

namespace ship {

WeaponsSubsystem::WeaponsSubsystem(std::string name)
    : ShipSubsystem(std::move(name))
{
}

void WeaponsSubsystem::reset(ShipState& s) {
    (void)s;
    shots_fired_ = 0;
}

void WeaponsSubsystem::step(ShipState& s, double dt) {
    (void)s; (void)dt;
}

std::vector<sim::CommandType> WeaponsSubsystem::declared_commands() const {
    return {sim::CommandType::Fire};
}

void WeaponsSubsystem::handle_command(const sim::Command& cmd, ShipState& s) {
    if (cmd.type != sim::CommandType::Fire) {
        reject(cmd);
    }

    ++shots_fired_;
    LOG_INFO("[%s] Fire! (salvo %d at %.1f, %.1f)", name().c_str(), shots_fired_, s.x_m, s.y_m);
}

void WeaponsSubsystem::accept_fields(FieldVisitor& visitor) const {
    visitor.visit("shots_fired", shots_fired_);
}

} // namespace ship
