// src/ship/weapons_subsystem.hpp
#pragma once

#include "ship/ship_subsystem.hpp"

namespace ship {

// FIRE has no modelled effect; salvos are counted for telemetry only.
class WeaponsSubsystem : public ShipSubsystem {
public:
    explicit WeaponsSubsystem(std::string name = "Weapons");

    void reset(ShipState& s) override;
    void step(ShipState& s, double dt) override;
    int priority() const override { return 200; }

    std::vector<sim::CommandType> declared_commands() const override;
    void handle_command(const sim::Command& cmd, ShipState& s) override;

    void accept_fields(FieldVisitor& visitor) const override;

    int shots_fired() const { return shots_fired_; }

private:
    int shots_fired_ = 0;
};

} // namespace ship
