// src/ship/rudder_subsystem.hpp
#pragma once

#include "ship/ship_subsystem.hpp"

namespace ship {

/**
 * RudderSubsystem - Manual steering orders
 *
 * TURN_LEFT / TURN_RIGHT shift the ordered heading by -/+ 5 deg. The ordered
 * heading is a separate representation from the path-driven pose heading and
 * is not applied to the pose.
 *
 * Fields: heading_deg (rw)
 */
class RudderSubsystem : public ShipSubsystem {
public:
    static constexpr double kTurnStepDeg = 5.0;

    explicit RudderSubsystem(std::string name = "Rudder");

    void initialize(ShipState& s) override;
    void reset(ShipState& s) override;
    void step(ShipState& s, double dt) override;
    int priority() const override { return 50; }

    std::vector<sim::CommandType> declared_commands() const override;
    void handle_command(const sim::Command& cmd, ShipState& s) override;

    void accept_fields(FieldVisitor& visitor) const override;
    bool set_field(const std::string& field, const FieldValue& value) override;

    double heading_deg() const { return heading_deg_; }

private:
    double heading_deg_ = 0.0;

    void turn(double delta_deg);
};

} // namespace ship
