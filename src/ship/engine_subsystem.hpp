// src/ship/engine_subsystem.hpp
#pragma once

#include "ship/ship_subsystem.hpp"

namespace ship {

struct EngineParams {
    double min_speed_mps = 0.0;      // lowest accepted SET_SPEED
    double max_speed_mps = 15.0;     // highest accepted SET_SPEED
    double acceleration_mps2 = 1.0;  // speed ramp, both directions
};

/**
 * EngineSubsystem - Speed control
 *
 * Responsibilities:
 * - SET_SPEED(v): accept v in [min_speed, max_speed] as the desired speed;
 *   anything else is reported and ignored
 * - Ramp current_speed toward desired_speed by at most acceleration * dt
 * - Collision response: current_speed drops to 0 in the same tick a
 *   collision_event is seen (no deceleration ramp)
 *
 * Fields: min_speed, max_speed, acceleration (rw), rejected_orders (ro)
 */
class EngineSubsystem : public ShipSubsystem {
public:
    explicit EngineSubsystem(const EngineParams& params = {}, std::string name = "Engine");

    void initialize(ShipState& s) override;
    void reset(ShipState& s) override;
    void step(ShipState& s, double dt) override;
    int priority() const override { return 100; }

    std::vector<sim::CommandType> declared_commands() const override;
    void handle_command(const sim::Command& cmd, ShipState& s) override;

    void accept_fields(FieldVisitor& visitor) const override;
    bool set_field(const std::string& field, const FieldValue& value) override;

    const EngineParams& get_params() const { return params_; }

    /**
     * set_params() - Update speed bounds at runtime
     *
     * @throws std::invalid_argument on inconsistent bounds
     */
    void set_params(const EngineParams& params);

    int rejected_orders() const { return rejected_orders_; }

private:
    EngineParams params_;
    int rejected_orders_ = 0;

    static void validate(const EngineParams& params);
};

} // namespace ship
