// src/ship/ship_subsystem.cpp
#include "ship/ship_subsystem.hpp"
#include "ship/ship_errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace ship {

bool ShipSubsystem::declares(sim::CommandType type) const {
    const auto cmds = declared_commands();
    return std::find(cmds.begin(), cmds.end(), type) != cmds.end();
}

void ShipSubsystem::handle_command(const sim::Command& cmd, ShipState& s) {
    (void)s;
    reject(cmd);
}

void ShipSubsystem::reject(const sim::Command& cmd) const {
    throw UnrecognizedCommandError(
        "[" + name_ + "] Unrecognized command: " + sim::to_token(cmd.type));
}

double ShipSubsystem::as_double(const FieldValue& value, const std::string& field) {
    if (const double* d = std::get_if<double>(&value)) {
        return *d;
    }
    throw std::invalid_argument("Field '" + field + "' expects a number");
}

std::optional<FieldValue> ShipSubsystem::get_field(const std::string& field) const {
    std::optional<FieldValue> found;
    FieldVisitor visitor([&](const char* name, const FieldValue& value) {
        if (!found && field == name) {
            found = value;
        }
    });
    accept_fields(visitor);
    return found;
}

FieldList ShipSubsystem::fields() const {
    FieldList out;
    FieldVisitor visitor([&](const char* name, const FieldValue& value) {
        out.emplace_back(name, value);
    });
    accept_fields(visitor);
    return out;
}

} // namespace ship
