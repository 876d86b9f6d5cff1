// src/ship/field_visitor.hpp
#pragma once

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ship {

// Scalar exposed through the attribute surface and telemetry.
// Construct string values from std::string, never from a bare literal
// (a const char* would select bool).
using FieldValue = std::variant<bool, double, std::string>;

// Ordered (key, value) list; order is the enumeration order.
using FieldList = std::vector<std::pair<std::string, FieldValue>>;

// "true"/"false", %g-style numbers, strings verbatim
std::string format_value(const FieldValue& value);

/**
 * FieldVisitor - Type-erasing visitor over named fields
 *
 * ShipState and every ShipSubsystem enumerate their fields through this, so
 * telemetry, get-by-name and logging share one field table.
 *
 * Usage:
 *   FieldVisitor v([](const char* name, const FieldValue& value) {
 *       std::cout << name << " = " << format_value(value) << "\n";
 *   });
 *   state.accept_fields(v);
 */
class FieldVisitor {
public:
    using Callback = std::function<void(const char*, const FieldValue&)>;

    explicit FieldVisitor(Callback cb) : callback_(std::move(cb)) {}

    void visit(const char* name, double value) {
        callback_(name, FieldValue(value));
    }

    void visit(const char* name, int value) {
        callback_(name, FieldValue(static_cast<double>(value)));
    }

    void visit(const char* name, bool value) {
        callback_(name, FieldValue(value));
    }

    void visit(const char* name, const std::string& value) {
        callback_(name, FieldValue(value));
    }

private:
    Callback callback_;
};

} // namespace ship
