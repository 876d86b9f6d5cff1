// src/ship/field_visitor.cpp
#include "ship/field_visitor.hpp"

#include <cstdio>

namespace ship {

std::string format_value(const FieldValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const double* d = std::get_if<double>(&value)) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.6g", *d);
        return buf;
    }
    return std::get<std::string>(value);
}

} // namespace ship
