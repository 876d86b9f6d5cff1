// test/test_path_follower.cpp
#include "geom/path_follower.hpp"
#include <iostream>
#include <iomanip>
#include <cmath>
#include <stdexcept>

// ANSI color codes
#define COLOR_GREEN "\033[32m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET "\033[0m"

using geom::Path;
using geom::PathStep;

static bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

static bool at(const geom::Point2D& p, double x, double y) {
    return near(p.x, x) && near(p.y, y);
}

static void print_step(const PathStep& step) {
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  Position: (" << step.position.x << ", " << step.position.y << ")\n";
    std::cout << "  Facing: " << (step.has_facing ? std::to_string(step.facing_deg) : "none") << "\n";
    std::cout << "  Remaining path points: " << step.path.size() << "\n";
}

static void print_result(bool pass) {
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
}

bool test_exact_arrival() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 1: Exact Arrival ===" << COLOR_RESET << "\n";

    // 10 m/s for 1 s on a 10 m leg due east
    PathStep step = geom::advance({{0, 0}, {10, 0}}, 10.0, 1.0);
    print_step(step);

    bool pass = at(step.position, 10, 0) && step.arrived() &&
                step.has_facing && near(step.facing_deg, 270.0);
    print_result(pass);
    return pass;
}

bool test_partial_segment() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 2: Partial Segment ===" << COLOR_RESET << "\n";

    PathStep step = geom::advance({{0, 0}, {10, 0}, {10, 10}}, 5.0, 1.0);
    print_step(step);

    bool pass = at(step.position, 5, 0) && near(step.facing_deg, 270.0) &&
                step.path.size() == 3 &&
                at(step.path[0], 5, 0) && at(step.path[1], 10, 0) && at(step.path[2], 10, 10);
    print_result(pass);
    return pass;
}

bool test_segment_boundary() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 3: Landing On A Waypoint ===" << COLOR_RESET << "\n";

    // Exactly reaching an intermediate waypoint consumes it; facing is the next leg
    PathStep step = geom::advance({{0, 0}, {10, 0}, {10, 10}}, 10.0, 1.0);
    print_step(step);

    bool pass = at(step.position, 10, 0) && near(step.facing_deg, 0.0) &&
                step.path.size() == 2 && at(step.path[0], 10, 0) && at(step.path[1], 10, 10);
    print_result(pass);
    return pass;
}

bool test_carry_over() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 4: Carry-Over Past Final Waypoint ===" << COLOR_RESET << "\n";

    PathStep step = geom::advance({{0, 0}, {10, 0}, {10, 10}}, 100.0, 1.0);
    print_step(step);

    // Snaps to the last waypoint, facing the last leg (north)
    bool pass = at(step.position, 10, 10) && step.arrived() && near(step.facing_deg, 0.0);
    print_result(pass);
    return pass;
}

bool test_carry_across_corner() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 5: Carry Across A Corner ===" << COLOR_RESET << "\n";

    PathStep step = geom::advance({{0, 0}, {10, 0}, {10, 10}}, 3.0, 5.0);
    print_step(step);

    bool pass = at(step.position, 10, 5) && near(step.facing_deg, 0.0) &&
                step.path.size() == 2 && at(step.path[1], 10, 10);
    print_result(pass);
    return pass;
}

bool test_zero_speed() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 6: Zero Speed ===" << COLOR_RESET << "\n";

    Path path = {{2, 3}, {2, -7}};
    PathStep step = geom::advance(path, 0.0, 0.1);
    PathStep negative = geom::advance(path, -4.0, 0.1);
    print_step(step);

    bool pass = at(step.position, 2, 3) && !step.arrived() && step.path.size() == 2 &&
                near(step.facing_deg, 180.0) &&
                at(negative.position, 2, 3) && negative.path.size() == 2;
    print_result(pass);
    return pass;
}

bool test_degenerate_segments() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 7: Zero-Length Segments ===" << COLOR_RESET << "\n";

    // Duplicate head is skipped
    PathStep step = geom::advance({{0, 0}, {0, 0}, {0, 10}}, 3.0, 1.0);
    print_step(step);

    // Only a zero-length leg left: arrive with no facing
    PathStep stuck = geom::advance({{5, 5}, {5, 5}}, 1.0, 1.0);
    print_step(stuck);

    // Repeated final waypoint: facing comes from the leg travelled
    PathStep repeated = geom::advance({{0, 0}, {10, 0}, {10, 0}}, 100.0, 1.0);
    print_step(repeated);

    // Short of the repeat: still on the real leg
    PathStep short_of = geom::advance({{0, 0}, {10, 0}, {10, 0}}, 3.0, 1.0);
    print_step(short_of);

    bool pass = at(step.position, 0, 3) && near(step.facing_deg, 0.0) && step.path.size() == 2 &&
                at(stuck.position, 5, 5) && stuck.arrived() && !stuck.has_facing &&
                at(repeated.position, 10, 0) && repeated.arrived() &&
                repeated.has_facing && near(repeated.facing_deg, 270.0) &&
                at(short_of.position, 3, 0) && short_of.has_facing && near(short_of.facing_deg, 270.0) &&
                short_of.path.size() == 3;
    print_result(pass);
    return pass;
}

bool test_input_untouched() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 8: Input Path Untouched ===" << COLOR_RESET << "\n";

    const Path path = {{0, 0}, {10, 0}, {10, 10}};
    const Path copy = path;
    (void)geom::advance(path, 7.0, 1.0);

    bool pass = (path == copy);
    print_result(pass);
    return pass;
}

bool test_short_path_throws() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 9: Short Path Rejected ===" << COLOR_RESET << "\n";

    int thrown = 0;
    try {
        (void)geom::advance({}, 1.0, 1.0);
    } catch (const std::invalid_argument& e) {
        std::cout << "  Empty path: " << e.what() << "\n";
        thrown++;
    }
    try {
        (void)geom::advance({{1, 1}}, 1.0, 1.0);
    } catch (const std::invalid_argument& e) {
        std::cout << "  Single point: " << e.what() << "\n";
        thrown++;
    }

    bool pass = (thrown == 2);
    print_result(pass);
    return pass;
}

int main() {
    std::cout << COLOR_YELLOW << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║        Path Follower Validation Tests                      ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝" << COLOR_RESET << "\n";

    int passed = 0;
    int total = 0;

    passed += test_exact_arrival(); total++;
    passed += test_partial_segment(); total++;
    passed += test_segment_boundary(); total++;
    passed += test_carry_over(); total++;
    passed += test_carry_across_corner(); total++;
    passed += test_zero_speed(); total++;
    passed += test_degenerate_segments(); total++;
    passed += test_input_untouched(); total++;
    passed += test_short_path_throws(); total++;

    std::cout << "\n" << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n";
    std::cout << "  " << COLOR_YELLOW << "Summary: " << COLOR_RESET;

    if (passed == total) {
        std::cout << COLOR_GREEN << passed << "/" << total << " tests passed ✓" << COLOR_RESET << "\n";
    } else {
        std::cout << COLOR_RED << passed << "/" << total << " tests passed ✗" << COLOR_RESET << "\n";
    }

    std::cout << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n\n";

    return (passed == total) ? 0 : 1;
}
