// Minimal check harness shared by the core test executables.
#pragma once

#include <iostream>
#include <string_view>

namespace vargen::test {

struct Run {
    int failures = 0;
    void expect(bool ok, std::string_view msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    }
    int finish() const {
        if (failures) {
            std::cerr << "Total failures: " << failures << "\n";
            return 1;
        }
        return 0;
    }
};

// Runs `fn` and reports whether it threw E; `check` may inspect the exception.
template <typename E, typename Fn, typename Check>
bool throws_as(Fn &&fn, Check &&check) {
    try {
        fn();
    } catch (const E &e) {
        return check(e);
    } catch (...) {
        return false;
    }
    return false;
}

template <typename E, typename Fn>
bool throws_as(Fn &&fn) {
    return throws_as<E>(fn, [](const E &) { return true; });
}

} // namespace vargen::test
