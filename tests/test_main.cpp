// Test runner for persevere
// No dependencies beyond the library itself

#include <iostream>
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>

namespace test {

struct TestCase {
    std::string name;
    std::function<void()> func;
};

std::vector<TestCase>& get_tests() {
    static std::vector<TestCase> tests;
    return tests;
}

int register_test(const std::string& name, std::function<void()> func) {
    get_tests().push_back({name, func});
    return 0;
}

void check(bool condition, const std::string& message, const char* file, int line) {
    if (!condition) {
        throw std::runtime_error(
            std::string(file) + ":" + std::to_string(line) + ": " + message
        );
    }
}

} // namespace test

int main(int argc, char** argv) {
    // Optional substring filter: persevere_tests retry_
    std::string filter = argc > 1 ? argv[1] : "";

    std::cout << "=== Persevere Test Suite ===\n\n";

    int passed = 0;
    int failed = 0;

    for (const auto& test : test::get_tests()) {
        if (!filter.empty() && test.name.find(filter) == std::string::npos) {
            continue;
        }

        std::cout << "Running: " << test.name << "... ";
        std::cout.flush();

        try {
            test.func();
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED\n";
            std::cout << "  Error: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";
    std::cout << "Total:  " << (passed + failed) << "\n";

    return failed > 0 ? 1 : 0;
}
