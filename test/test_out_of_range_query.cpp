/*
 * Out-of-range query test for Minterm Classifier
 * Ensures a code outside the UTF-16 code-unit space aborts the process
 * instead of reading past the lookup table
 */

#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>
#include "minterm_classifier.hpp"

using namespace minterm;

struct OutOfRangeTest {
    std::vector<std::vector<CharRange>> minterms;
    uint32_t code;
    std::string description;
};

// Runs the query in a child process and reports whether it died by SIGABRT
bool test_out_of_range(const OutOfRangeTest& test) {
    MintermClassifier classifier(test.minterms);

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "✗ FAIL: " << test.description << " (fork failed)\n";
        return false;
    }
    if (pid == 0) {
        volatile MintermId id = classifier.classify(test.code);
        (void)id;
        _exit(0);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) != pid) {
        std::cerr << "✗ FAIL: " << test.description << " (waitpid failed)\n";
        return false;
    }

    if (!WIFSIGNALED(status) || WTERMSIG(status) != SIGABRT) {
        std::cerr << "✗ FAIL: " << test.description << "\n";
        std::cerr << "  Query for code " << test.code << " returned instead of aborting\n";
        return false;
    }

    std::cout << "✓ PASS: " << test.description << "\n";
    return true;
}

int main() {
    std::cout << "Minterm Classifier - Out-of-Range Query Test\n";
    std::cout << "============================================\n\n";

    std::vector<OutOfRangeTest> tests = {
        {{{}, {{0x4E00, 0x9FFF}}}, 0x11388, "Full table aborts past the code-unit space"},
        {{{}, {{0x4E00, 0x9FFF}}}, kCodeUnitCount, "Full table aborts one past 0xFFFF"},
        {{{}, {{'0', '9'}}}, 0x11388, "ASCII-only table aborts instead of returning 0"},
        {{{}}, 0xFFFFFFFF, "Shared zero table aborts on the largest code"},
    };

    int passed = 0;
    int failed = 0;

    for (const auto& test : tests) {
        if (test_out_of_range(test)) {
            passed++;
        } else {
            failed++;
        }
    }

    // The last valid code is still answered
    MintermClassifier edge({{}, {{0xFFFF, 0xFFFF}}});
    if (edge.classify(kMaxCodeUnit) == 1) {
        std::cout << "✓ PASS: Code 0xFFFF is still classified\n";
        passed++;
    } else {
        std::cerr << "✗ FAIL: Code 0xFFFF is still classified\n";
        failed++;
    }

    std::cout << "\n" << std::string(50, '=') << "\n";
    std::cout << "Test Summary\n";
    std::cout << std::string(50, '=') << "\n";
    std::cout << "Total Tests: " << (passed + failed) << "\n";
    std::cout << "Passed:      " << passed << "\n";
    std::cout << "Failed:      " << failed << "\n";

    if (failed > 0) {
        std::cerr << "\n⚠️  CRITICAL: Out-of-range codes read past the lookup table!\n";
        return 1;
    } else {
        std::cout << "\n✅ All out-of-range queries correctly aborted.\n";
        return 0;
    }
}
