/*
 * Copyright (c) 2024 Chiradip Mandal
 * Author: Chiradip Mandal
 * Organization: Space-RF.org
 *
 * Lookup Table Analysis for Minterm Classifier
 * Comparing table lookup against range search for minterm classification
 */

#include <iostream>
#include <chrono>
#include <random>
#include <vector>
#include <cstdint>
#include <iomanip>
#include <algorithm>
#include <string>
#include "minterm_classifier.hpp"

using namespace minterm;

// Range search: binary search over all minterm ranges sorted by start
class RangeSearchClassifier {
public:
    explicit RangeSearchClassifier(const std::vector<std::vector<CharRange>>& minterms) {
        for (size_t id = 1; id < minterms.size(); ++id) {
            for (const auto& range : minterms[id]) {
                entries_.push_back({range, static_cast<MintermId>(id)});
            }
        }
        std::sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
            return a.range.start < b.range.start;
        });
    }

    MintermId classify(uint32_t code) const {
        auto it = std::upper_bound(entries_.begin(), entries_.end(), code,
            [](uint32_t value, const Entry& entry) {
                return value < entry.range.start;
            });
        if (it == entries_.begin()) {
            return 0;
        }
        --it;
        return code <= it->range.end ? it->id : MintermId{0};
    }

    size_t memory_bytes() const { return entries_.size() * sizeof(Entry); }

private:
    struct Entry {
        CharRange range;
        MintermId id;
    };
    std::vector<Entry> entries_;
};

// Benchmark function
template<typename Func>
double benchmark(const std::string& name, const std::vector<char16_t>& data, Func func) {
    const int iterations = 2000;

    auto start = std::chrono::high_resolution_clock::now();

    uint64_t checksum = 0;
    for (int i = 0; i < iterations; ++i) {
        uint64_t local_sum = 0;
        for (char16_t ch : data) {
            local_sum += func(ch);
        }
        checksum = local_sum;  // Prevent optimization
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);

    double ns_per_char = static_cast<double>(duration.count()) / (iterations * data.size());

    std::cout << std::setw(30) << name << ": "
              << std::fixed << std::setprecision(3)
              << ns_per_char << " ns/char"
              << " (checksum: " << checksum << ")" << std::endl;

    return ns_per_char;
}

// Mixed workload: mostly ASCII text with a share of CJK and other BMP units
std::vector<char16_t> generate_workload(size_t size) {
    std::vector<char16_t> data;
    data.reserve(size);
    std::mt19937 gen(42);
    std::discrete_distribution<> dist({
        40,  // Letters
        10,  // Digits
        15,  // Whitespace and punctuation
        25,  // CJK
        10   // Other BMP
    });
    std::uniform_int_distribution<> letter(0, 51);
    std::uniform_int_distribution<> digit(0, 9);
    std::uniform_int_distribution<> punct(0x20, 0x2F);
    std::uniform_int_distribution<> cjk(0x4E00, 0x9FFF);
    std::uniform_int_distribution<> bmp(0x80, 0xFFFF);

    for (size_t i = 0; i < size; ++i) {
        switch (dist(gen)) {
            case 0: {
                int l = letter(gen);
                data.push_back(static_cast<char16_t>(l < 26 ? 'A' + l : 'a' + (l - 26)));
                break;
            }
            case 1: data.push_back(static_cast<char16_t>('0' + digit(gen))); break;
            case 2: data.push_back(static_cast<char16_t>(punct(gen))); break;
            case 3: data.push_back(static_cast<char16_t>(cjk(gen))); break;
            default: data.push_back(static_cast<char16_t>(bmp(gen))); break;
        }
    }
    return data;
}

bool analyze(const std::string& title, const std::vector<std::vector<CharRange>>& minterms,
             const std::vector<char16_t>& data) {
    std::cout << title << ":\n";
    std::cout << std::string(title.size() + 1, '-') << "\n";

    MintermClassifier table(minterms);
    RangeSearchClassifier search(minterms);

    double search_time = benchmark("Range search", data,
        [&](char16_t ch) { return search.classify(ch); });
    double table_time = benchmark("Lookup table", data,
        [&](char16_t ch) { return table.classify(ch); });
    std::cout << "Speedup: " << std::fixed << std::setprecision(2)
              << (search_time / table_time) << "x\n";

    std::cout << "Minterms: " << table.minterm_count()
              << ", table shape: " << (table.is_ascii_only() ? "ASCII-only" : "full")
              << ", table size: " << table.table_size() * sizeof(MintermId) << " bytes"
              << ", range index size: " << search.memory_bytes() << " bytes\n";

    // Both strategies must agree on every code unit
    int mismatches = 0;
    for (uint32_t code = 0; code <= kMaxCodeUnit; ++code) {
        if (table.classify(code) != search.classify(code)) {
            mismatches++;
        }
    }
    std::cout << "Agreement over all " << kCodeUnitCount << " code units: "
              << (mismatches == 0 ? "Yes" : "No") << "\n\n";
    return mismatches == 0;
}

int main() {
    std::cout << "Minterm Classifier - Lookup Table Analysis\n";
    std::cout << "==========================================\n\n";

    std::vector<char16_t> test_data = generate_workload(10000);
    std::cout << "Test data size: " << test_data.size() << " code units\n\n";

    // Partition of something like [A-Za-z_][A-Za-z0-9_]*\s
    const std::vector<std::vector<CharRange>> identifier = {
        {},
        {{'0', '9'}},
        {{'A', 'Z'}, {'_', '_'}, {'a', 'z'}},
        {{'\t', '\r'}, {' ', ' '}}
    };

    // Same partition with a CJK minterm and scattered Latin-1 letters
    const std::vector<std::vector<CharRange>> multilingual = {
        {},
        {{'0', '9'}},
        {{'A', 'Z'}, {'_', '_'}, {'a', 'z'}, {0xAA, 0xAA}, {0xB5, 0xB5}, {0xBA, 0xBA},
         {0xC0, 0xD6}, {0xD8, 0xF6}, {0xF8, 0xFF}},
        {{'\t', '\r'}, {' ', ' '}, {0x85, 0x85}, {0xA0, 0xA0}, {0x3000, 0x3000}},
        {{0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xF900, 0xFAFF}}
    };

    bool ok = analyze("ASCII Identifier Partition", identifier, test_data);
    ok = analyze("Multilingual Partition", multilingual, test_data) && ok;

    // Memory footprint analysis
    std::cout << "Memory Analysis:\n";
    std::cout << "----------------\n";
    std::cout << "ASCII-only table: " << kAsciiLimit * sizeof(MintermId) << " bytes\n";
    std::cout << "Full table:       " << kCodeUnitCount * sizeof(MintermId) << " bytes\n";
    std::cout << "Single-minterm partitions share one full table\n";

    return ok ? 0 : 1;
}
