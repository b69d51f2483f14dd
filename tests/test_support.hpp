// tests/test_support.hpp
#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "cmg/collation/batch.hpp"
#include "cmg/data/example.hpp"

namespace cmg::test {

inline void expect(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error("Check failed: " + message);
    }
}

template <typename Exception, typename Fn>
void expect_throws(Fn&& fn, const std::string& message) {
    try {
        fn();
    } catch (const Exception&) {
        return;
    }
    throw std::runtime_error("Expected exception not thrown: " + message);
}

inline std::string to_string(const TokenSequence& seq) {
    std::string out = "[";
    for (size_t i = 0; i < seq.size(); i++) {
        out += std::to_string(seq[i]);
        if (i + 1 < seq.size()) out += ", ";
    }
    return out + "]";
}

inline void expect_seq(const TokenSequence& actual, const TokenSequence& expected,
                       const std::string& what) {
    if (actual != expected) {
        throw std::runtime_error("Check failed: " + what + " is " + to_string(actual) +
                                 ", expected " + to_string(expected));
    }
}

inline TokenSequence row(const IdMatrix& m, Eigen::Index i) {
    TokenSequence out;
    for (Eigen::Index j = 0; j < m.cols(); j++) {
        out.push_back(m(i, j));
    }
    return out;
}

inline bool same(const IdMatrix& a, const IdMatrix& b) {
    return a.rows() == b.rows() && a.cols() == b.cols() && (a.size() == 0 || a == b);
}

// Runs named test functions, stops at the first failure
inline int run_tests(const std::string& suite,
                     const std::vector<std::pair<std::string, void (*)()>>& tests) {
    std::cout << "=== " << suite << " ===" << std::endl;
    for (const auto& [name, fn] : tests) {
        try {
            fn();
            std::cout << "  [PASS] " << name << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "  [FAIL] " << name << ": " << e.what() << std::endl;
            return 1;
        }
    }
    std::cout << "All " << tests.size() << " tests passed!" << std::endl;
    return 0;
}

} // namespace cmg::test
