#ifndef TEST_UTILS_H
#define TEST_UTILS_H

#include <QString>
#include <QVector>
#include <cstddef>
#include <iostream>
#include <string>

namespace TestUtils {

template <typename T>
std::string display(const T &) {
    return "<value>";
}
inline std::string display(int value) { return std::to_string(value); }
inline std::string display(long long value) { return std::to_string(value); }
inline std::string display(std::size_t value) { return std::to_string(value); }
inline std::string display(bool value) { return value ? "true" : "false"; }
inline std::string display(const std::string &value) { return "\"" + value + "\""; }
inline std::string display(const QString &value) { return "\"" + value.toStdString() + "\""; }
inline std::string display(const QVector<int> &values) {
    std::string out = "[";
    for (int i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(values[i]);
    }
    return out + "]";
}

class TestRunner {
public:
    explicit TestRunner(const std::string &suiteName)
        : suite(suiteName) {
        std::cout << "=== " << suite << " ===" << std::endl;
    }

    ~TestRunner() {
        std::cout << "=== " << suite << ": " << passed << " passed, " << failed << " failed ===" << std::endl;
    }

    void expectTrue(bool condition, const std::string &message) {
        record(condition, message, std::string());
    }

    void expectFalse(bool condition, const std::string &message) {
        record(!condition, message, std::string());
    }

    template <typename Expected, typename Actual>
    void expectEq(const Expected &expected, const Actual &actual, const std::string &message) {
        const bool equal = (expected == actual);
        record(equal, message, equal ? std::string() : "expected " + display(expected) + ", got " + display(actual));
    }

    bool allPassed() const { return failed == 0; }

private:
    void record(bool ok, const std::string &message, const std::string &detail) {
        if (ok) {
            ++passed;
            std::cout << "  PASS: " << message << std::endl;
        } else {
            ++failed;
            std::cout << "  FAIL: " << message;
            if (!detail.empty()) std::cout << " (" << detail << ")";
            std::cout << std::endl;
        }
    }

    std::string suite;
    int passed = 0;
    int failed = 0;
};

}  // namespace TestUtils

#endif  // TEST_UTILS_H
