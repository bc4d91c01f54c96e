#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <cmath>
#include <cstdio>
#include <string>

static int s_failures = 0;

#define EXPECT_TRUE(expr)                                                                          \
    do {                                                                                           \
        if (!(expr)) {                                                                             \
            std::fprintf(stderr, "FAIL:%d expected true: %s\n", __LINE__, #expr);                  \
            ++s_failures;                                                                          \
        }                                                                                          \
    } while (0)

#define EXPECT_FALSE(expr) EXPECT_TRUE(!(expr))

#define EXPECT_EQ_INT(actual, expected)                                                            \
    do {                                                                                           \
        const long long _a = (actual);                                                             \
        const long long _e = (expected);                                                           \
        if (_a != _e) {                                                                            \
            std::fprintf(stderr, "FAIL:%d expected %s=%lld got %lld\n", __LINE__, #actual, _e, _a); \
            ++s_failures;                                                                          \
        }                                                                                          \
    } while (0)

#define EXPECT_NEAR(actual, expected, tolerance)                                                   \
    do {                                                                                           \
        const double _a = (actual);                                                                \
        const double _e = (expected);                                                              \
        if (std::fabs(_a - _e) > (tolerance)) {                                                    \
            std::fprintf(stderr, "FAIL:%d expected %s=%f got %f\n", __LINE__, #actual, _e, _a);    \
            ++s_failures;                                                                          \
        }                                                                                          \
    } while (0)

#define EXPECT_EQ_STR(actual, expected)                                                            \
    do {                                                                                           \
        const std::string _a = (actual);                                                           \
        const std::string _e = (expected);                                                         \
        if (_a != _e) {                                                                            \
            std::fprintf(stderr, "FAIL:%d expected %s=\"%s\" got \"%s\"\n", __LINE__, #actual,     \
                         _e.c_str(), _a.c_str());                                                  \
            ++s_failures;                                                                          \
        }                                                                                          \
    } while (0)

static int finishTests(const char* suite) {
    if (s_failures != 0) {
        std::fprintf(stderr, "%s tests failed: %d\n", suite, s_failures);
        return 1;
    }
    std::printf("%s tests passed\n", suite);
    return 0;
}

#endif // TEST_SUPPORT_HPP
