#pragma once

#include <iostream>

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { std::cerr << "ASSERT TRUE FAILED: " << (msg) \
        << "  @ " << __FILE__ << ":" << __LINE__ << "\n"; ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { std::cerr << "ASSERT EQ FAILED: " << (msg) \
        << "  (" << +_va << " != " << +_vb << ")" \
        << "  @ " << __FILE__ << ":" << __LINE__ << "\n"; ++g_failures; } } while(0)

static int finishTests(const char* suite) {
    if (g_failures) {
        std::cerr << "Tests failed: " << g_failures << " failure(s)\n";
        return 1;
    }
    std::cout << suite << " tests passed.\n";
    return 0;
}
