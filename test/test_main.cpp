// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

// WATCHTOWER_TEST_LOGLEVEL=trace to see component logs while debugging
int main(int argc, char* argv[]) {
    const char* level = std::getenv("WATCHTOWER_TEST_LOGLEVEL");
    InitializeTestLogging(level ? level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
