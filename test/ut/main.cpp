//=============================================================================
// Pictura Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

int main() {
    // Suites register themselves during static initialization and run at
    // exit. PICTURA_TEST_LOG=debug shows engine logs while they run.
    const char* level = std::getenv("PICTURA_TEST_LOG");
    spdlog::set_level(level ? spdlog::level::from_str(level) : spdlog::level::err);
}
