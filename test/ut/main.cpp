//=============================================================================
// plugview Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    // Suites register themselves through static initialization; boost.ut
    // runs them when the runner is destroyed at exit.
}
