//! # apidiff Entry Point
//!
//! Delegates to the CLI dispatcher (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return apidiff_main(argc, argv);
}
