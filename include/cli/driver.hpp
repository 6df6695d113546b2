#pragma once

/// Entry point of the `apidiff` executable. Returns the process exit code.
int apidiff_main(int argc, char* argv[]);
