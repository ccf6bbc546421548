#pragma once

namespace App {

// Loads configuration, wires the components together and runs until exit.
// Returns the process exit code.
int run(int argc, char* argv[]);

}  // namespace App
