#pragma once

#include <ostream>
#include <string>

#include "app/Config.hpp"
#include "net/NetworkControl.hpp"

namespace App {
namespace CommandRouter {

// Runs the one-shot command selected in config and prints one structured JSON
// line: {"cmd":...,"status":"ok|error","message":...,"data":...}.
// Returns the process exit code.
int run(const Config& config, Net::NetworkControl& network, const std::string& interfaceName,
        std::ostream& out);

const char* commandName(OneShotCommand command);

}  // namespace CommandRouter
}  // namespace App
