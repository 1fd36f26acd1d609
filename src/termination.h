#pragma once

namespace embedpy {

// Exit immediately with 128 + signal on SIGINT, SIGTERM, SIGHUP (console control events
// on Windows). A partially assembled distribution is left in place.
void termination_handler_install();

}  // namespace embedpy
