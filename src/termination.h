#pragma once

namespace dbuild {

// Installs SIGINT/SIGTERM handlers. The first signal only records the request so a
// running build can be canceled cleanly; a second one exits with 128 + signal.
void termination_handler_install();

bool termination_requested();

}  // namespace dbuild
