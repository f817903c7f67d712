#pragma once

namespace filetree::platform {

bool stdout_is_terminal();

// Switches the console to UTF-8 output where that is not the default, so
// box-drawing connectors print correctly.
void prepare_console();

} // namespace filetree::platform
