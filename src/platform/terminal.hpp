#pragma once

#include <atomic>

namespace platform {

// Get terminal width in columns (80 when not a terminal).
int term_width();

// Whether stdout is attached to a terminal.
bool stdout_is_terminal();

// Route SIGINT to `flag` (set to true on Ctrl+C) until restored.
// Passing nullptr restores the default handler.
void set_interrupt_flag(std::atomic<bool>* flag);

} // namespace platform
