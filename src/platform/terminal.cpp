#include "terminal.hpp"
#include <cstdio>
#include <sys/ioctl.h>
#include <unistd.h>
#include <signal.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

bool stdout_is_terminal() {
    return isatty(STDOUT_FILENO) != 0;
}

// ── Interrupt handling ───────────────────────────────────────

static std::atomic<bool>* g_interrupt_flag = nullptr;

static void on_sigint(int) {
    if (g_interrupt_flag) g_interrupt_flag->store(true);
}

void set_interrupt_flag(std::atomic<bool>* flag) {
    g_interrupt_flag = flag;
    signal(SIGINT, flag ? on_sigint : SIG_DFL);
}

} // namespace platform
