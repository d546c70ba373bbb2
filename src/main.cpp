#include "core/engine.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

// SIGWINCH has no user data pointer, so the running engine is reached through this
static shfix::core::Engine* active_engine = nullptr;

/** @brief Mirrors the outer terminal size onto the PTY when the window is resized. */
void on_window_resize(int /*sig*/) {
    if (!active_engine) return;
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != -1) {
        active_engine->resize_window(ws.ws_row, ws.ws_col);
    }
}

int main() {
    if (!isatty(STDIN_FILENO)) {
        std::cerr << "[\x1b[91m-\x1b[0m] shfix must be started from an interactive terminal.\n";
        return 1;
    }

    shfix::core::Engine engine;
    active_engine = &engine;
    signal(SIGWINCH, on_window_resize);

    // config/ and src/py_scripts/ live under the source tree the binary was built from
#ifdef SHFIX_ROOT
    const fs::path root = SHFIX_ROOT;
#else
    const fs::path root = fs::current_path();
#endif

    engine.load_configuration((root / "config").string());
    engine.load_extensions((root / "src" / "py_scripts").string());

    engine.run();

    active_engine = nullptr;
    return 0;
}
