#pragma once

namespace corsserve {

    // Blocks SIGINT/SIGTERM in the calling thread (and threads it creates later)
    // and ignores SIGPIPE. Call before starting any other thread.
    // Returns false if the mask could not be installed.
    bool block_termination_signals();

    // Waits for SIGINT or SIGTERM; returns the signal number, or -1 on error.
    int wait_for_termination_signal();

} // namespace corsserve
