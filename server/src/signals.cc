#include "signals.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <pthread.h>

namespace corsserve {

static sigset_t termination_mask() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

bool block_termination_signals() {
    struct sigaction sa_pipe;
    std::memset(&sa_pipe, 0, sizeof(sa_pipe));
    sa_pipe.sa_handler = SIG_IGN;
    sigemptyset(&sa_pipe.sa_mask);
    if (sigaction(SIGPIPE, &sa_pipe, nullptr) < 0) {
        std::cerr << "[signals] WARNING: sigaction(SIGPIPE): " << std::strerror(errno) << std::endl;
    }

    sigset_t mask = termination_mask();
    const int rc = pthread_sigmask(SIG_BLOCK, &mask, nullptr);
    if (rc != 0) {
        std::cerr << "[signals] pthread_sigmask: " << std::strerror(rc) << std::endl;
        return false;
    }
    return true;
}

int wait_for_termination_signal() {
    sigset_t mask = termination_mask();
    int sig = 0;
    const int rc = sigwait(&mask, &sig);
    if (rc != 0) {
        std::cerr << "[signals] sigwait: " << std::strerror(rc) << std::endl;
        return -1;
    }
    return sig;
}

} // namespace corsserve
