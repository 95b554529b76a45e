#include "TerminationSignal.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string>
#include <pthread.h>

namespace {

sigset_t terminationSet() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

}

void localmesh::process::blockTerminationSignals() {
    const auto set = terminationSet();
    if (const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr); rc != 0)
        throw std::runtime_error(std::string("pthread_sigmask: ") + std::strerror(rc));
}

int localmesh::process::waitForTerminationSignal() {
    const auto set = terminationSet();
    int signal = 0;
    if (const int rc = sigwait(&set, &signal); rc != 0)
        throw std::runtime_error(std::string("sigwait: ") + std::strerror(rc));
    return signal;
}
