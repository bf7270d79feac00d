/*
 * scriptbox - run untrusted scripts in throwaway sandboxes
 * Submit, poll for the result, clean up.
 */

#include "config.h"
#include "http_server.h"
#include "http_routes.h"
#include "execution_service.h"
#include <iostream>
#include <thread>
#include <memory>
#include <csignal>
#include <cstring>
#include <pthread.h>

using namespace scriptbox;

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ServiceConfig::load(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << ServiceConfig::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << ServiceConfig::usage(argv[0]);
        return 0;
    }

    // Peers that hang up mid-response must not kill the process
    signal(SIGPIPE, SIG_IGN);

    // Block shutdown signals before any thread starts; a dedicated waiter handles them
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    int rc = pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);
    if (rc != 0) {
        std::cerr << "Error: cannot block signals: " << strerror(rc) << std::endl;
        return 1;
    }

    std::unique_ptr<ExecutionService> service;
    try {
        service = std::make_unique<ExecutionService>(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot initialize " << to_string(config.backend)
                  << " backend: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "scriptbox - sandboxed script execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Backend:      " << service->backend().name() << std::endl;
    if (config.backend == BackendKind::DOCKER) {
        std::cout << "Image:        " << config.docker.image << std::endl;
        std::cout << "Daemon:       "
                  << (config.docker.host.empty() ? "local" : config.docker.host) << std::endl;
    } else {
        std::cout << "Work root:    " << config.work_root << std::endl;
    }
    std::cout << "Memory:       " << config.limits.memory_limit_mb << " MB" << std::endl;
    std::cout << "Wall timeout: " << config.limits.wall_timeout.count() << "s" << std::endl;
    std::cout << "Network:      " << (config.limits.allow_network ? "allowed" : "disabled") << std::endl;
    std::cout << "Session TTL:  " << config.reaper.max_age.count() << "s (idle "
              << config.reaper.idle_timeout.count() << "s)" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    HttpServer server(config.port);
    register_routes(server, *service);

    std::thread([&server, shutdown_signals]() {
        int signo = 0;
        if (sigwait(&shutdown_signals, &signo) == 0) {
            std::cout << "\n[Server] Received " << strsignal(signo) << ", shutting down" << std::endl;
            server.stop();
        }
    }).detach();

    service->start_reaper();

    int exit_code = 0;
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    // start() has drained every connection; no handler can reach the service now
    size_t remaining = service->shutdown();
    std::cout << "[Server] Stopped; " << remaining << " sessions torn down on exit" << std::endl;
    return exit_code;
}
