#include "execution_service.h"
#include "process_backend.h"
#include "docker_backend.h"
#include <iostream>
#include <stdexcept>

namespace scriptbox {

std::unique_ptr<IsolationBackend> ExecutionService::make_backend(const ServiceConfig& config) {
    switch (config.backend) {
        case BackendKind::DOCKER: {
            DockerBackendOptions options;
            options.docker = config.docker;
            options.work_root = config.work_root;
            options.limits = config.limits;
            options.call_timeout = config.backend_call_timeout;
            options.stop_grace = config.stop_grace;

            auto backend = std::make_unique<DockerBackend>(options);
            if (!backend->daemon_reachable()) {
                // Provisioning reports BACKEND_UNAVAILABLE per request until it comes back
                std::cerr << "[DockerBackend] Warning: docker daemon not reachable"
                          << (config.docker.host.empty() ? "" : " at " + config.docker.host)
                          << std::endl;
            }
            return backend;
        }
        case BackendKind::PROCESS: {
            ProcessBackendOptions options;
            options.work_root = config.work_root;
            options.interpreter = config.interpreter;
            options.limits = config.limits;
            options.stop_grace = config.stop_grace;
            return std::make_unique<ProcessBackend>(options);
        }
    }
    throw std::invalid_argument("Unknown backend");
}

ExecutionService::ExecutionService(const ServiceConfig& config)
    : ExecutionService(config, make_backend(config)) {}

ExecutionService::ExecutionService(const ServiceConfig& config,
                                   std::unique_ptr<IsolationBackend> backend)
    : config_(config),
      backend_(std::move(backend)),
      provisioner_(*backend_, registry_, config_.artifact),
      monitor_(*backend_, registry_),
      coordinator_(*backend_, registry_, config_.reaper) {}

ExecutionService::~ExecutionService() {
    coordinator_.stop_reaper();
}

SubmitResult ExecutionService::submit(const std::vector<uint8_t>& artifact,
                                      const std::string& filename) {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (closed_) {
            SubmitResult refused;
            refused.error = ErrorKind::BACKEND_UNAVAILABLE;
            refused.message = "Service is shutting down";
            return refused;
        }
        submits_in_flight_++;
    }

    // Released on every exit, including exceptions from the provisioner
    struct InFlight {
        ExecutionService& service;
        ~InFlight() {
            std::lock_guard<std::mutex> lock(service.lifecycle_mutex_);
            service.submits_in_flight_--;
            service.submits_drained_.notify_all();
        }
    } in_flight{*this};

    return provisioner_.submit(artifact, filename);
}

PollResult ExecutionService::poll(const std::string& session_id) {
    return monitor_.poll(session_id);
}

CleanupResult ExecutionService::cleanup(const std::string& session_id) {
    return coordinator_.cleanup(session_id);
}

void ExecutionService::start_reaper() {
    coordinator_.start_reaper();
}

size_t ExecutionService::shutdown() {
    {
        std::unique_lock<std::mutex> lock(lifecycle_mutex_);
        closed_ = true;
        // A launch already past the gate registers before we sweep
        submits_drained_.wait(lock, [this]() { return submits_in_flight_ == 0; });
    }
    coordinator_.stop_reaper();
    return coordinator_.cleanup_all();
}

bool ExecutionService::closed() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return closed_;
}

ServiceStats ExecutionService::stats() {
    ServiceStats stats;
    stats.backend = backend_->name();
    stats.by_status = registry_.count_by_status();
    stats.live_sessions = registry_.size();
    stats.cleanup = coordinator_.stats();
    stats.recent_faults = coordinator_.recent_faults();
    return stats;
}

} // namespace scriptbox
