#include "sandbox_provisioner.h"
#include "file_utils.h"
#include <algorithm>
#include <iostream>

namespace scriptbox {

namespace {

// UUIDv4 collisions are not expected; the retry only guards the invariant
constexpr int MAX_ID_ATTEMPTS = 4;

SubmitResult failure(ErrorKind kind, const std::string& message) {
    SubmitResult result;
    result.error = kind;
    result.message = message;
    return result;
}

} // namespace

SandboxProvisioner::SandboxProvisioner(IsolationBackend& backend, SessionRegistry& registry,
                                       const ArtifactPolicy& policy)
    : backend_(backend), registry_(registry), policy_(policy) {}

SubmitResult SandboxProvisioner::validate(const std::vector<uint8_t>& artifact,
                                          const std::string& filename) const {
    if (filename.empty() && artifact.empty()) {
        return failure(ErrorKind::INVALID_INPUT, "No file provided");
    }
    if (artifact.empty()) {
        return failure(ErrorKind::INVALID_INPUT, "Uploaded file is empty");
    }
    if (artifact.size() > policy_.max_bytes) {
        return failure(ErrorKind::INVALID_INPUT,
            "File exceeds " + std::to_string(policy_.max_bytes) + " byte limit");
    }

    std::string name = FileUtils::sanitize_filename(filename);
    if (name.empty()) {
        return failure(ErrorKind::INVALID_INPUT, "Invalid file name");
    }

    if (!policy_.allowed_extensions.empty()) {
        std::string ext = FileUtils::extension_of(name);
        auto allowed = std::find(policy_.allowed_extensions.begin(),
                                 policy_.allowed_extensions.end(), ext);
        if (allowed == policy_.allowed_extensions.end()) {
            return failure(ErrorKind::INVALID_INPUT, "Unsupported file type: " + name);
        }
    }
    return SubmitResult{};
}

SubmitResult SandboxProvisioner::submit(const std::vector<uint8_t>& artifact,
                                        const std::string& filename) {
    SubmitResult checked = validate(artifact, filename);
    if (!checked.ok()) {
        return checked;
    }

    Session session;
    try {
        for (int attempt = 0; attempt < MAX_ID_ATTEMPTS && session.id.empty(); ++attempt) {
            std::string candidate = FileUtils::random_uuid();
            if (!registry_.contains(candidate)) {
                session.id = candidate;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[Provisioner] Cannot allocate session id: " << e.what() << std::endl;
        return failure(ErrorKind::BACKEND_UNAVAILABLE, "Cannot allocate session id");
    }
    if (session.id.empty()) {
        return failure(ErrorKind::BACKEND_UNAVAILABLE, "Cannot allocate session id");
    }

    session.filename = FileUtils::sanitize_filename(filename);
    session.artifact_sha256 = FileUtils::sha256_bytes(artifact);
    session.created_at = std::chrono::steady_clock::now();
    session.last_checked_at = session.created_at;
    session.status = SessionStatus::PENDING;

    LaunchSpec spec;
    spec.session_id = session.id;
    spec.entrypoint = policy_.entrypoint;
    spec.content = artifact;

    ProvisionOutcome launched = backend_.provision(spec);
    if (!launched.result.ok()) {
        std::cerr << "[Provisioner] Backend " << backend_.name() << " refused session "
                  << session.id << ": " << launched.result.message << std::endl;
        return failure(ErrorKind::BACKEND_UNAVAILABLE, launched.result.message);
    }

    session.backend_handle = launched.handle;
    session.status = SessionStatus::RUNNING;

    if (!registry_.insert(session)) {
        // Someone registered the same id between the check and now
        BackendResult rolled_back = backend_.destroy(launched.handle);
        if (!rolled_back.ok()) {
            std::cerr << "[Provisioner] Rollback of " << launched.handle
                      << " failed: " << rolled_back.message << std::endl;
        }
        return failure(ErrorKind::BACKEND_UNAVAILABLE, "Session id collision, retry the request");
    }

    std::cout << "[Provisioner] Session " << session.id << " launched"
              << " (file: " << session.filename
              << ", backend: " << backend_.name()
              << ", handle: " << session.backend_handle << ")" << std::endl;

    SubmitResult result;
    result.session_id = session.id;
    return result;
}

} // namespace scriptbox
