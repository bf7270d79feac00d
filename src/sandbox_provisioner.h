#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "errors.h"
#include "config.h"
#include "isolation_backend.h"
#include "session_registry.h"

namespace scriptbox {

struct SubmitResult {
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    std::string session_id;

    bool ok() const { return error == ErrorKind::NONE; }
};

// Validates an upload, stages it into a fresh environment and launches it.
// All-or-nothing: a session is registered only after the backend accepted
// the launch, and a launch that cannot be registered is torn down.
class SandboxProvisioner {
public:
    SandboxProvisioner(IsolationBackend& backend, SessionRegistry& registry,
                       const ArtifactPolicy& policy = ArtifactPolicy{});

    SubmitResult submit(const std::vector<uint8_t>& artifact, const std::string& filename);

    // INVALID_INPUT with a reason, or NONE
    SubmitResult validate(const std::vector<uint8_t>& artifact, const std::string& filename) const;

    const ArtifactPolicy& policy() const { return policy_; }

private:
    IsolationBackend& backend_;
    SessionRegistry& registry_;
    ArtifactPolicy policy_;
};

} // namespace scriptbox
