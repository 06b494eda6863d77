#pragma once

#include <stdexcept>
#include <string>

// Root of every error raised by XenKeeper itself.
class XenKeeperError : public std::runtime_error {
public:
    explicit XenKeeperError(const std::string& message)
        : std::runtime_error(message) {}
};

// Hypervisor command or transport failure. Surfaced per VM, never retried.
class CollaboratorError : public XenKeeperError {
public:
    explicit CollaboratorError(const std::string& message)
        : XenKeeperError(message) {}
};

// Raised by HypervisorClient::listSnapshots when the VM has no snapshot at all.
class NoSnapshotsError : public CollaboratorError {
public:
    explicit NoSnapshotsError(const std::string& vmUuid)
        : CollaboratorError("No snapshots found for VM " + vmUuid)
        , vmUuid_(vmUuid) {}

    const std::string& vmUuid() const { return vmUuid_; }

private:
    std::string vmUuid_;
};

// Fatal for the backend during the current run.
class BackendInitError : public XenKeeperError {
public:
    BackendInitError(const std::string& backendName, const std::string& message)
        : XenKeeperError("Failed to initialize storage '" + backendName + "': " + message)
        , backendName_(backendName) {}

    const std::string& backendName() const { return backendName_; }

private:
    std::string backendName_;
};

// Scoped to one VM/backend pairing; the partial artifact is already gone when this is thrown.
class StreamConsumptionError : public XenKeeperError {
public:
    explicit StreamConsumptionError(const std::string& message)
        : XenKeeperError(message) {}
};

class DecodeError : public XenKeeperError {
public:
    enum class Kind {
        MalformedName
    };

    DecodeError(Kind kind, const std::string& name, const std::string& reason)
        : XenKeeperError("Malformed artifact name '" + name + "': " + reason)
        , kind_(kind)
        , name_(name) {}

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }

private:
    Kind kind_;
    std::string name_;
};

// A failed deletion leaves the retention policy unenforced, so it is always propagated.
class RotationError : public XenKeeperError {
public:
    explicit RotationError(const std::string& message)
        : XenKeeperError(message) {}
};

class ConfigError : public XenKeeperError {
public:
    explicit ConfigError(const std::string& message)
        : XenKeeperError("Configuration error: " + message) {}
};

class MonitoringError : public XenKeeperError {
public:
    explicit MonitoringError(const std::string& message)
        : XenKeeperError(message) {}
};
