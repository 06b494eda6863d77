#pragma once

#include "common/byte_stream.hpp"
#include "common/timestamp.hpp"
#include <memory>
#include <string>
#include <vector>

struct VmHandle {
    std::string uuid;
    std::string displayName;
    std::string description;
    bool isTemplate{false};
    bool isSnapshot{false};
    Timestamp snapshotTime;
};

// A running export. Both streams must be consumed before wait() can return.
class ExportProcess {
public:
    virtual ~ExportProcess() = default;

    virtual ByteStream& stdoutStream() = 0;
    virtual ByteStream& stderrStream() = 0;

    // Exit status of the exporter, 0 on success
    virtual int wait() = 0;
    virtual void terminate() = 0;
};

// Control-plane operations on one hypervisor host. Every operation throws
// CollaboratorError on failure.
class HypervisorClient {
public:
    virtual ~HypervisorClient() = default;

    virtual const std::string& hostId() const = 0;

    // VMs tagged with any of tags and none of excludeTags; templates, snapshots and the
    // control domain are never returned. An empty tag list selects every VM.
    virtual std::vector<VmHandle> listVms(const std::vector<std::string>& tags,
                                          const std::vector<std::string>& excludeTags) = 0;

    virtual VmHandle createSnapshot(const VmHandle& vm) = 0;

    // Throws NoSnapshotsError when the VM has none
    virtual std::vector<VmHandle> listSnapshots(const VmHandle& vm) = 0;

    virtual void markNotTemplate(const VmHandle& snapshot) = 0;
    virtual void rename(const VmHandle& snapshot, const std::string& label) = 0;
    virtual void deleteSnapshot(const std::string& snapshotUuid) = 0;

    virtual std::unique_ptr<ExportProcess> exportStream(const VmHandle& snapshot) = 0;
};
