#pragma once

#include "backup/xen/hypervisor_client.hpp"
#include "common/process.hpp"
#include <string>
#include <vector>

struct XeConnection {
    std::string server{"localhost"};
    std::string username;
    std::string password;
    std::string binary{"xe"};
};

// HypervisorClient on top of the xe command line tool
class XeCliClient : public HypervisorClient {
public:
    static const char* const kSnapshotLabel;

    XeCliClient(const std::string& hostId, const XeConnection& connection);

    const std::string& hostId() const override { return hostId_; }

    std::vector<VmHandle> listVms(const std::vector<std::string>& tags,
                                  const std::vector<std::string>& excludeTags) override;
    VmHandle createSnapshot(const VmHandle& vm) override;
    std::vector<VmHandle> listSnapshots(const VmHandle& vm) override;
    void markNotTemplate(const VmHandle& snapshot) override;
    void rename(const VmHandle& snapshot, const std::string& label) override;
    void deleteSnapshot(const std::string& snapshotUuid) override;
    std::unique_ptr<ExportProcess> exportStream(const VmHandle& snapshot) override;

    VmHandle getVm(const std::string& uuid);

    // Output parsers for "--minimal" uuid lists and "vm-param-list"
    static std::vector<std::string> parseUuidList(const std::string& output);
    static std::string parseUuid(const std::string& output);
    static VmHandle parseVmParams(const std::string& output);

    std::vector<std::string> baseCommand() const;

private:
    std::string runXe(const std::vector<std::string>& args);
    std::vector<std::string> listUuids(const std::vector<std::string>& filters);

    std::string hostId_;
    XeConnection connection_;
};
