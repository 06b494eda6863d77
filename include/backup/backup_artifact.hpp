#pragma once

#include "common/timestamp.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>

enum class JobKind {
    VmBackup
};

enum class Compression {
    Gzip,
    Zstd
};

std::string jobKindToString(JobKind kind);
bool jobKindFromString(const std::string& token, JobKind& kind);
std::string baseExtension(JobKind kind);

std::string compressionExtension(Compression compression);
bool compressionFromExtension(const std::string& extension, Compression& compression);
std::string compressionToString(const std::optional<Compression>& compression);

// One stored backup unit. The encoded name is its only persisted form:
//
//   <host>__<kind>__<object>__<rfc3339>[.<base_ext>[.<compression_ext>]]
//
// The host field is omitted (three fields) when hostId is empty.
struct BackupArtifact {
    static const char* const kSeparator;

    std::string hostId;
    JobKind jobKind{JobKind::VmBackup};
    std::string objectName;
    Timestamp timestamp;
    std::optional<uint64_t> size;
    std::optional<Compression> compression;

    // Builds an artifact with trimmed host and object names
    static BackupArtifact create(const std::string& hostId,
                                 JobKind jobKind,
                                 const std::string& objectName,
                                 const Timestamp& timestamp,
                                 std::optional<Compression> compression = std::nullopt);

    // Throws XenKeeperError when host or object name cannot be encoded reversibly.
    std::string encode(bool includeExtension = true) const;

    // Throws DecodeError (MalformedName)
    static BackupArtifact decode(const std::string& name);
    static std::optional<BackupArtifact> tryDecode(const std::string& name, std::string* error = nullptr);

    // (host, kind, object): the unit retention is applied to
    std::string identityKey() const;
    bool sameIdentity(const BackupArtifact& other) const;

    // size is informational and not part of equality
    bool operator==(const BackupArtifact& other) const;
    bool operator!=(const BackupArtifact& other) const { return !(*this == other); }
};

struct TimeBound {
    Timestamp value;
    bool inclusive{true};
};

// Restricts a storage listing. Empty sets and unset bounds match everything; everything
// that is set must match.
struct ArtifactFilter {
    std::set<std::string> hostIds;
    std::set<JobKind> jobKinds;
    std::set<std::string> objectNames;
    std::optional<TimeBound> from;
    std::optional<TimeBound> to;
    std::set<Compression> compressions;

    bool matches(const BackupArtifact& artifact) const;
    bool isEmpty() const;

    // Filter matching exactly the artifacts sharing artifact's identity
    static ArtifactFilter forIdentity(const BackupArtifact& artifact);
};
