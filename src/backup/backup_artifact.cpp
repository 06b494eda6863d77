#include "backup/backup_artifact.hpp"
#include "common/errors.hpp"
#include "common/utils.hpp"
#include <tuple>

const char* const BackupArtifact::kSeparator = "__";

namespace {

struct CompressionEntry {
    Compression compression;
    const char* extension;
};

const CompressionEntry kCompressionTable[] = {
    {Compression::Gzip, "gz"},
    {Compression::Zstd, "zst"},
};

void checkEncodable(const std::string& field, const std::string& value) {
    if (value.find(BackupArtifact::kSeparator) != std::string::npos) {
        throw XenKeeperError(field + " '" + value + "' contains the reserved separator '__'");
    }
    if (!value.empty() && (value.front() == '_' || value.back() == '_')) {
        throw XenKeeperError(field + " '" + value + "' must not start or end with '_'");
    }
    if (value.find('/') != std::string::npos) {
        throw XenKeeperError(field + " '" + value + "' must not contain '/'");
    }
}

} // namespace

std::string jobKindToString(JobKind kind) {
    switch (kind) {
        case JobKind::VmBackup:
            return "vm";
    }
    return "unknown";
}

bool jobKindFromString(const std::string& token, JobKind& kind) {
    if (token == "vm") {
        kind = JobKind::VmBackup;
        return true;
    }
    return false;
}

std::string baseExtension(JobKind kind) {
    switch (kind) {
        case JobKind::VmBackup:
            return "xva";
    }
    return "";
}

std::string compressionExtension(Compression compression) {
    for (const auto& entry : kCompressionTable) {
        if (entry.compression == compression) {
            return entry.extension;
        }
    }
    return "";
}

bool compressionFromExtension(const std::string& extension, Compression& compression) {
    for (const auto& entry : kCompressionTable) {
        if (extension == entry.extension) {
            compression = entry.compression;
            return true;
        }
    }
    return false;
}

std::string compressionToString(const std::optional<Compression>& compression) {
    if (!compression) {
        return "none";
    }
    return *compression == Compression::Gzip ? "gzip" : "zstd";
}

BackupArtifact BackupArtifact::create(const std::string& hostId,
                                      JobKind jobKind,
                                      const std::string& objectName,
                                      const Timestamp& timestamp,
                                      std::optional<Compression> compression) {
    BackupArtifact artifact;
    artifact.hostId = utils::trim(hostId);
    artifact.jobKind = jobKind;
    artifact.objectName = utils::trim(objectName);
    artifact.timestamp = timestamp;
    artifact.compression = compression;
    return artifact;
}

std::string BackupArtifact::encode(bool includeExtension) const {
    std::string host = utils::trim(hostId);
    std::string object = utils::trim(objectName);

    if (object.empty()) {
        throw XenKeeperError("Object name must not be empty");
    }
    checkEncodable("Host id", host);
    checkEncodable("Object name", object);

    std::string name;
    if (!host.empty()) {
        name += host + kSeparator;
    }
    name += jobKindToString(jobKind) + kSeparator + object + kSeparator + timestamp.toRfc3339();

    if (includeExtension) {
        name += "." + baseExtension(jobKind);
        if (compression) {
            name += "." + compressionExtension(*compression);
        }
    }
    return name;
}

BackupArtifact BackupArtifact::decode(const std::string& name) {
    std::vector<std::string> fields = utils::split(name, kSeparator);
    if (fields.size() != 3 && fields.size() != 4) {
        throw DecodeError(DecodeError::Kind::MalformedName, name,
                          "expected 3 or 4 fields separated by '__', got " +
                              std::to_string(fields.size()));
    }

    BackupArtifact artifact;
    size_t index = 0;
    if (fields.size() == 4) {
        artifact.hostId = fields[index++];
        if (artifact.hostId.empty()) {
            throw DecodeError(DecodeError::Kind::MalformedName, name, "empty host id");
        }
    }

    const std::string& kindToken = fields[index++];
    if (!jobKindFromString(kindToken, artifact.jobKind)) {
        throw DecodeError(DecodeError::Kind::MalformedName, name, "unknown job kind '" + kindToken + "'");
    }

    artifact.objectName = fields[index++];
    if (artifact.objectName.empty()) {
        throw DecodeError(DecodeError::Kind::MalformedName, name, "empty object name");
    }

    const std::string& timeField = fields[index];
    size_t consumed = 0;
    if (!Timestamp::parseRfc3339Prefix(timeField, artifact.timestamp, consumed)) {
        throw DecodeError(DecodeError::Kind::MalformedName, name, "invalid timestamp '" + timeField + "'");
    }

    std::string suffix = timeField.substr(consumed);
    if (!suffix.empty()) {
        if (suffix.front() != '.') {
            throw DecodeError(DecodeError::Kind::MalformedName, name,
                              "unexpected text after timestamp '" + suffix + "'");
        }
        // Compression is the last dotted suffix and only counts after the base extension,
        // as encode() writes it. A lone ".zst" or any unknown suffix means none.
        std::vector<std::string> extensions = utils::split(suffix.substr(1), ".");
        Compression compression;
        if (extensions.size() > 1 && compressionFromExtension(extensions.back(), compression)) {
            artifact.compression = compression;
        }
    }

    return artifact;
}

std::optional<BackupArtifact> BackupArtifact::tryDecode(const std::string& name, std::string* error) {
    try {
        return decode(name);
    } catch (const DecodeError& e) {
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

std::string BackupArtifact::identityKey() const {
    return hostId + kSeparator + jobKindToString(jobKind) + kSeparator + objectName;
}

bool BackupArtifact::sameIdentity(const BackupArtifact& other) const {
    return hostId == other.hostId && jobKind == other.jobKind && objectName == other.objectName;
}

bool BackupArtifact::operator==(const BackupArtifact& other) const {
    return std::tie(hostId, jobKind, objectName, timestamp, compression) ==
           std::tie(other.hostId, other.jobKind, other.objectName, other.timestamp, other.compression);
}

bool ArtifactFilter::matches(const BackupArtifact& artifact) const {
    if (!hostIds.empty() && hostIds.count(artifact.hostId) == 0) {
        return false;
    }
    if (!jobKinds.empty() && jobKinds.count(artifact.jobKind) == 0) {
        return false;
    }
    if (!objectNames.empty() && objectNames.count(artifact.objectName) == 0) {
        return false;
    }
    if (from) {
        if (from->inclusive ? artifact.timestamp < from->value : artifact.timestamp <= from->value) {
            return false;
        }
    }
    if (to) {
        if (to->inclusive ? artifact.timestamp > to->value : artifact.timestamp >= to->value) {
            return false;
        }
    }
    if (!compressions.empty()) {
        if (!artifact.compression || compressions.count(*artifact.compression) == 0) {
            return false;
        }
    }
    return true;
}

bool ArtifactFilter::isEmpty() const {
    return hostIds.empty() && jobKinds.empty() && objectNames.empty() &&
           !from && !to && compressions.empty();
}

ArtifactFilter ArtifactFilter::forIdentity(const BackupArtifact& artifact) {
    ArtifactFilter filter;
    filter.hostIds.insert(artifact.hostId);
    filter.jobKinds.insert(artifact.jobKind);
    filter.objectNames.insert(artifact.objectName);
    return filter;
}
