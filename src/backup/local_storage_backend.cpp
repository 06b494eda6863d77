#include "backup/local_storage_backend.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <future>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>
#include <openssl/evp.h>
#include <zlib.h>
#include <zstd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class ArtifactWriter {
public:
    virtual ~ArtifactWriter() = default;
    virtual void write(const char* data, size_t size) = 0;
    virtual void close() = 0;
};

class PlainFileWriter : public ArtifactWriter {
public:
    explicit PlainFileWriter(const fs::path& path) {
        file_ = std::fopen(path.c_str(), "wb");
        if (!file_) {
            throw std::runtime_error("Failed to open " + path.string() + ": " + strerror(errno));
        }
    }

    ~PlainFileWriter() override {
        if (file_) {
            std::fclose(file_);
        }
    }

    void write(const char* data, size_t size) override {
        if (std::fwrite(data, 1, size, file_) != size) {
            throw std::runtime_error(std::string("Write failed: ") + strerror(errno));
        }
    }

    void close() override {
        FILE* file = file_;
        file_ = nullptr;
        if (std::fflush(file) != 0 || fsync(fileno(file)) != 0) {
            std::string reason = strerror(errno);
            std::fclose(file);
            throw std::runtime_error("Failed to flush artifact: " + reason);
        }
        if (std::fclose(file) != 0) {
            throw std::runtime_error(std::string("Failed to close artifact: ") + strerror(errno));
        }
    }

private:
    FILE* file_{nullptr};
};

class GzipFileWriter : public ArtifactWriter {
public:
    explicit GzipFileWriter(const fs::path& path) {
        file_ = gzopen(path.c_str(), "wb");
        if (!file_) {
            throw std::runtime_error("Failed to open gzip file " + path.string() + " for writing");
        }
    }

    ~GzipFileWriter() override {
        if (file_) {
            gzclose(file_);
        }
    }

    void write(const char* data, size_t size) override {
        if (gzwrite(file_, data, static_cast<unsigned>(size)) != static_cast<int>(size)) {
            int code = 0;
            std::string message = gzerror(file_, &code);
            throw std::runtime_error("gzip write failed: " + message);
        }
    }

    void close() override {
        gzFile file = file_;
        file_ = nullptr;
        int result = gzclose(file);
        if (result != Z_OK) {
            throw std::runtime_error("gzip close failed with code " + std::to_string(result));
        }
    }

private:
    gzFile file_{nullptr};
};

// Streams one zstd frame into a plain file
class ZstdFileWriter : public ArtifactWriter {
public:
    explicit ZstdFileWriter(const fs::path& path)
        : file_(path)
        , ctx_(ZSTD_createCCtx(), ZSTD_freeCCtx)
        , output_(ZSTD_CStreamOutSize()) {
        if (!ctx_) {
            throw std::runtime_error("Failed to create zstd compression context");
        }
        check(ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_compressionLevel, ZSTD_CLEVEL_DEFAULT));
    }

    void write(const char* data, size_t size) override {
        ZSTD_inBuffer input{data, size, 0};
        while (input.pos < input.size) {
            ZSTD_outBuffer output{output_.data(), output_.size(), 0};
            check(ZSTD_compressStream2(ctx_.get(), &output, &input, ZSTD_e_continue));
            file_.write(output_.data(), output.pos);
        }
    }

    void close() override {
        ZSTD_inBuffer input{nullptr, 0, 0};
        size_t remaining = 0;
        do {
            ZSTD_outBuffer output{output_.data(), output_.size(), 0};
            remaining = check(ZSTD_compressStream2(ctx_.get(), &output, &input, ZSTD_e_end));
            file_.write(output_.data(), output.pos);
        } while (remaining != 0);
        file_.close();
    }

private:
    static size_t check(size_t result) {
        if (ZSTD_isError(result)) {
            throw std::runtime_error(std::string("zstd compression failed: ") + ZSTD_getErrorName(result));
        }
        return result;
    }

    PlainFileWriter file_;
    std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> ctx_;
    std::vector<char> output_;
};

class Sha256Digest {
public:
    Sha256Digest() : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
    }

    void update(const char* data, size_t size) {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }

    std::string hex() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash, &hashLen) != 1) {
            throw std::runtime_error("Failed to finalize SHA-256 digest");
        }
        std::stringstream ss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

} // namespace

LocalStorageBackend::LocalStorageBackend(const std::string& name,
                                         const fs::path& directory,
                                         RetentionPolicy retention,
                                         std::optional<Compression> compression)
    : StorageBackend(name, retention)
    , directory_(directory)
    , compression_(compression) {}

fs::path LocalStorageBackend::pathFor(const BackupArtifact& artifact) const {
    return directory_ / artifact.encode(true);
}

void LocalStorageBackend::initialize() {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw BackendInitError(name_, "cannot create " + directory_.string() + ": " + ec.message());
    }
    if (!fs::is_directory(directory_, ec)) {
        throw BackendInitError(name_, directory_.string() + " is not a directory");
    }
    Logger::info("Local storage '" + name_ + "' ready at " + directory_.string());
}

std::vector<BackupArtifact> LocalStorageBackend::list(const ArtifactFilter& filter) {
    std::vector<BackupArtifact> artifacts;
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        throw std::runtime_error("Failed to read " + directory_.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) {
            continue;
        }
        std::string fileName = entry.path().filename().string();
        // In-flight writes
        if (fileName.empty() || fileName.front() == '.') {
            continue;
        }

        std::string error;
        std::optional<BackupArtifact> artifact = BackupArtifact::tryDecode(fileName, &error);
        if (!artifact) {
            Logger::warning("Skipping unrecognized file in storage '" + name_ + "': " + error);
            continue;
        }
        // Only files this backend would have written; remove() deletes pathFor(artifact)
        if (artifact->encode(true) != fileName) {
            Logger::warning("Skipping foreign file in storage '" + name_ + "': " + fileName);
            continue;
        }

        uint64_t size = entry.file_size(entryEc);
        if (!entryEc) {
            artifact->size = size;
        }

        if (filter.matches(*artifact)) {
            artifacts.push_back(std::move(*artifact));
        }
    }
    return artifacts;
}

void LocalStorageBackend::remove(const BackupArtifact& artifact) {
    fs::path path = pathFor(artifact);
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        if (ec) {
            throw RotationError("Failed to delete " + path.string() + ": " + ec.message());
        }
        Logger::warning("Artifact already gone: " + path.string());
        return;
    }
    Logger::debug("Deleted " + path.string());
}

void LocalStorageBackend::consumeExportStream(const BackupArtifact& artifact, ByteStream& out, ByteStream& err) {
    const std::string fileName = artifact.encode(true);
    const fs::path finalPath = directory_ / fileName;
    const fs::path tempPath = directory_ / ("." + fileName + ".partial");

    Sha256Digest sha;
    auto errFuture = std::async(std::launch::async, [&err]() {
        std::string kept;
        ByteStream::drain(err, &kept);
        return kept;
    });

    std::string failure;
    uint64_t totalBytes = 0;
    std::string digest;
    std::unique_ptr<ArtifactWriter> writer;

    try {
        if (compression_ == Compression::Gzip) {
            writer = std::make_unique<GzipFileWriter>(tempPath);
        } else if (compression_ == Compression::Zstd) {
            writer = std::make_unique<ZstdFileWriter>(tempPath);
        } else {
            writer = std::make_unique<PlainFileWriter>(tempPath);
        }
    } catch (const std::exception& e) {
        failure = e.what();
    }

    std::vector<char> buffer(kStreamBufferSize);
    try {
        while (true) {
            size_t n = out.read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            totalBytes += n;
            // After a write error the rest of the stream is still drained so the producer
            // is not left blocked on a full pipe.
            if (!failure.empty()) {
                continue;
            }
            try {
                writer->write(buffer.data(), n);
                sha.update(buffer.data(), n);
            } catch (const std::exception& e) {
                failure = e.what();
            }
        }
    } catch (const std::exception& e) {
        if (failure.empty()) {
            failure = std::string("reading export stream failed: ") + e.what();
        }
    }

    if (failure.empty()) {
        try {
            writer->close();
            digest = sha.hex();
        } catch (const std::exception& e) {
            failure = e.what();
        }
    }
    writer.reset();

    try {
        std::string errData = errFuture.get();
        if (!errData.empty() && failure.empty()) {
            failure = "export reported errors: " + utils::trim(errData);
        }
    } catch (const std::exception& e) {
        if (failure.empty()) {
            failure = std::string("reading export error stream failed: ") + e.what();
        }
    }

    if (failure.empty()) {
        std::error_code ec;
        fs::rename(tempPath, finalPath, ec);
        if (ec) {
            failure = "cannot move artifact into place: " + ec.message();
        }
    }

    if (!failure.empty()) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        if (ec) {
            Logger::error("Failed to remove partial artifact " + tempPath.string() + ": " + ec.message());
        }
        throw StreamConsumptionError("Failed to store " + fileName + " on storage '" + name_ + "': " + failure);
    }

    Logger::info("Stored " + finalPath.string() + " (" + std::to_string(totalBytes) +
                 " bytes, sha256 " + digest + ")");
}
