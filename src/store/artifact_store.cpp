#include "store/artifact_store.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <span>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace forge {

namespace {

Result WriteAllToFd(int fd, std::span<const std::uint8_t> data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorCode::Io, std::string("write failed: ") + std::strerror(errno), errno);
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result CreateExclusive(const std::string& path, Fd& out) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int e = errno;
        if (e == EEXIST) {
            return Result::Fail(ErrorCode::PreconditionFailed, "artifact already stored: " + path, e);
        }
        return Result::Fail(ErrorCode::Io, "cannot create " + path + ": " + std::strerror(e), e);
    }
    out.Reset(fd);
    return Result::Ok();
}

} // namespace

ArtifactStore::ArtifactStore(std::string root_dir) : root_(std::move(root_dir)) {}

Result ArtifactStore::Init() const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return Result::Fail(ErrorCode::Io, "cannot create artifact dir " + root_ + ": " + ec.message());
    }
    return Result::Ok();
}

std::string ArtifactStore::ArtifactFileName(const std::string& build_id) {
    return build_id + ".bin";
}

std::string ArtifactStore::ManifestFileName(const std::string& build_id) {
    return build_id + "_manifest.json";
}

std::string ArtifactStore::PathOf(const std::string& file) const {
    return (fs::path(root_) / SanitizeFileName(file, "_")).string();
}

bool ArtifactStore::Exists(const std::string& file) const {
    if (file.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(PathOf(file), ec);
}

Result ArtifactStore::WriteOnce(const std::string& file,
                                const std::string& source_path,
                                std::uint64_t& written) const {
    FileReader src;
    auto open_res = FileReader::Open(source_path, src);
    if (!open_res.is_ok()) return open_res;

    const std::string dest = PathOf(file);
    Fd out;
    auto create_res = CreateExclusive(dest, out);
    if (!create_res.is_ok()) return create_res;

    std::vector<std::uint8_t> buf(64 * 1024);
    written = 0;
    while (true) {
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            out.Close();
            ::unlink(dest.c_str());
            return Result::Fail(ErrorCode::Io, "read failed: " + source_path);
        }
        auto wr = WriteAllToFd(out.Get(), std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) {
            out.Close();
            ::unlink(dest.c_str());
            return wr;
        }
        written += static_cast<std::uint64_t>(n);
    }

    if (::fsync(out.Get()) != 0) {
        LogWarn("fsync failed for %s: %s", dest.c_str(), std::strerror(errno));
    }
    return Result::Ok();
}

Result ArtifactStore::WriteOnceBytes(const std::string& file, const std::string& bytes) const {
    const std::string dest = PathOf(file);
    Fd out;
    auto create_res = CreateExclusive(dest, out);
    if (!create_res.is_ok()) return create_res;

    auto wr = WriteAllToFd(out.Get(),
                           std::span<const std::uint8_t>(
                               reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()));
    if (!wr.is_ok()) {
        out.Close();
        ::unlink(dest.c_str());
    }
    return wr;
}

Result ArtifactStore::Put(const std::string& build_id,
                          const std::string& source_path,
                          ArtifactRef& out) const {
    if (build_id.empty()) return Result::Fail(ErrorCode::InvalidArgument, "empty build id");

    const std::string file = ArtifactFileName(build_id);
    std::uint64_t written = 0;
    auto r = WriteOnce(file, source_path, written);
    if (!r.is_ok()) return r;

    out.file = file;
    out.path = PathOf(file);
    out.size = written;
    LogDebug("Artifact stored: %s (%llu bytes)", out.path.c_str(), (unsigned long long)written);
    return Result::Ok();
}

Result ArtifactStore::PutManifest(const std::string& build_id,
                                  const std::string& manifest_json,
                                  std::string& out_file) const {
    if (build_id.empty()) return Result::Fail(ErrorCode::InvalidArgument, "empty build id");

    const std::string file = ManifestFileName(build_id);
    auto r = WriteOnceBytes(file, manifest_json);
    if (!r.is_ok()) return r;
    out_file = file;
    return Result::Ok();
}

Result ArtifactStore::OpenArtifact(const std::string& file, FileReader& out) const {
    if (!Exists(file)) {
        return Result::Fail(ErrorCode::NotFound, "Artifact file not found on disk: " + file);
    }
    return FileReader::Open(PathOf(file), out);
}

} // namespace forge
