#include "build/build_workspace.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace forge {

namespace {

class PosixSystemOps final : public BuildWorkspace::ISystemOps {
  public:
    Result CreateScratchDir(std::string_view base_dir,
                            std::string_view prefix,
                            std::string& out_dir) const override {
        std::error_code ec;
        fs::path base = base_dir.empty() ? fs::temp_directory_path(ec) : fs::path(base_dir);
        if (ec) base = "/tmp";
        fs::create_directories(base, ec);

        std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int e = errno;
            return Result::Fail(ErrorCode::Io, "mkdtemp failed: " + std::string(std::strerror(e)), e);
        }

        out_dir = created;
        return Result::Ok();
    }

    Result RemoveTree(std::string_view dir) const override {
        std::error_code ec;
        fs::remove_all(fs::path(dir), ec);
        if (ec) {
            return Result::Fail(ErrorCode::Io, "remove_all failed: " + ec.message(), ec.value());
        }
        return Result::Ok();
    }
};

Result WriteTextFile(const fs::path& path, const std::string& contents) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) {
        return Result::Fail(ErrorCode::Io, "cannot open for write: " + path.string());
    }
    os.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    os.close();
    if (!os) {
        return Result::Fail(ErrorCode::Io, "write failed: " + path.string());
    }
    return Result::Ok();
}

} // namespace

std::shared_ptr<const BuildWorkspace::ISystemOps> BuildWorkspace::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

BuildWorkspace::BuildWorkspace() : system_ops_(DefaultSystemOps()) {}

BuildWorkspace::BuildWorkspace(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

BuildWorkspace::BuildWorkspace(BuildWorkspace&& other) noexcept
    : system_ops_(std::move(other.system_ops_)), dir_(std::move(other.dir_)) {
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
}

BuildWorkspace& BuildWorkspace::operator=(BuildWorkspace&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

BuildWorkspace::~BuildWorkspace() { Cleanup(); }

Result BuildWorkspace::Create(std::string_view base_dir, std::string_view prefix) {
    Cleanup();

    auto create_result = system_ops_->CreateScratchDir(base_dir, prefix, dir_);
    if (!create_result.is_ok()) {
        dir_.clear();
        return create_result;
    }

    std::error_code ec;
    fs::create_directories(fs::path(dir_) / kSourcesDir, ec);
    if (!ec) fs::create_directories(fs::path(dir_) / kHeadersDir, ec);
    if (ec) {
        Cleanup();
        return Result::Fail(ErrorCode::Io, "cannot create workspace layout: " + ec.message());
    }
    return Result::Ok();
}

std::string BuildWorkspace::PathOf(std::string_view relative) const {
    return (fs::path(dir_) / relative).string();
}

Result BuildWorkspace::WriteConfig(const std::string& contents) const {
    if (dir_.empty()) return Result::Fail(ErrorCode::PreconditionFailed, "workspace not created");
    return WriteTextFile(fs::path(dir_) / kConfigFileName, contents);
}

Result BuildWorkspace::AddFile(const SourceFile& file, std::string& out_placed_name) const {
    if (dir_.empty()) return Result::Fail(ErrorCode::PreconditionFailed, "workspace not created");

    const std::string safe_name = SanitizeFileName(file.name);
    const std::string_view subdir = IsHeaderFile(safe_name) ? kHeadersDir : kSourcesDir;
    auto r = WriteTextFile(fs::path(dir_) / subdir / safe_name, file.content);
    if (!r.is_ok()) return r;

    out_placed_name = safe_name;
    return Result::Ok();
}

Result BuildWorkspace::Remove() {
    if (dir_.empty()) return Result::Ok();
    auto r = system_ops_->RemoveTree(dir_);
    dir_.clear();
    return r;
}

void BuildWorkspace::Cleanup() {
    if (dir_.empty()) return;
    const std::string dir = dir_;
    auto r = Remove();
    if (!r.is_ok()) {
        LogWarn("Workspace cleanup failed for %s: %s", dir.c_str(), r.msg.c_str());
    }
}

} // namespace forge
