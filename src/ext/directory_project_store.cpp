#include "ext/collaborators.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace forge {

namespace {

Result ReadWholeFile(const fs::path& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ErrorCode::Io, "cannot read " + path.string());
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    if (is.bad()) {
        return Result::Fail(ErrorCode::Io, "read error in " + path.string());
    }
    out = ss.str();
    return Result::Ok();
}

Result CollectFiles(const fs::path& dir, std::vector<SourceFile>& out) {
    std::error_code ec;
    std::vector<fs::path> paths;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        if (it->path().filename() == DirectoryProjectStore::kProjectFileName)
            continue;
        paths.push_back(it->path());
    }
    if (ec) {
        return Result::Fail(ErrorCode::Io, "cannot list " + dir.string() + ": " + ec.message(), ec.value());
    }

    // Directory order is unspecified; keep builds reproducible.
    std::sort(paths.begin(), paths.end());
    for (const auto& p : paths) {
        SourceFile file;
        file.name = p.filename().string();
        auto r = ReadWholeFile(p, file.content);
        if (!r.is_ok())
            return r;
        out.push_back(std::move(file));
    }
    return Result::Ok();
}

} // namespace

DirectoryProjectStore::DirectoryProjectStore(std::string root_dir, std::string default_board_type)
    : root_(std::move(root_dir)), default_board_(std::move(default_board_type)) {}

Result DirectoryProjectStore::GetProjectFiles(const std::string& project_id, ProjectFiles& out) const {
    const fs::path dir = root_.empty() ? fs::path(project_id) : fs::path(root_) / project_id;

    std::error_code ec;
    if (project_id.empty() || !fs::is_directory(dir, ec)) {
        return Result::Fail(ErrorCode::NotFound, "Project not found: " + project_id);
    }

    ProjectFiles project;
    project.id = project_id;
    project.name = dir.filename().string();
    if (project.name.empty() || project.name == ".")
        project.name = fs::absolute(dir, ec).lexically_normal().parent_path().filename().string();
    project.board_type = default_board_;

    const fs::path meta = dir / kProjectFileName;
    if (fs::exists(meta, ec)) {
        nlohmann::json j;
        auto r = config::detail::LoadJsonObjectFromFile(meta.string(), j);
        if (!r.is_ok())
            return r;
        if (r = config::detail::GetStringIfPresent(j, "name", project.name); !r.is_ok())
            return r;
        if (r = config::detail::GetStringIfPresent(j, "board_type", project.board_type); !r.is_ok())
            return r;
    }

    for (const char* sub : {"", "src", "include"}) {
        const fs::path d = *sub ? dir / sub : dir;
        if (!fs::is_directory(d, ec))
            continue;
        auto r = CollectFiles(d, project.files);
        if (!r.is_ok())
            return r;
    }

    if (project.files.empty()) {
        LogWarn("Project %s has no source files", project_id.c_str());
    }
    out = std::move(project);
    return Result::Ok();
}

} // namespace forge
