#pragma once

#include "model/build.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace forge {

// Already-authenticated caller. Authorization happens before these calls.
struct CallerIdentity {
    std::string id;
    std::string email;
    std::string role;

    bool IsAdmin() const { return role == "admin"; }
};

struct ProjectFiles {
    std::string id;
    std::string name;
    std::string board_type;
    std::vector<SourceFile> files;
};

class IProjectStore {
public:
    virtual ~IProjectStore() = default;
    virtual Result GetProjectFiles(const std::string& project_id, ProjectFiles& out) const = 0;
};

class IAuditSink {
public:
    virtual ~IAuditSink() = default;
    virtual void Record(const CallerIdentity& actor,
                        const std::string& action,
                        const std::string& resource,
                        const std::string& details) = 0;
};

// Serves `<root>/<project_id>/` as a project: every regular file in the
// directory and in its src/ and include/ subdirectories. An optional
// project.json supplies "name" and "board_type".
class DirectoryProjectStore final : public IProjectStore {
public:
    static constexpr const char* kProjectFileName = "project.json";

    DirectoryProjectStore(std::string root_dir, std::string default_board_type);

    Result GetProjectFiles(const std::string& project_id, ProjectFiles& out) const override;

private:
    std::string root_;
    std::string default_board_;
};

// Audit records go to the process log at Info level.
class LoggingAuditSink final : public IAuditSink {
public:
    void Record(const CallerIdentity& actor,
                const std::string& action,
                const std::string& resource,
                const std::string& details) override;
};

} // namespace forge
