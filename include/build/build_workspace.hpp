#pragma once

#include "model/build.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace forge {

// Uniquely named scratch directory for one toolchain run. The directory tree
// is removed when the workspace goes out of scope; removal failures are
// logged and otherwise ignored.
class BuildWorkspace {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateScratchDir(std::string_view base_dir,
                                        std::string_view prefix,
                                        std::string& out_dir) const = 0;
        virtual Result RemoveTree(std::string_view dir) const = 0;
    };

    static constexpr std::string_view kConfigFileName = "platformio.ini";
    static constexpr std::string_view kSourcesDir = "src";
    static constexpr std::string_view kHeadersDir = "include";

    BuildWorkspace();
    explicit BuildWorkspace(std::shared_ptr<const ISystemOps> system_ops);
    BuildWorkspace(const BuildWorkspace&) = delete;
    BuildWorkspace& operator=(const BuildWorkspace&) = delete;
    BuildWorkspace(BuildWorkspace&& other) noexcept;
    BuildWorkspace& operator=(BuildWorkspace&& other) noexcept;
    ~BuildWorkspace();

    // `base_dir` empty selects the system temp directory.
    Result Create(std::string_view base_dir, std::string_view prefix);

    Result WriteConfig(const std::string& contents) const;

    // Writes into src/ or include/ by extension, under the sanitized base name.
    Result AddFile(const SourceFile& file, std::string& out_placed_name) const;

    Result Remove();

    const std::string& Dir() const { return dir_; }
    std::string PathOf(std::string_view relative) const;

    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

  private:
    void Cleanup();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
};

} // namespace forge
