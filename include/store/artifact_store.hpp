#pragma once

#include "io/file_reader.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace forge {

struct ArtifactRef {
    std::string file;  // "{build_id}.bin", relative to the store root
    std::string path;
    std::uint64_t size = 0;
};

// Flat, write-once directory of build artifacts and their manifests.
class ArtifactStore {
public:
    explicit ArtifactStore(std::string root_dir);

    Result Init() const;

    static std::string ArtifactFileName(const std::string& build_id);
    static std::string ManifestFileName(const std::string& build_id);

    Result Put(const std::string& build_id, const std::string& source_path, ArtifactRef& out) const;
    Result PutManifest(const std::string& build_id,
                       const std::string& manifest_json,
                       std::string& out_file) const;

    bool Exists(const std::string& file) const;
    std::string PathOf(const std::string& file) const;
    Result OpenArtifact(const std::string& file, FileReader& out) const;

    const std::string& Root() const { return root_; }

private:
    Result WriteOnce(const std::string& file, const std::string& source_path, std::uint64_t& written) const;
    Result WriteOnceBytes(const std::string& file, const std::string& bytes) const;

    std::string root_;
};

} // namespace forge
