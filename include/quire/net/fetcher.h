#pragma once
#include <quire/net/response.h>
#include <filesystem>
#include <optional>
#include <string>

namespace quire::net {

// Source of raw resources. Implementations return nullopt when the
// resource cannot be obtained; they must be callable from several threads.
class ResourceFetcher {
public:
    virtual ~ResourceFetcher() = default;
    virtual std::optional<Response> fetch(const std::string& url) = 0;
};

// Reads local files. Accepts plain paths and file:// URLs; relative paths
// resolve against the base directory. No Content-Type is declared, so the
// resolver falls back on the file extension.
class FileFetcher : public ResourceFetcher {
public:
    explicit FileFetcher(std::filesystem::path base_dir = {});

    std::optional<Response> fetch(const std::string& url) override;

    const std::filesystem::path& base_dir() const { return base_dir_; }

private:
    std::filesystem::path base_dir_;

    std::filesystem::path resolve_path(const std::string& url) const;
};

} // namespace quire::net
