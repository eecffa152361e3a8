#include <quire/net/fetcher.h>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

namespace quire::net {

FileFetcher::FileFetcher(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

std::filesystem::path FileFetcher::resolve_path(const std::string& url) const {
    std::string_view path = url;
    constexpr std::string_view kFileScheme = "file://";
    if (path.substr(0, kFileScheme.size()) == kFileScheme) {
        path.remove_prefix(kFileScheme.size());
    }
    // A fragment never names part of the file
    auto hash = path.find('#');
    if (hash != std::string_view::npos) {
        path = path.substr(0, hash);
    }

    std::filesystem::path result(path);
    if (result.is_relative() && !base_dir_.empty()) {
        result = base_dir_ / result;
    }
    return result;
}

std::optional<Response> FileFetcher::fetch(const std::string& url) {
    std::filesystem::path path = resolve_path(url);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    Response response;
    response.status = 200;
    response.url = url;
    response.body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::nullopt;
    }
    return response;
}

} // namespace quire::net
