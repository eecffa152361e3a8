#include <quire/net/response.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <zlib.h>

namespace quire::net {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

bool has_gzip_magic(const std::vector<uint8_t>& data) {
    return data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

// Try to inflate data with a specific windowBits setting.
// Returns true on success and fills 'output'; false on error.
bool try_inflate(const std::vector<uint8_t>& compressed, int window_bits,
                 std::vector<uint8_t>& output) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) return false;

    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_in = const_cast<Bytef*>(compressed.data());

    output.clear();
    output.reserve(compressed.size() * 4);

    uint8_t buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
            // Z_BUF_ERROR here means the input ended before the stream did
            inflateEnd(&strm);
            return false;
        }
        size_t have = sizeof(buffer) - strm.avail_out;
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

// gzip and zlib-wrapped deflate are auto-detected; raw deflate is the
// fallback for servers that send it under "Content-Encoding: deflate".
// Undecodable data is returned unchanged.
std::vector<uint8_t> decompress(const std::vector<uint8_t>& compressed) {
    if (compressed.empty()) return {};

    std::vector<uint8_t> result;
    if (try_inflate(compressed, 15 + 32, result)) {
        return result;
    }
    if (try_inflate(compressed, -15, result)) {
        return result;
    }
    return compressed;
}

} // namespace

std::optional<std::string> Response::content_type() const {
    auto header = headers.get("content-type");
    if (!header) {
        return std::nullopt;
    }
    std::string value = *header;
    auto semi = value.find(';');
    if (semi != std::string::npos) {
        value = value.substr(0, semi);
    }
    value = lowercase(trim(value));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string Response::body_as_string() const {
    bool encoded = has_gzip_magic(body);
    if (auto ce = headers.get("content-encoding")) {
        std::string encoding = lowercase(*ce);
        if (encoding.find("gzip") != std::string::npos ||
            encoding.find("deflate") != std::string::npos) {
            encoded = true;
        }
    }
    if (encoded) {
        std::vector<uint8_t> decoded = decompress(body);
        return std::string(decoded.begin(), decoded.end());
    }
    return std::string(body.begin(), body.end());
}

} // namespace quire::net
