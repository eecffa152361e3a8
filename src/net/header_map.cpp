#include <quire/net/header_map.h>
#include <algorithm>
#include <cctype>

namespace quire::net {

std::string HeaderMap::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    auto key = normalize_name(name);
    headers_.erase(key);
    headers_.emplace(key, value);
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    headers_.emplace(normalize_name(name), value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool HeaderMap::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

void HeaderMap::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

size_t HeaderMap::size() const {
    return headers_.size();
}

bool HeaderMap::empty() const {
    return headers_.empty();
}

} // namespace quire::net
