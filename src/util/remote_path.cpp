#include "remote_path.hpp"
#include "string_utils.hpp"

namespace RemotePath {

std::vector<std::string> segments(const std::string& path) {
    std::string unified = path;
    for (char& c : unified) {
        if (c == '\\') c = '/';
    }

    std::vector<std::string> out;
    for (const auto& part : StringUtils::split(unified, '/')) {
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (!out.empty()) out.pop_back();
            continue;
        }
        out.push_back(part);
    }
    return out;
}

std::string normalize(const std::string& path) {
    std::string out;
    for (const auto& seg : segments(path)) {
        out += "/";
        out += seg;
    }
    return out.empty() ? "/" : out;
}

std::string join(const std::string& base, const std::string& name) {
    return normalize(base + "/" + name);
}

std::string parent(const std::string& path) {
    auto segs = segments(path);
    if (segs.size() <= 1) return "/";
    segs.pop_back();
    std::string out;
    for (const auto& seg : segs) out += "/" + seg;
    return out;
}

std::string basename(const std::string& path) {
    auto segs = segments(path);
    return segs.empty() ? "" : segs.back();
}

std::string relative_to(const std::string& root, const std::string& path) {
    std::string r = normalize(root);
    std::string p = normalize(path);
    if (r == p) return "";
    std::string prefix = (r == "/") ? "/" : r + "/";
    if (p.compare(0, prefix.size(), prefix) != 0) return "";
    return p.substr(prefix.size());
}

}
