#include <trellis/source_path.hpp>

namespace trellis {

std::string normalize_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '\\') c = '/';
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }

    // Drop "./" segments
    std::string cleaned;
    cleaned.reserve(out.size());
    size_t i = 0;
    while (i < out.size()) {
        size_t slash = out.find('/', i);
        size_t end = slash == std::string::npos ? out.size() : slash;
        std::string seg = out.substr(i, end - i);
        if (seg == "." ) {
            i = end + 1;
            continue;
        }
        if (!cleaned.empty() && cleaned.back() != '/') cleaned.push_back('/');
        if (seg.empty() && i == 0) {
            cleaned.push_back('/');  // absolute path
        } else {
            cleaned += seg;
        }
        i = end + 1;
    }

    // Remove trailing slash (unless the entire string is "/")
    if (cleaned.size() > 1 && cleaned.back() == '/') cleaned.pop_back();
    return cleaned;
}

std::string parent_dir(const std::string& path) {
    if (path.empty() || path == "/") return "";
    auto pos = path.rfind('/');
    if (pos == std::string::npos) return "";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::vector<std::string> ancestor_dirs(const std::string& dir) {
    std::vector<std::string> out;
    std::string cur = dir;
    while (true) {
        out.push_back(cur);
        if (cur.empty()) break;
        cur = parent_dir(cur);
    }
    return out;
}

std::string file_stem(const std::string& path) {
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.find('.');
    if (dot == std::string::npos) return name;
    return name.substr(0, dot);
}

} // namespace trellis
