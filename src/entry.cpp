#include "entry.h"

namespace dirpost {

Entry Entry::directory(const std::string& path) {
    return Entry(EntryKind::Directory, split_relative_path(path), 0);
}

Entry Entry::file(const std::string& path, uint64_t size) {
    return Entry(EntryKind::File, split_relative_path(path), size);
}

std::string Entry::path_string() const {
    return join_relative_path(relative_path);
}

const char* frame_kind_to_string(FrameKind kind) {
    switch (kind) {
        case FrameKind::Directory: return "Directory";
        case FrameKind::File: return "File";
        case FrameKind::Sentinel: return "Sentinel";
        default: return "Unknown";
    }
}

std::string join_relative_path(const RelativePath& path) {
    std::string result;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            result.push_back('/');
        }
        result += path[i];
    }
    return result;
}

RelativePath split_relative_path(const std::string& path) {
    RelativePath segments;
    if (path.empty()) {
        return segments;
    }

    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

bool is_confined_path(const std::string& path, std::string* reason) {
    auto fail = [reason](const std::string& why) {
        if (reason) {
            *reason = why;
        }
        return false;
    };

    if (path.empty()) {
        return fail("empty path");
    }
    if (path[0] == '/') {
        return fail("absolute path");
    }

    for (const auto& segment : split_relative_path(path)) {
        if (segment.empty()) {
            return fail("empty path segment");
        }
        if (segment == "." || segment == "..") {
            return fail("path traversal segment '" + segment + "'");
        }
        if (segment.find('\0') != std::string::npos) {
            return fail("NUL byte in path");
        }
        if (segment.find('\\') != std::string::npos) {
            return fail("backslash in path");
        }
    }
    return true;
}

std::string printable_path(const std::string& path) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(path.size());
    for (char ch : path) {
        uint8_t c = static_cast<uint8_t>(ch);
        if (c < 0x20 || c == 0x7F || c == '\\') {
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        } else {
            out += ch;
        }
    }
    return out;
}

bool is_valid_utf8(const std::string& data) {
    size_t i = 0;
    const size_t n = data.size();

    while (i < n) {
        uint8_t c = static_cast<uint8_t>(data[i]);
        size_t extra;
        uint32_t code_point;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }

        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = static_cast<uint8_t>(data[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range values
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && (code_point < 0x10000 || code_point > 0x10FFFF)) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

} // namespace dirpost
