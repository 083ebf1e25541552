#include <libfwpkg/segment.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>

namespace fwpkg {

namespace {

struct KnownSegment {
    SegmentId id;
    const char* name;
};

const KnownSegment kKnownSegments [] = {
    { 0x100, "version.txt" },
    { 0x101, "license.xml" },
    { 0x102, "promo_flags.txt" },
    { 0x103, "update_flags.txt" },
    { 0x104, "patch_build.txt" },
    { 0x200, "ps3swu.self" },
    { 0x201, "vsh.tar" },
    { 0x202, "dots.txt" },
    { 0x203, "patch_data.pkg" },
    { 0x300, "update_files.tar" },
    { 0x501, "spkg_hdr.tar" },
    { 0x601, "ps3swu2.self" }
};

std::string stem (const std::string& name) {
    return name.substr(0, name.find('.'));
}

int digitValue (char c, unsigned base) {
    auto u = static_cast<unsigned char>(c);
    if (std::isdigit(u)) {
        return c - '0';
    }
    if (base == 16 && std::isxdigit(u)) {
        return std::tolower(u) - 'a' + 10;
    }
    return -1;
}

} // <anonymous>

boost::optional<std::string> knownSegmentName (SegmentId id) {
    auto it = std::find_if(std::begin(kKnownSegments), std::end(kKnownSegments),
        [id](const KnownSegment& k) { return k.id == id; });
    if (it == std::end(kKnownSegments)) {
        return boost::none;
    }
    return std::string(it->name);
}

boost::optional<SegmentId> segmentIdFromName (const std::string& name) {
    auto it = std::find_if(std::begin(kKnownSegments), std::end(kKnownSegments),
        [&name](const KnownSegment& k) {
            return name == k.name || name == stem(k.name);
        });
    if (it == std::end(kKnownSegments)) {
        return boost::none;
    }
    return it->id;
}

boost::optional<uint64_t> parseSegmentNumber (const std::string& text) {
    auto base = 10u;
    auto first = text.begin();
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        first += 2;
    }
    else if (text.size() > 1 && text[0] == '0') {
        // no octal
        return boost::none;
    }
    if (first == text.end()) {
        return boost::none;
    }

    const auto max = std::numeric_limits<uint64_t>::max();
    auto value = uint64_t(0);
    for (auto it = first; it != text.end(); ++it) {
        auto digit = digitValue(*it, base);
        if (digit < 0 || value > (max - uint64_t(digit)) / base) {
            return boost::none;
        }
        value = value * base + uint64_t(digit);
    }
    return value;
}

} // namespace fwpkg
