#include "mxwsort/npy_io.hpp"
#include "mxwsort/errors.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <sstream>

namespace mxwsort {

namespace {

constexpr std::array<char, 6> NPY_MAGIC = {'\x93', 'N', 'U', 'M', 'P', 'Y'};
constexpr size_t HEADER_ALIGNMENT = 64;

// ============================================================================
// Header Dictionary Parsing
// ============================================================================

/// Position just after "'key':" (or "\"key\":"), npos if absent
size_t find_value(const std::string& header, const std::string& key) {
    for (char quote : {'\'', '"'}) {
        const std::string token = std::string(1, quote) + key + quote;
        size_t pos = header.find(token);
        if (pos == std::string::npos) continue;
        pos = header.find(':', pos + token.size());
        if (pos != std::string::npos) return pos + 1;
    }
    return std::string::npos;
}

std::string parse_descr(const std::string& header, const std::filesystem::path& path) {
    size_t pos = find_value(header, "descr");
    if (pos == std::string::npos) {
        throw IoError("NPY header of " + path.string() + " has no descr");
    }
    size_t open = header.find_first_of("'\"", pos);
    if (open == std::string::npos) {
        throw IoError("NPY header of " + path.string() + " has a malformed descr");
    }
    size_t close = header.find(header[open], open + 1);
    if (close == std::string::npos) {
        throw IoError("NPY header of " + path.string() + " has a malformed descr");
    }
    return header.substr(open + 1, close - open - 1);
}

bool parse_fortran_order(const std::string& header, const std::filesystem::path& path) {
    size_t pos = find_value(header, "fortran_order");
    if (pos == std::string::npos) {
        throw IoError("NPY header of " + path.string() + " has no fortran_order");
    }
    size_t start = header.find_first_not_of(' ', pos);
    return start != std::string::npos && header.compare(start, 4, "True") == 0;
}

std::vector<size_t> parse_shape(const std::string& header, const std::filesystem::path& path) {
    size_t pos = find_value(header, "shape");
    size_t open = pos == std::string::npos ? pos : header.find('(', pos);
    size_t close = open == std::string::npos ? open : header.find(')', open);
    if (close == std::string::npos) {
        throw IoError("NPY header of " + path.string() + " has a malformed shape");
    }

    std::vector<size_t> shape;
    const char* p = header.data() + open + 1;
    const char* end = header.data() + close;
    while (p < end) {
        while (p < end && (*p == ' ' || *p == ',')) ++p;
        if (p >= end) break;
        size_t dim = 0;
        auto [next, ec] = std::from_chars(p, end, dim);
        if (ec != std::errc{}) {
            throw IoError("NPY header of " + path.string() + " has a malformed shape");
        }
        shape.push_back(dim);
        p = next;
        // Python longs may carry an 'L' suffix in old files
        if (p < end && *p == 'L') ++p;
    }
    return shape;
}

/// Normalize to "<kN" / "|k1", rejecting what NpyArray cannot hold
std::string normalize_descr(const std::string& descr, const std::filesystem::path& path) {
    if (descr.size() < 3) {
        throw IoError("Unsupported NPY dtype '" + descr + "' in " + path.string());
    }
    const char order = descr[0];
    const char kind = descr[1];
    size_t size = 0;
    auto [ptr, ec] = std::from_chars(descr.data() + 2, descr.data() + descr.size(), size);
    if (ec != std::errc{} || ptr != descr.data() + descr.size()) {
        throw IoError("Unsupported NPY dtype '" + descr + "' in " + path.string());
    }

    bool ok = false;
    switch (kind) {
        case 'i':
        case 'u': ok = size == 1 || size == 2 || size == 4 || size == 8; break;
        case 'f': ok = size == 4 || size == 8; break;
        case 'b': ok = size == 1; break;
    }
    if (!ok) {
        throw IoError("Unsupported NPY dtype '" + descr + "' in " + path.string());
    }
    if (order == '>' && size > 1) {
        throw IoError("Big-endian NPY dtype '" + descr + "' in " + path.string() + " not supported");
    }
    if (order != '<' && order != '|' && order != '=' && order != '>') {
        throw IoError("Unsupported NPY dtype '" + descr + "' in " + path.string());
    }

    return std::string(1, size == 1 ? '|' : '<') + kind + std::to_string(size);
}

std::string format_shape(const std::vector<size_t>& shape) {
    std::ostringstream ss;
    ss << '(';
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) ss << ", ";
        ss << shape[i];
    }
    if (shape.size() == 1) ss << ',';
    ss << ')';
    return ss.str();
}

}  // namespace

// ============================================================================
// NpyArray
// ============================================================================

size_t NpyArray::item_size() const {
    size_t size = 0;
    if (dtype.size() > 2) {
        std::from_chars(dtype.data() + 2, dtype.data() + dtype.size(), size);
    }
    return size;
}

void NpyArray::unsupported() const {
    throw IoError("Cannot convert NPY dtype '" + dtype + "'");
}

// ============================================================================
// Load / Save
// ============================================================================

NpyArray load_npy(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError("Cannot open NPY file: " + path.string());
    }

    std::array<char, 6> magic{};
    file.read(magic.data(), magic.size());
    if (!file || magic != NPY_MAGIC) {
        throw IoError("Not an NPY file: " + path.string());
    }

    uint8_t version[2] = {0, 0};
    file.read(reinterpret_cast<char*>(version), 2);

    uint32_t header_len = 0;
    if (version[0] == 1) {
        uint8_t len[2] = {0, 0};
        file.read(reinterpret_cast<char*>(len), 2);
        header_len = static_cast<uint32_t>(len[0]) | (static_cast<uint32_t>(len[1]) << 8);
    } else if (version[0] == 2 || version[0] == 3) {
        uint8_t len[4] = {0, 0, 0, 0};
        file.read(reinterpret_cast<char*>(len), 4);
        header_len = static_cast<uint32_t>(len[0]) | (static_cast<uint32_t>(len[1]) << 8) |
                     (static_cast<uint32_t>(len[2]) << 16) | (static_cast<uint32_t>(len[3]) << 24);
    } else {
        throw IoError("Unsupported NPY version " + std::to_string(version[0]) + " in " +
                      path.string());
    }

    std::string header(header_len, '\0');
    file.read(header.data(), header_len);
    if (!file) {
        throw IoError("Truncated NPY header in " + path.string());
    }

    if (parse_fortran_order(header, path)) {
        throw IoError("Fortran-ordered NPY arrays are not supported: " + path.string());
    }

    NpyArray array;
    array.dtype = normalize_descr(parse_descr(header, path), path);
    array.shape = parse_shape(header, path);

    const size_t bytes = array.size() * array.item_size();
    array.data.resize(bytes);
    if (bytes > 0) {
        file.read(reinterpret_cast<char*>(array.data.data()), static_cast<std::streamsize>(bytes));
        if (static_cast<size_t>(file.gcount()) != bytes) {
            throw IoError("Truncated NPY data in " + path.string() + ": expected " +
                          std::to_string(bytes) + " bytes");
        }
    }
    return array;
}

void save_npy(const std::filesystem::path& path, const NpyArray& array) {
    const size_t expected = array.size() * array.item_size();
    if (array.item_size() == 0 || array.data.size() != expected) {
        throw IoError("NPY array for " + path.string() + " has " +
                      std::to_string(array.data.size()) + " bytes, shape needs " +
                      std::to_string(expected));
    }

    std::string header = "{'descr': '" + array.dtype + "', 'fortran_order': False, 'shape': " +
                         format_shape(array.shape) + ", }";
    // magic(6) + version(2) + length(2) + header, terminated by '\n'
    const size_t unpadded = NPY_MAGIC.size() + 4 + header.size() + 1;
    const size_t padding = (HEADER_ALIGNMENT - unpadded % HEADER_ALIGNMENT) % HEADER_ALIGNMENT;
    header.append(padding, ' ');
    header.push_back('\n');

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IoError("Cannot create NPY file: " + path.string());
    }

    const uint16_t len = static_cast<uint16_t>(header.size());
    const char version[2] = {1, 0};
    const char len_bytes[2] = {static_cast<char>(len & 0xFF), static_cast<char>(len >> 8)};

    file.write(NPY_MAGIC.data(), NPY_MAGIC.size());
    file.write(version, 2);
    file.write(len_bytes, 2);
    file.write(header.data(), static_cast<std::streamsize>(header.size()));
    if (!array.data.empty()) {
        file.write(reinterpret_cast<const char*>(array.data.data()),
                   static_cast<std::streamsize>(array.data.size()));
    }
    file.close();
    if (!file) {
        throw IoError("Failed writing NPY file: " + path.string());
    }
}

}  // namespace mxwsort
