#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace mxwsort {

/**
 * @brief In-memory NumPy array: shape, dtype descriptor and raw bytes
 *
 * Only C-ordered little-endian numeric arrays are represented. The dtype is
 * normalized to NumPy's descriptor form ("<i8", "<f4", "|u1", ...).
 */
struct NpyArray {
    std::vector<size_t> shape;
    std::string dtype;
    std::vector<uint8_t> data;

    size_t ndim() const { return shape.size(); }

    /// Element count; 1 for a 0-d array
    size_t size() const {
        size_t n = 1;
        for (size_t d : shape) n *= d;
        return n;
    }

    char kind() const { return dtype.size() > 1 ? dtype[1] : '\0'; }
    size_t item_size() const;

    /**
     * @brief Copy all elements converted to T, in C order
     * @throws IoError for an unsupported dtype
     */
    template <class T>
    std::vector<T> as() const;

private:
    template <class Src, class T>
    void convert_into(std::vector<T>& out) const {
        for (size_t i = 0; i < out.size(); ++i) {
            Src v;
            std::memcpy(&v, data.data() + i * sizeof(Src), sizeof(Src));
            out[i] = static_cast<T>(v);
        }
    }

    [[noreturn]] void unsupported() const;
};

template <class T>
std::vector<T> NpyArray::as() const {
    std::vector<T> out(size());
    switch (kind()) {
        case 'i':
            switch (item_size()) {
                case 1: convert_into<int8_t>(out); return out;
                case 2: convert_into<int16_t>(out); return out;
                case 4: convert_into<int32_t>(out); return out;
                case 8: convert_into<int64_t>(out); return out;
            }
            break;
        case 'u':
        case 'b':
            switch (item_size()) {
                case 1: convert_into<uint8_t>(out); return out;
                case 2: convert_into<uint16_t>(out); return out;
                case 4: convert_into<uint32_t>(out); return out;
                case 8: convert_into<uint64_t>(out); return out;
            }
            break;
        case 'f':
            switch (item_size()) {
                case 4: convert_into<float>(out); return out;
                case 8: convert_into<double>(out); return out;
            }
            break;
    }
    unsupported();
}

/// NumPy descriptor for a native arithmetic type
template <class T>
constexpr const char* npy_descr() {
    if constexpr (std::is_same_v<T, float>) return "<f4";
    else if constexpr (std::is_same_v<T, double>) return "<f8";
    else if constexpr (std::is_same_v<T, int8_t>) return "|i1";
    else if constexpr (std::is_same_v<T, uint8_t>) return "|u1";
    else if constexpr (std::is_same_v<T, int16_t>) return "<i2";
    else if constexpr (std::is_same_v<T, uint16_t>) return "<u2";
    else if constexpr (std::is_same_v<T, int32_t>) return "<i4";
    else if constexpr (std::is_same_v<T, uint32_t>) return "<u4";
    else if constexpr (std::is_same_v<T, int64_t>) return "<i8";
    else if constexpr (std::is_same_v<T, uint64_t>) return "<u8";
    else static_assert(sizeof(T) == 0, "unsupported NPY element type");
}

/**
 * @brief Wrap a typed buffer as an NpyArray
 * @param shape Must multiply out to values.size()
 */
template <class T>
NpyArray make_npy(std::span<const T> values, std::vector<size_t> shape) {
    NpyArray array;
    array.shape = std::move(shape);
    array.dtype = npy_descr<T>();
    array.data.resize(values.size_bytes());
    if (!values.empty()) {
        std::memcpy(array.data.data(), values.data(), values.size_bytes());
    }
    return array;
}

/**
 * @brief Read a .npy file (format versions 1.0, 2.0 and 3.0)
 * @throws IoError if the file is missing, truncated, Fortran-ordered,
 *         big-endian or of a non-numeric dtype
 */
NpyArray load_npy(const std::filesystem::path& path);

/**
 * @brief Write a .npy file in format version 1.0
 * @throws IoError on a shape/data mismatch or a write failure
 */
void save_npy(const std::filesystem::path& path, const NpyArray& array);

}  // namespace mxwsort
