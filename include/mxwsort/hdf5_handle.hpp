#pragma once

#include <hdf5.h>

#include <string>
#include <utility>

namespace mxwsort::h5 {

/**
 * @brief Owning wrapper around an HDF5 identifier
 *
 * Closes the identifier with the matching H5?close function on destruction,
 * so a file opened for a recording is released on every exit path.
 */
class Handle {
public:
    using Closer = herr_t (*)(hid_t);

    Handle() = default;
    Handle(hid_t id, Closer closer) noexcept : id_(id), closer_(closer) {}

    ~Handle() { reset(); }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    Handle(Handle&& other) noexcept
        : id_(std::exchange(other.id_, H5I_INVALID_HID))
        , closer_(std::exchange(other.closer_, nullptr)) {}

    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            id_ = std::exchange(other.id_, H5I_INVALID_HID);
            closer_ = std::exchange(other.closer_, nullptr);
        }
        return *this;
    }

    hid_t get() const noexcept { return id_; }
    bool valid() const noexcept { return id_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    void reset() noexcept {
        if (id_ >= 0 && closer_) {
            closer_(id_);
        }
        id_ = H5I_INVALID_HID;
        closer_ = nullptr;
    }

private:
    hid_t id_ = H5I_INVALID_HID;
    Closer closer_ = nullptr;
};

inline Handle file(hid_t id) { return {id, H5Fclose}; }
inline Handle group(hid_t id) { return {id, H5Gclose}; }
inline Handle dataset(hid_t id) { return {id, H5Dclose}; }
inline Handle dataspace(hid_t id) { return {id, H5Sclose}; }
inline Handle datatype(hid_t id) { return {id, H5Tclose}; }
inline Handle object(hid_t id) { return {id, H5Oclose}; }

/**
 * @brief Suppresses HDF5's automatic error-stack printing for a scope
 *
 * Probing optional entries is expected to fail; those failures surface as
 * exceptions or advisory results instead of stderr noise.
 */
class ErrorSilencer {
public:
    ErrorSilencer() {
        H5Eget_auto2(H5E_DEFAULT, &saved_func_, &saved_data_);
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }

    ~ErrorSilencer() {
        H5Eset_auto2(H5E_DEFAULT, saved_func_, saved_data_);
    }

    ErrorSilencer(const ErrorSilencer&) = delete;
    ErrorSilencer& operator=(const ErrorSilencer&) = delete;

private:
    H5E_auto2_t saved_func_ = nullptr;
    void* saved_data_ = nullptr;
};

/**
 * @brief True if every component of a relative path exists below loc
 *
 * H5Lexists fails rather than returning false when an intermediate
 * component is missing, so the path is checked one link at a time.
 */
inline bool has_path(hid_t loc, const std::string& path) {
    size_t pos = 0;
    while (pos < path.size()) {
        size_t slash = path.find('/', pos);
        std::string prefix = path.substr(0, slash);
        if (H5Lexists(loc, prefix.c_str(), H5P_DEFAULT) <= 0) {
            return false;
        }
        if (slash == std::string::npos) break;
        pos = slash + 1;
    }
    return !path.empty();
}

/// Type of the object at path, H5I_BADID if it cannot be opened
inline H5I_type_t object_type(hid_t loc, const std::string& path) {
    if (!has_path(loc, path)) {
        return H5I_BADID;
    }
    Handle obj = object(H5Oopen(loc, path.c_str(), H5P_DEFAULT));
    if (!obj) {
        return H5I_BADID;
    }
    return H5Iget_type(obj.get());
}

}  // namespace mxwsort::h5
