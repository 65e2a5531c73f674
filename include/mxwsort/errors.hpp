#pragma once

#include <stdexcept>
#include <string>

namespace mxwsort {

/**
 * @brief Base class of every error raised by the library
 *
 * Messages carry the file path, stream and offending values so a failure
 * can be diagnosed from the log line alone.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// No recognised on-disk structure for a stream
class LayoutResolutionError : public Error {
public:
    using Error::Error;
};

/// Parameters fail validation (band ordering, well selection, time window)
class ConfigValidationError : public Error {
public:
    using Error::Error;
};

/// Required spike-sort output arrays are absent
class MissingOutputError : public Error {
public:
    using Error::Error;
};

/// HDF5, file system or NPY failure
class IoError : public Error {
public:
    using Error::Error;
};

/// External spike-sorting engine did not complete
class SpikeSortError : public Error {
public:
    using Error::Error;
};

}  // namespace mxwsort
