#ifndef CALIBSET_ERRORS_HPP
#define CALIBSET_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace calib {

// Root of every fatal condition raised by the dataset builder.
// Per-image failures are not exceptions, see ItemOutcome.
class CalibError : public std::runtime_error {
public:
    explicit CalibError(const std::string& what) : std::runtime_error(what) {}
};

// Bad arguments or an unusable source directory. Raised before any work is done.
class ValidationError : public CalibError {
public:
    explicit ValidationError(const std::string& what) : CalibError(what) {}
};

class NotFoundError : public ValidationError {
public:
    explicit NotFoundError(const std::string& what) : ValidationError(what) {}
};

class NotADirectoryError : public ValidationError {
public:
    explicit NotADirectoryError(const std::string& what) : ValidationError(what) {}
};

// A stage produced nothing the quantizer could use.
class EmptyResultError : public CalibError {
public:
    explicit EmptyResultError(const std::string& what) : CalibError(what) {}
};

class EmptyCorpusError : public EmptyResultError {
public:
    explicit EmptyCorpusError(const std::string& what) : EmptyResultError(what) {}
};

class EmptyManifestError : public EmptyResultError {
public:
    explicit EmptyManifestError(const std::string& what) : EmptyResultError(what) {}
};

// Filesystem failure at a stage boundary (output directory, manifest).
class IOError : public CalibError {
public:
    explicit IOError(const std::string& what) : CalibError(what) {}
};

} // namespace calib

#endif // CALIBSET_ERRORS_HPP
