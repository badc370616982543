#ifndef MAGNETMESH_COMMON_ERRORS_HPP
#define MAGNETMESH_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace magnetmesh {

// Base class for every error raised by the library
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed geometry parameters, sizing rules or options
class ValidationError : public Error {
public:
    using Error::Error;
};

// Node kind outside the set supported by the requested mode
class UnsupportedGeometryKind : public Error {
public:
    UnsupportedGeometryKind(std::string kind, const std::string& context)
        : Error("unsupported geometry kind '" + kind + "': " + context),
          kind_(std::move(kind)) {}

    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

// Two registrations produced the same semantic name (registry logic fault)
class NamingCollisionError : public Error {
public:
    explicit NamingCollisionError(std::string name)
        : Error("semantic name collision: " + name), name_(std::move(name)) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Failure reported by the geometric kernel, with the semantic path being built
class KernelOperationError : public Error {
public:
    KernelOperationError(const std::string& message, std::string path)
        : Error(path.empty() ? message : message + " [" + path + "]"),
          path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Interchange group that could not be matched to any kernel entity
class GroupResolutionError : public Error {
public:
    GroupResolutionError(std::string group, const std::string& reason)
        : Error("cannot resolve group '" + group + "': " + reason),
          group_(std::move(group)) {}

    const std::string& group() const { return group_; }

private:
    std::string group_;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_COMMON_ERRORS_HPP
