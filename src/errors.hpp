#pragma once
#include <stdexcept>
#include <string>

namespace largefile {

// Failures opening, decoding or writing a file.
class AccessError : public std::runtime_error {
public:
    enum class Kind { NotFound, PermissionDenied, DecodeFailed, Io, WriteFailed };

    AccessError(Kind kind, const std::string& path, const std::string& cause)
        : std::runtime_error(format(kind, path, cause)),
          kind_(kind), path_(path), cause_(cause) {}

    Kind kind() const { return kind_; }
    const std::string& path() const { return path_; }
    const std::string& cause() const { return cause_; }

private:
    static std::string format(Kind kind, const std::string& path, const std::string& cause) {
        switch (kind) {
            case Kind::NotFound:         return "Cannot access file " + path + ": " + cause;
            case Kind::PermissionDenied: return "Permission denied for " + path + ": " + cause;
            case Kind::DecodeFailed:     return "Cannot decode file " + path + ": " + cause;
            case Kind::Io:               return "Cannot read file " + path + ": " + cause;
            case Kind::WriteFailed:      return "Failed to write " + path + ": " + cause;
        }
        return path + ": " + cause;
    }

    Kind kind_;
    std::string path_;
    std::string cause_;
};

class SearchError : public std::runtime_error {
public:
    enum class Kind { Unreadable, MatcherUnavailable, InvalidPattern, NoMatch };

    SearchError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// NoTarget is never thrown: replace() returns an unsuccessful EditResult and
// the edit tool reports it under this kind.
class EditError : public std::runtime_error {
public:
    enum class Kind { InvalidArgument, NoTarget, BackupFailed, WriteFailed };

    EditError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace largefile
