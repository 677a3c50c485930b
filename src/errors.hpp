#pragma once

#include <stdexcept>
#include <string>

class SourceError : public std::runtime_error {
public:
    explicit SourceError(const std::string& what) : std::runtime_error(what) {}
};

// Transport failure or an HTTP error status. Never retried here.
class NetworkError : public SourceError {
public:
    NetworkError(const std::string& what, long status = 0)
        : SourceError(what), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

class UnimplementedError : public SourceError {
public:
    explicit UnimplementedError(const std::string& what) : SourceError(what) {}
};

class HtmlParseError : public SourceError {
public:
    explicit HtmlParseError(const std::string& what) : SourceError(what) {}
};
