#pragma once

#include <stdexcept>
#include <string>

namespace filetree {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Root path missing or not a directory.
class InvalidRoot : public Error {
public:
    using Error::Error;
};

class UnknownStyle : public Error {
public:
    using Error::Error;
};

class UnknownSortKey : public Error {
public:
    using Error::Error;
};

class MissingComparator : public Error {
public:
    using Error::Error;
};

class InvalidFilterSyntax : public Error {
public:
    using Error::Error;
};

class ConfigFileError : public Error {
public:
    using Error::Error;
};

class OutputError : public Error {
public:
    using Error::Error;
};

} // namespace filetree
