#pragma once

#include <stdexcept>
#include <string>

// Conditions that abort the whole run. main() turns them into exit code 1.
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Main page or search page could not be retrieved.
class FetchError : public FatalError {
public:
    using FatalError::FatalError;
};

class OutputDirError : public FatalError {
public:
    using FatalError::FatalError;
};

class UnsupportedProviderError : public FatalError {
public:
    using FatalError::FatalError;
};

// Bad or missing command line input.
class UsageError : public FatalError {
public:
    using FatalError::FatalError;
};

// Per-file failure in the tag pass; never escapes TagRewriter::retag.
class TagError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
