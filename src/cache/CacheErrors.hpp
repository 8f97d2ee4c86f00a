#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// Entry is absent or has expired.
class KeyNotFound : public CacheError {
public:
    explicit KeyNotFound(const std::string& key)
        : CacheError("Key not found: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// The backing store could not be reached or rejected the command.
class StoreUnavailable : public CacheError {
public:
    explicit StoreUnavailable(const std::string& message) : CacheError(message) {}
};

// A value or a set of call arguments could not be encoded or decoded.
class SerializationError : public CacheError {
public:
    explicit SerializationError(const std::string& message) : CacheError(message) {}
};

#endif // CACHEERRORS_HPP
