#pragma once
#include <stdexcept>
#include <string>

namespace spk {

// Embedding extraction failed or was attempted without a loaded model.
class EmbeddingError : public std::runtime_error {
public:
    explicit EmbeddingError(const std::string& what) : std::runtime_error(what) {}
};

// Enrollment record could not be read or written.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace spk
