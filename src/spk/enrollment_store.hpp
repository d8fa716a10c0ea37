#pragma once

#include "spk/embedding_extractor.hpp"
#include <optional>
#include <string>
#include <vector>

namespace spk {

struct EnrollmentMetadata {
    int sample_count = 0;
    std::string created;        // "YYYY-MM-DD HH:MM:SS", local time
    float threshold = 0.0f;     // pairwise threshold in force at enrollment
    int embedding_dim = 0;
};

struct EnrollmentRecord {
    std::vector<Embedding> embeddings;  // one per sample, in sample order
    Embedding centroid;
    EnrollmentMetadata metadata;
};

/**
 * @brief One enrollment record per installation, stored in a directory:
 *
 *   embeddings.bin   per-sample embeddings
 *   metadata.json    sample count, creation time, threshold
 *   centroid.bin     mean embedding; its presence means "enrolled"
 *
 * Vector files: "SGEM" magic, uint32 version, uint32 rows, uint32 dim, then
 * little-endian float32 row-major data.
 */
class EnrollmentStore {
public:
    explicit EnrollmentStore(std::string directory);

    const std::string& directory() const { return m_dir; }

    // Cheap presence check; does not read any file
    bool has_enrollment() const;

    /**
     * @return centroid, or nullopt when not enrolled
     * @throws StorageError if the centroid file exists but is unreadable
     */
    std::optional<Embedding> load_centroid() const;

    std::optional<EnrollmentMetadata> load_metadata() const;

    // Full record (embeddings + centroid + metadata), nullopt when not enrolled
    std::optional<EnrollmentRecord> load_record() const;

    /**
     * @brief Replace any existing record wholesale.
     *
     * Files are written to temporaries and renamed into place with the
     * centroid last, so a reader never sees a centroid without the rest.
     * @throws StorageError on any I/O failure (temporaries are removed)
     */
    void save(const EnrollmentRecord& record);

    // Remove the record. Returns true if one existed.
    bool clear();

    static std::string now_timestamp();

private:
    std::string m_dir;

    std::string path_of(const char* name) const;
};

} // namespace spk
