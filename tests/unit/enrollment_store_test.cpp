#include <cassert>
#include <filesystem>
#include <fstream>
#include <vector>
#include "spk/enrollment_store.hpp"
#include "spk/errors.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

static spk::EnrollmentRecord make_record(int samples, float base) {
    spk::EnrollmentRecord r;
    for (int i = 0; i < samples; ++i) {
        r.embeddings.push_back({base + i, base - i, 0.5f * i});
    }
    r.centroid = {base, base, 0.25f};
    r.metadata.sample_count = samples;
    r.metadata.created = "2025-01-02 03:04:05";
    r.metadata.threshold = 0.25f;
    r.metadata.embedding_dim = 3;
    return r;
}

int main() {
    const std::string dir = testing_support::temp_dir("store");
    spk::EnrollmentStore store(dir + "/speaker");

    // Nothing stored yet
    assert(!store.has_enrollment());
    assert(!store.load_centroid());
    assert(!store.load_record());
    assert(!store.load_metadata());

    // Save and load back
    store.save(make_record(3, 1.5f));
    assert(store.has_enrollment());
    auto centroid = store.load_centroid();
    assert(centroid && *centroid == std::vector<float>({1.5f, 1.5f, 0.25f}));

    auto record = store.load_record();
    assert(record);
    assert(record->embeddings.size() == 3);
    assert(record->embeddings[2] == std::vector<float>({3.5f, -0.5f, 1.0f}));
    assert(record->metadata.sample_count == 3);
    assert(record->metadata.created == "2025-01-02 03:04:05");
    assert(testing_support::near(record->metadata.threshold, 0.25));
    assert(record->metadata.embedding_dim == 3);

    // No temporaries or backups left behind
    for (const auto& entry : fs::directory_iterator(store.directory())) {
        assert(entry.path().extension() != ".tmp");
        assert(entry.path().extension() != ".bak");
    }

    // A later save replaces the record wholesale
    store.save(make_record(2, -4.0f));
    record = store.load_record();
    assert(record->embeddings.size() == 2);
    assert(record->centroid == std::vector<float>({-4.0f, -4.0f, 0.25f}));
    assert(record->metadata.sample_count == 2);

    // Loading is side-effect free
    auto again = store.load_record();
    assert(again->centroid == record->centroid);

    // An empty centroid is never written
    {
        spk::EnrollmentStore other(dir + "/other");
        spk::EnrollmentRecord empty;
        bool threw = false;
        try {
            other.save(empty);
        } catch (const spk::StorageError&) {
            threw = true;
        }
        assert(threw);
        assert(!other.has_enrollment());
    }

    // Unwritable location: a regular file stands where the directory should be
    {
        const std::string blocker = dir + "/blocker";
        std::ofstream(blocker) << "x";
        spk::EnrollmentStore bad(blocker + "/speaker");
        bool threw = false;
        try {
            bad.save(make_record(3, 1.0f));
        } catch (const spk::StorageError&) {
            threw = true;
        }
        assert(threw);
        assert(!bad.has_enrollment());
    }

    // Corrupt centroid surfaces as StorageError
    {
        spk::EnrollmentStore corrupt(dir + "/corrupt");
        corrupt.save(make_record(3, 1.0f));
        std::ofstream(corrupt.directory() + "/centroid.bin", std::ios::trunc) << "garbage";
        bool threw = false;
        try {
            corrupt.load_centroid();
        } catch (const spk::StorageError&) {
            threw = true;
        }
        assert(threw);
    }

    // Headers claiming more data than the file holds are rejected before allocating
    {
        spk::EnrollmentStore huge(dir + "/huge");
        huge.save(make_record(3, 1.0f));
        {
            std::ofstream out(huge.directory() + "/centroid.bin", std::ios::binary | std::ios::trunc);
            const unsigned char header[16] = {'S', 'G', 'E', 'M', 1, 0, 0, 0,
                                              1, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0x7F};
            out.write(reinterpret_cast<const char*>(header), sizeof(header));
        }
        bool threw = false;
        try {
            huge.load_centroid();
        } catch (const spk::StorageError&) {
            threw = true;
        }
        assert(threw);

        // Plausible dim but a payload shorter than the header implies
        {
            std::ofstream out(huge.directory() + "/centroid.bin", std::ios::binary | std::ios::trunc);
            const unsigned char header[20] = {'S', 'G', 'E', 'M', 1, 0, 0, 0,
                                              1, 0, 0, 0, 3, 0, 0, 0, 0, 0, 0x80, 0x3F};
            out.write(reinterpret_cast<const char*>(header), sizeof(header));
        }
        threw = false;
        try {
            huge.load_centroid();
        } catch (const spk::StorageError&) {
            threw = true;
        }
        assert(threw);

        // A centroid file holding several rows is not a centroid
        huge.save(make_record(3, 1.0f));
        fs::copy_file(huge.directory() + "/embeddings.bin", huge.directory() + "/centroid.bin",
                      fs::copy_options::overwrite_existing);
        threw = false;
        try {
            huge.load_centroid();
        } catch (const spk::StorageError&) {
            threw = true;
        }
        assert(threw);
    }

    // A save that fails midway keeps the previous record intact
    {
        spk::EnrollmentStore kept(dir + "/kept");
        kept.save(make_record(3, 2.0f));
        // A non-empty directory where the metadata backup would go blocks the swap
        fs::create_directories(kept.directory() + "/metadata.json.bak/pinned");
        bool threw = false;
        try {
            kept.save(make_record(2, -1.0f));
        } catch (const spk::StorageError&) {
            threw = true;
        }
        assert(threw);
        auto previous = kept.load_record();
        assert(previous);
        assert(previous->centroid == std::vector<float>({2.0f, 2.0f, 0.25f}));
        assert(previous->embeddings.size() == 3);
        assert(previous->metadata.sample_count == 3);
        for (const auto& entry : fs::directory_iterator(kept.directory())) {
            assert(entry.path().extension() != ".tmp");
        }

        // Once the obstruction is gone the new record goes through
        fs::remove_all(kept.directory() + "/metadata.json.bak");
        kept.save(make_record(2, -1.0f));
        assert(kept.load_record()->metadata.sample_count == 2);
    }

    // Clear removes the record
    assert(store.clear());
    assert(!store.has_enrollment());
    assert(!store.load_record());
    assert(!store.clear());

    fs::remove_all(dir);
    return 0;
}
