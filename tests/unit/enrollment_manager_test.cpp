#include <cassert>
#include <filesystem>
#include <string>
#include <vector>
#include "spk/enrollment_manager.hpp"
#include "spk/similarity.hpp"
#include "spk/speaker_verifier.hpp"
#include "test_support.hpp"

using namespace testing_support;
namespace fs = std::filesystem;

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

int main() {
    const std::string dir = temp_dir("enroll");
    const float threshold = 0.25f;

    auto controls = std::make_shared<FakeControls>();
    AmplitudeHistogramEmbedder extractor(controls);
    spk::EnrollmentManager manager;

    std::vector<std::vector<float>> good{user_voice(4.0, 0), user_voice(4.0, 1), user_voice(4.0, 3)};

    // Model not ready: nothing attempted, nothing stored
    {
        spk::EnrollmentStore store(dir + "/not_ready");
        auto r = manager.enroll(extractor, good, kRate, threshold, store);
        assert(!r.success);
        assert(r.message == "Model not loaded");
        assert(controls->compute_calls == 0);
        assert(!store.has_enrollment());
    }

    extractor.load();

    // Wrong number of samples
    {
        spk::EnrollmentStore store(dir + "/count");
        auto r = manager.enroll(extractor, {good[0], good[1]}, kRate, threshold, store);
        assert(!r.success);
        assert(contains(r.message, "Expected 3"));
        assert(!store.has_enrollment());
    }

    // Too-short sample is named
    {
        spk::EnrollmentStore store(dir + "/short");
        auto r = manager.enroll(extractor, {good[0], user_voice(2.0), good[2]}, kRate, threshold, store);
        assert(!r.success);
        assert(contains(r.message, "Sample 2"));
        assert(!store.has_enrollment());
    }

    // Every pair is checked: 1~2 and 2~3 agree but 1 vs 3 does not
    {
        spk::EnrollmentStore store(dir + "/chain");
        std::vector<std::vector<float>> chain{
            tone(4.0, 0.1f),
            concat({tone(2.0, 0.1f), tone(2.0, 0.3f)}),
            tone(4.0, 0.3f)};
        auto r = manager.enroll(extractor, chain, kRate, threshold, store);
        assert(!r.success);
        assert(r.failed_pair && r.failed_pair->first == 1 && r.failed_pair->second == 3);
        assert(near(r.failed_score, 0.0));
        assert(contains(r.message, "Samples 1 and 3 are too different"));
        assert(!store.has_enrollment());
        assert(!fs::exists(store.directory()) || fs::is_empty(store.directory()));
    }

    // Success: centroid is the mean of the per-sample embeddings
    {
        spk::EnrollmentStore store(dir + "/ok");
        auto r = manager.enroll(extractor, good, kRate, threshold, store);
        assert(r.success);
        assert(r.message == "Voice enrollment successful");
        assert(r.centroid);

        std::vector<spk::Embedding> expected_embs;
        for (const auto& s : good) expected_embs.push_back(AmplitudeHistogramEmbedder::histogram(s));
        auto expected = spk::mean_embedding(expected_embs);
        assert(r.centroid->size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) assert(near((*r.centroid)[i], expected[i], 1e-6));

        auto record = store.load_record();
        assert(record);
        assert(record->embeddings.size() == 3);
        assert(record->embeddings[1] == expected_embs[1]);
        assert(record->metadata.sample_count == 3);
        assert(near(record->metadata.threshold, threshold));
        assert(record->metadata.embedding_dim == spk::EMBEDDING_DIM);
        assert(!record->metadata.created.empty());

        // A failed re-enrollment leaves the previous record untouched
        auto before = store.load_centroid();
        std::vector<std::vector<float>> bad{good[0], good[1], tone(4.0, 0.5f)};
        auto r2 = manager.enroll(extractor, bad, kRate, threshold, store);
        assert(!r2.success);
        assert(r2.failed_pair && r2.failed_pair->first == 1 && r2.failed_pair->second == 3);
        assert(store.load_centroid() == before);

        // A freshly constructed verifier over the same storage sees the enrollment
        spk::SpeakerVerifier verifier(std::make_unique<AmplitudeHistogramEmbedder>());
        assert(!verifier.is_enrolled());
        assert(verifier.load_enrollment(store));
        assert(verifier.is_enrolled());
    }

    // Failed first enrollment: a fresh verifier over that storage stays unenrolled
    {
        spk::EnrollmentStore store(dir + "/never");
        std::vector<std::vector<float>> bad{good[0], tone(4.0, 0.5f), good[2]};
        auto r = manager.enroll(extractor, bad, kRate, threshold, store);
        assert(!r.success);
        assert(r.failed_pair && r.failed_pair->first == 1 && r.failed_pair->second == 2);
        spk::SpeakerVerifier verifier(std::make_unique<AmplitudeHistogramEmbedder>());
        assert(!verifier.load_enrollment(store));
        assert(!verifier.is_enrolled());
    }

    // Samples past max_sample_seconds are trimmed before extraction
    {
        spk::EnrollmentStore store(dir + "/trim");
        controls->calls.clear();
        std::vector<std::vector<float>> long_takes{
            concat({user_voice(8.0), tone(2.0, 0.5f)}),
            user_voice(4.0, 1),
            user_voice(4.0, 2)};
        auto r = manager.enroll(extractor, long_takes, kRate, threshold, store);
        assert(r.success);
        assert(controls->calls[0].first == static_cast<size_t>(8 * kRate));
        assert(controls->calls[1].first == static_cast<size_t>(4 * kRate));
    }

    // Extraction failures propagate
    {
        spk::EnrollmentStore store(dir + "/throw");
        controls->fail_compute = true;
        bool threw = false;
        try {
            manager.enroll(extractor, good, kRate, threshold, store);
        } catch (const spk::EmbeddingError&) {
            threw = true;
        }
        controls->fail_compute = false;
        assert(threw);
        assert(!store.has_enrollment());
    }

    fs::remove_all(dir);
    return 0;
}
