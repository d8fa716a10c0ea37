#include <cassert>
#include <stdexcept>
#include <vector>
#include "spk/speech_mask.hpp"

int main() {
    // Overlapping marks form a union
    {
        spk::SpeechMask mask(100);
        assert(!mask.any());
        mask.mark(10, 40);
        mask.mark(30, 60);
        mask.mark(80, 90);
        assert(mask.any());
        auto kept = mask.finalize();
        assert(kept.spans().size() == 2);
        assert(kept.spans()[0].begin == 10 && kept.spans()[0].end == 60);
        assert(kept.spans()[1].begin == 80 && kept.spans()[1].end == 90);
        assert(kept.covered_samples() == 60);
    }

    // Out-of-order and adjacent marks merge; a contained mark changes nothing
    {
        spk::SpeechMask mask(100);
        mask.mark(50, 70);
        mask.mark(20, 50);
        mask.mark(25, 30);
        auto kept = mask.finalize();
        assert(kept.spans().size() == 1);
        assert(kept.spans()[0].begin == 20 && kept.spans()[0].end == 70);
    }

    // Clamped to the buffer; empty ranges ignored
    {
        spk::SpeechMask mask(50);
        mask.mark(40, 500);
        mask.mark(60, 70);
        mask.mark(10, 10);
        auto kept = mask.finalize();
        assert(kept.spans().size() == 1);
        assert(kept.spans()[0].end == 50);
        assert(kept.covered_samples() == 10);
    }

    // Gather concatenates kept samples in time order without filling gaps
    {
        std::vector<float> audio(10);
        for (size_t i = 0; i < audio.size(); ++i) audio[i] = static_cast<float>(i);
        spk::SpeechMask mask(audio.size());
        mask.mark(7, 9);
        mask.mark(1, 3);
        auto out = mask.finalize().gather(audio);
        std::vector<float> expected{1.0f, 2.0f, 7.0f, 8.0f};
        assert(out == expected);
    }

    // Sealed after finalize
    {
        spk::SpeechMask mask(10);
        mask.mark(0, 5);
        auto kept = mask.finalize();
        bool threw = false;
        try {
            mask.mark(5, 10);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        assert(kept.covered_samples() == 5);
    }

    // Nothing marked
    {
        spk::SpeechMask mask(10);
        auto kept = mask.finalize();
        assert(kept.empty());
        assert(kept.gather(std::vector<float>(10, 1.0f)).empty());
    }

    return 0;
}
