#include <cassert>
#include <iostream>
#include <parallax_rt/net/tracking_wire.hpp>
#include <string>

using parallax_rt::net::DecodeTrackingSample;
using parallax_rt::net::EncodeTrackingSample;

int main() {
    std::cout << "=== Testing tracking sample JSON ===" << std::endl;

    {
        std::string payload =
            R"({"timestamp":123456,"face_present":true,"landmarks":[)"
            R"({"x":0.25,"y":0.5,"z":-0.125},{"x":0.75,"y":0.5,"z":0}]})";
        auto sample = DecodeTrackingSample(payload);
        assert(sample);
        assert(sample->timestamp == 123456);
        assert(sample->face_present);
        assert(sample->landmarks.size() == 2);
        assert(sample->landmarks[0].x == 0.25f);
        assert(sample->landmarks[0].z == -0.125f);
        assert(sample->landmarks[1].x == 0.75f);
        std::cout << "  ✓ landmarker result decoded" << std::endl;
    }

    {
        auto sample = DecodeTrackingSample(R"({"timestamp":5})");
        assert(sample);
        assert(!sample->face_present && sample->landmarks.empty());

        auto empty = DecodeTrackingSample(
            R"({"timestamp":6,"face_present":true,"landmarks":[]})");
        assert(empty);
        assert(!empty->face_present && "No points means no detection");
        std::cout << "  ✓ missing landmarks read as no detection" << std::endl;
    }

    {
        auto truncated = DecodeTrackingSample(R"({"timestamp":)");
        assert(!truncated);
        assert(!truncated.error().empty());

        auto wrong_type = DecodeTrackingSample(R"({"timestamp":"soon"})");
        assert(!wrong_type);

        auto unknown = DecodeTrackingSample(R"({"timestamp":1,"pose":[1,2,3]})");
        assert(!unknown);
        std::cout << "  ✓ malformed messages rejected" << std::endl;
    }

    {
        parallax::core::TrackingSample sample{.timestamp = 42,
                                              .face_present = true};
        sample.landmarks = {{0.5f, 0.25f, 0.0f}};
        auto encoded = EncodeTrackingSample(sample);
        assert(encoded);
        auto decoded = DecodeTrackingSample(*encoded);
        assert(decoded && decoded->timestamp == 42);
        assert(decoded->landmarks.size() == 1);
        assert(decoded->landmarks[0].y == 0.25f);
        std::cout << "  ✓ encoder output is accepted by the decoder"
                  << std::endl;
    }

    std::cout << "\nAll tracking sample JSON tests passed" << std::endl;
    return 0;
}
