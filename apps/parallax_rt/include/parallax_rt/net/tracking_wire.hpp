#pragma once

#include <parallax/core/core.hpp>
#include <expected>
#include <glaze/glaze.hpp>
#include <string>
#include <string_view>
#include <system_error>

namespace parallax_rt::net {

// JSON shape of one landmarker result:
// {"timestamp":123,"face_present":true,"landmarks":[{"x":..,"y":..,"z":..}]}
// Fields may be omitted. Unknown fields are rejected.
inline std::expected<parallax::core::TrackingSample, std::string>
DecodeTrackingSample(std::string_view payload) {
    parallax::core::TrackingSample sample{};
    std::string buffer(payload);
    if (auto ec = glz::read_json(sample, buffer))
        return std::unexpected(glz::format_error(ec, buffer));

    // A frame that claims a face but carries no points is no detection
    if (sample.landmarks.empty())
        sample.face_present = false;
    return sample;
}

inline std::expected<std::string, std::error_code>
EncodeTrackingSample(const parallax::core::TrackingSample &sample) {
    std::string buffer;
    if (auto ec = glz::write_json(sample, buffer))
        return std::unexpected(std::make_error_code(std::errc::bad_message));
    return buffer;
}

} // namespace parallax_rt::net
