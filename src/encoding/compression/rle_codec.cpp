#include "kretz/encoding/compression/rle_codec.hpp"

#include <algorithm>

namespace kretz::encoding::compression {

auto to_string(rle_stop_reason reason) noexcept -> std::string_view {
    switch (reason) {
        case rle_stop_reason::end_of_input:
            return "end_of_input";
        case rle_stop_reason::end_marker:
            return "end_marker";
        case rle_stop_reason::sample_limit:
            return "sample_limit";
        case rle_stop_reason::truncated_value:
            return "truncated_value";
    }
    return "unknown";
}

rle_codec::rle_codec(std::size_t element_size) noexcept
    : element_size_(std::max<std::size_t>(element_size, 1)) {}

auto rle_codec::decode(std::span<const uint8_t> compressed,
                       std::size_t max_samples) const -> rle_decode_result {
    rle_decode_result result;
    result.data.reserve(std::min(max_samples + kMaxRunLength,
                                 compressed.size() * kMaxRunLength) *
                        element_size_);

    size_t pos = 0;
    const size_t size = compressed.size();

    while (true) {
        if (result.sample_count >= max_samples) {
            result.stop_reason = rle_stop_reason::sample_limit;
            break;
        }
        if (pos >= size) {
            result.stop_reason = rle_stop_reason::end_of_input;
            break;
        }

        const uint8_t count = compressed[pos];
        ++pos;

        if (count == kEndMarker) {
            result.stop_reason = rle_stop_reason::end_marker;
            break;
        }

        if (pos + element_size_ > size) {
            // Partial pair at the end of the stream is discarded
            pos = size;
            result.stop_reason = rle_stop_reason::truncated_value;
            break;
        }

        const auto value = compressed.subspan(pos, element_size_);
        pos += element_size_;

        // Runs are never split, so the last one may overshoot max_samples
        for (size_t i = 0; i < count; ++i) {
            result.data.insert(result.data.end(), value.begin(), value.end());
        }
        result.sample_count += count;
    }

    result.bytes_consumed = pos;
    return result;
}

}  // namespace kretz::encoding::compression
