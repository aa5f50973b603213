#ifndef KRETZ_ENCODING_COMPRESSION_RLE_CODEC_HPP
#define KRETZ_ENCODING_COMPRESSION_RLE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace kretz::encoding::compression {

/**
 * @brief Why an RLE decode pass stopped.
 */
enum class rle_stop_reason {
    end_of_input,     ///< All input bytes were consumed
    end_marker,       ///< A count byte of 0 was read
    sample_limit,     ///< At least the requested number of samples was produced
    truncated_value   ///< Input ended inside a value field
};

[[nodiscard]] auto to_string(rle_stop_reason reason) noexcept -> std::string_view;

/**
 * @brief Output of an RLE decode pass.
 */
struct rle_decode_result {
    /// Decoded samples, little-endian, element_size bytes each
    std::vector<uint8_t> data;

    /// Number of decoded samples (data.size() / element_size)
    std::size_t sample_count{0};

    /// Number of input bytes consumed, including the end marker
    std::size_t bytes_consumed{0};

    rle_stop_reason stop_reason{rle_stop_reason::end_of_input};
};

/**
 * @brief Run-length decoder for Kretz voxel payloads.
 *
 * The compressed stream is a sequence of pairs:
 *
 *   [count : 1 byte][value : element_size bytes, little-endian]
 *
 * Each pair expands to @c count copies of @c value. Decoding stops at the end
 * of the input, at a count of 0 (end marker), once @c max_samples samples are
 * produced, or when the last value field is shorter than element_size (the
 * partial pair is dropped). None of these is an error; callers compare
 * sample_count with the expected count to detect short or long payloads.
 *
 * Runs are expanded whole. A run that crosses @c max_samples is not split,
 * so sample_count may exceed it by up to kMaxRunLength - 1.
 *
 * Sample bytes are copied verbatim, so the decoder is independent of the
 * sample type and of the host byte order.
 *
 * Thread Safety:
 * - decode() is const and may be called concurrently
 */
class rle_codec final {
public:
    /// Count byte value that terminates the stream
    static constexpr uint8_t kEndMarker = 0;

    /// Largest repeat count of a single pair
    static constexpr std::size_t kMaxRunLength = 255;

    /**
     * @brief Constructs a decoder for samples of the given width.
     * @param element_size Sample width in bytes (1, 2, 4 or 8)
     */
    explicit rle_codec(std::size_t element_size) noexcept;

    [[nodiscard]] auto element_size() const noexcept -> std::size_t { return element_size_; }

    /**
     * @brief Decodes a compressed payload.
     *
     * @param compressed Compressed bytes (may be empty)
     * @param max_samples Decoding stops once this many samples are produced;
     *        the run that reaches it is expanded in full
     * @return Decoded samples and the stop reason
     */
    [[nodiscard]] auto decode(std::span<const uint8_t> compressed,
                              std::size_t max_samples) const -> rle_decode_result;

private:
    std::size_t element_size_;
};

}  // namespace kretz::encoding::compression

#endif  // KRETZ_ENCODING_COMPRESSION_RLE_CODEC_HPP
