#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace portico {

/**
 * Length-prefixed framing for the stream transport.
 *
 * Every message is a 4-byte big-endian length followed by that many bytes
 * of UTF-8 body. Requests and responses use the same framing.
 */
namespace framing {

constexpr std::size_t HEADER_SIZE = 4;
constexpr std::uint32_t DEFAULT_MAX_FRAME_BYTES = 16u * 1024u * 1024u;

/**
 * Anything bytes can be read from. read_some may return fewer bytes than
 * asked for; it returns 0 only at end of stream.
 *
 * @throws TransportError on I/O failure or timeout
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual std::size_t read_some(char* buffer, std::size_t length) = 0;
};

/**
 * Anything bytes can be written to. write_some may accept fewer bytes than
 * offered but always at least one.
 *
 * @throws TransportError on I/O failure or timeout
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual std::size_t write_some(const char* data, std::size_t length) = 0;
};

/**
 * Encode the 4-byte big-endian length header.
 */
std::string encode_header(std::uint32_t length);

/**
 * Decode a 4-byte big-endian length header.
 */
std::uint32_t decode_header(const char* header);

/**
 * Build a complete frame (header + body).
 *
 * @throws TransportError if the body exceeds max_bytes
 */
std::string encode_frame(const std::string& body,
                         std::uint32_t max_bytes = DEFAULT_MAX_FRAME_BYTES);

/**
 * Read exactly length bytes, looping over short reads.
 *
 * @throws TransportError if the stream ends first
 */
void read_exact(ByteSource& source, char* buffer, std::size_t length);

/**
 * Write every byte, looping over short writes.
 */
void write_all(ByteSink& sink, const char* data, std::size_t length);

/**
 * Read one frame and return its body.
 *
 * @throws TransportError if the stream ends mid-frame or the declared
 *         length exceeds max_bytes
 */
std::string read_frame(ByteSource& source,
                       std::uint32_t max_bytes = DEFAULT_MAX_FRAME_BYTES);

/**
 * Write one frame carrying body.
 */
void write_frame(ByteSink& sink, const std::string& body,
                 std::uint32_t max_bytes = DEFAULT_MAX_FRAME_BYTES);

} // namespace framing
} // namespace portico
