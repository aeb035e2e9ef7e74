#include "portico/framing.hpp"

#include "portico/errors.hpp"

namespace portico {
namespace framing {

std::string encode_header(std::uint32_t length) {
    std::string header(HEADER_SIZE, '\0');
    header[0] = static_cast<char>((length >> 24) & 0xff);
    header[1] = static_cast<char>((length >> 16) & 0xff);
    header[2] = static_cast<char>((length >> 8) & 0xff);
    header[3] = static_cast<char>(length & 0xff);
    return header;
}

std::uint32_t decode_header(const char* header) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(header);
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
           (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) |
           static_cast<std::uint32_t>(bytes[3]);
}

std::string encode_frame(const std::string& body, std::uint32_t max_bytes) {
    if (body.size() > max_bytes) {
        throw TransportError("frame body of " + std::to_string(body.size()) +
                             " bytes exceeds limit of " + std::to_string(max_bytes));
    }
    std::string frame = encode_header(static_cast<std::uint32_t>(body.size()));
    frame.append(body);
    return frame;
}

void read_exact(ByteSource& source, char* buffer, std::size_t length) {
    std::size_t received = 0;
    while (received < length) {
        std::size_t n = source.read_some(buffer + received, length - received);
        if (n == 0) {
            throw TransportError("connection closed after " + std::to_string(received) +
                                 " of " + std::to_string(length) + " bytes");
        }
        received += n;
    }
}

void write_all(ByteSink& sink, const char* data, std::size_t length) {
    std::size_t written = 0;
    while (written < length) {
        written += sink.write_some(data + written, length - written);
    }
}

std::string read_frame(ByteSource& source, std::uint32_t max_bytes) {
    char header[HEADER_SIZE];
    read_exact(source, header, HEADER_SIZE);

    std::uint32_t length = decode_header(header);
    if (length > max_bytes) {
        throw TransportError("declared frame length " + std::to_string(length) +
                             " exceeds limit of " + std::to_string(max_bytes));
    }

    std::string body(length, '\0');
    if (length > 0) {
        read_exact(source, &body[0], length);
    }
    return body;
}

void write_frame(ByteSink& sink, const std::string& body, std::uint32_t max_bytes) {
    auto frame = encode_frame(body, max_bytes);
    write_all(sink, frame.data(), frame.size());
}

} // namespace framing
} // namespace portico
