#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace ingest {
namespace protocol {

class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
    };

    enum class Status {
        kOk,
        // Not a complete, valid stream of the declared encoding.
        kCorrupt,
        // Output grew past the caller's limit.
        kTooLarge,
    };

    // gzip, x-gzip and deflate (case-insensitive); everything else, including an
    // absent header, is identity.
    static Encoding ParseContentEncoding(const std::string& v);
    static const char* EncodingName(Encoding enc);

    // Decompress whole buffer. Trailing bytes after the end of the stream are corrupt.
    static Status Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out,
                             size_t maxOutput = std::numeric_limits<size_t>::max());
    static Status Decompress(Encoding enc, const std::string& in, std::string* out,
                             size_t maxOutput = std::numeric_limits<size_t>::max());

    // Compress whole buffer.
    static bool Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace ingest
