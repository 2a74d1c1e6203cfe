#include "ingest/protocol/Compression.h"

#include <cctype>
#include <cstring>

#include <zlib.h>

namespace ingest {
namespace protocol {

namespace {

std::string NormalizeToken(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    }
    return out;
}

Compression::Status InflateAll(const uint8_t* data, size_t len, int windowBits,
                               size_t maxOutput, std::string* out) {
    out->clear();
    if (len > std::numeric_limits<uInt>::max()) return Compression::Status::kTooLarge;

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (inflateInit2(&zs, windowBits) != Z_OK) return Compression::Status::kCorrupt;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        // Z_BUF_ERROR here means the input ran out before the end of the stream.
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return Compression::Status::kCorrupt;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced > maxOutput - out->size()) {
            inflateEnd(&zs);
            return Compression::Status::kTooLarge;
        }
        if (produced) out->append(buf, buf + produced);
    }
    const bool trailing = zs.avail_in != 0;
    inflateEnd(&zs);
    return trailing ? Compression::Status::kCorrupt : Compression::Status::kOk;
}

bool DeflateAll(const uint8_t* data, size_t len, int windowBits, std::string* out) {
    out->clear();
    if (len > std::numeric_limits<uInt>::max()) return false;
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
    }
    deflateEnd(&zs);
    return true;
}

} // namespace

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = NormalizeToken(v);
    if (lv == "gzip" || lv == "x-gzip") return Encoding::kGzip;
    if (lv == "deflate") return Encoding::kDeflate;
    return Encoding::kIdentity;
}

const char* Compression::EncodingName(Encoding enc) {
    switch (enc) {
        case Encoding::kGzip: return "gzip";
        case Encoding::kDeflate: return "deflate";
        default: return "identity";
    }
}

Compression::Status Compression::Decompress(Encoding enc, const uint8_t* data, size_t len,
                                            std::string* out, size_t maxOutput) {
    if (enc == Encoding::kGzip) {
        return InflateAll(data, len, 16 + MAX_WBITS, maxOutput, out);
    }
    if (enc == Encoding::kDeflate) {
        return InflateAll(data, len, MAX_WBITS, maxOutput, out);
    }
    if (len > maxOutput) return Status::kTooLarge;
    out->assign(reinterpret_cast<const char*>(data), len);
    return Status::kOk;
}

Compression::Status Compression::Decompress(Encoding enc, const std::string& in, std::string* out,
                                            size_t maxOutput) {
    return Decompress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out, maxOutput);
}

bool Compression::Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out) {
    if (!out) return false;
    if (enc == Encoding::kGzip) {
        return DeflateAll(data, len, 16 + MAX_WBITS, out);
    }
    if (enc == Encoding::kDeflate) {
        return DeflateAll(data, len, MAX_WBITS, out);
    }
    out->assign(reinterpret_cast<const char*>(data), len);
    return true;
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    return Compress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out);
}

} // namespace protocol
} // namespace ingest
