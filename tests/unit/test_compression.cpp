#include "ingest/protocol/Compression.h"
#include "ingest/common/Logger.h"

#include <cassert>
#include <string>

using namespace ingest::protocol;
using namespace ingest::common;

using Encoding = Compression::Encoding;
using Status = Compression::Status;

void testParseContentEncoding() {
    assert(Compression::ParseContentEncoding("gzip") == Encoding::kGzip);
    assert(Compression::ParseContentEncoding(" GZIP ") == Encoding::kGzip);
    assert(Compression::ParseContentEncoding("x-gzip") == Encoding::kGzip);
    assert(Compression::ParseContentEncoding("Deflate") == Encoding::kDeflate);
    assert(Compression::ParseContentEncoding("") == Encoding::kIdentity);
    assert(Compression::ParseContentEncoding("identity") == Encoding::kIdentity);
    assert(Compression::ParseContentEncoding("br") == Encoding::kIdentity);
    LOG_INFO << "ParseContentEncoding PASS";
}

void testGzipAndDeflate() {
    const std::string payload = "hello\nworld\n" + std::string(10000, 'x');
    for (Encoding enc : {Encoding::kGzip, Encoding::kDeflate}) {
        std::string compressed;
        assert(Compression::Compress(enc, payload, &compressed));
        assert(compressed != payload);
        assert(compressed.size() < payload.size());

        std::string out;
        assert(Compression::Decompress(enc, compressed, &out) == Status::kOk);
        assert(out == payload);
    }
    // gzip magic bytes.
    std::string gz;
    assert(Compression::Compress(Encoding::kGzip, "hello", &gz));
    assert(static_cast<unsigned char>(gz[0]) == 0x1f && static_cast<unsigned char>(gz[1]) == 0x8b);
    LOG_INFO << "Gzip/Deflate PASS";
}

void testCorruptInput() {
    std::string out;
    assert(Compression::Decompress(Encoding::kDeflate, "hello", &out) == Status::kCorrupt);
    assert(Compression::Decompress(Encoding::kGzip, "hello", &out) == Status::kCorrupt);
    assert(Compression::Decompress(Encoding::kGzip, "", &out) == Status::kCorrupt);

    std::string gz;
    assert(Compression::Compress(Encoding::kGzip, "hello world", &gz));
    // Truncated stream.
    assert(Compression::Decompress(Encoding::kGzip, gz.substr(0, gz.size() - 4), &out) == Status::kCorrupt);
    // Trailing garbage after the end of the stream.
    assert(Compression::Decompress(Encoding::kGzip, gz + "junk", &out) == Status::kCorrupt);
    // A gzip stream declared as deflate does not match.
    assert(Compression::Decompress(Encoding::kDeflate, gz, &out) == Status::kCorrupt);

    std::string zl;
    assert(Compression::Compress(Encoding::kDeflate, "hello world", &zl));
    assert(Compression::Decompress(Encoding::kGzip, zl, &out) == Status::kCorrupt);
    LOG_INFO << "Corrupt input PASS";
}

void testOutputLimit() {
    const std::string payload(100000, 'a');
    std::string compressed;
    assert(Compression::Compress(Encoding::kGzip, payload, &compressed));

    std::string out;
    assert(Compression::Decompress(Encoding::kGzip, compressed, &out, 1000) == Status::kTooLarge);
    assert(Compression::Decompress(Encoding::kGzip, compressed, &out, payload.size()) == Status::kOk);
    assert(out == payload);

    assert(Compression::Decompress(Encoding::kIdentity, "abcdef", &out, 3) == Status::kTooLarge);
    assert(Compression::Decompress(Encoding::kIdentity, "abc", &out, 3) == Status::kOk);
    assert(out == "abc");
    LOG_INFO << "Output limit PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseContentEncoding();
    testGzipAndDeflate();
    testCorruptInput();
    testOutputLimit();
    return 0;
}
