#pragma once

#include "ingest/codec/Event.h"

#include <string>
#include <vector>

namespace ingest {
namespace codec {

// Decodes a whole body into events appended to *out. On failure returns false
// with a client-facing message in *error; *out may hold partial results, which
// callers discard.
using DecodeFn = bool (*)(const std::string& body, std::vector<Event>* out, std::string* error);

// Handle returned by the registry.
struct Codec {
    std::string name;
    DecodeFn decode;
};

namespace codecs {

// message = whole body
bool DecodePlain(const std::string& body, std::vector<Event>* out, std::string* error);
// one event per '\n'-separated segment, last segment kept without a delimiter
bool DecodeLine(const std::string& body, std::vector<Event>* out, std::string* error);
// object, or array of objects
bool DecodeJson(const std::string& body, std::vector<Event>* out, std::string* error);
// one object per non-blank line
bool DecodeJsonLines(const std::string& body, std::vector<Event>* out, std::string* error);

} // namespace codecs

} // namespace codec
} // namespace ingest
