#pragma once

#include "ingest/codec/Codec.h"

#include <map>
#include <string>
#include <vector>

namespace ingest {
namespace codec {

// Maps content types to codecs. Lookup order: overrides, built-in mapping
// (application/json -> json), then the default codec.
class CodecRegistry {
public:
    // Registers plain, line, json and json_lines; default codec is plain.
    CodecRegistry();

    // Lowercase, parameters (";charset=...") dropped, whitespace trimmed.
    static std::string NormalizeMediaType(const std::string& contentType);

    // Adds or replaces a named codec.
    void Register(const std::string& name, DecodeFn fn);
    const Codec* Find(const std::string& name) const;
    std::vector<std::string> Names() const;

    // Both return false, changing nothing, when the codec name is unknown.
    bool SetDefault(const std::string& name);
    bool SetOverride(const std::string& contentType, const std::string& name);

    // Applies a default codec and an override table; *error names the first unknown codec.
    bool Configure(const std::string& defaultCodec,
                   const std::map<std::string, std::string>& overrides,
                   std::string* error);

    const std::string& defaultCodec() const { return defaultCodec_; }

    const Codec* Resolve(const std::string& contentType) const;

    // All or nothing: *out is only appended to when the whole body decoded.
    bool Decode(const Codec& codec, const std::string& body,
                std::vector<Event>* out, std::string* error) const;

private:
    std::map<std::string, Codec> codecs_;
    std::map<std::string, std::string> builtinMapping_;
    std::map<std::string, std::string> overrides_;
    std::string defaultCodec_;
};

} // namespace codec
} // namespace ingest
