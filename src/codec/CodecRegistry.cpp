#include "ingest/codec/CodecRegistry.h"
#include "ingest/common/Logger.h"

#include <cctype>

namespace ingest {
namespace codec {

CodecRegistry::CodecRegistry()
    : defaultCodec_("plain") {
    Register("plain", &codecs::DecodePlain);
    Register("line", &codecs::DecodeLine);
    Register("json", &codecs::DecodeJson);
    Register("json_lines", &codecs::DecodeJsonLines);
    builtinMapping_["application/json"] = "json";
}

std::string CodecRegistry::NormalizeMediaType(const std::string& contentType) {
    std::string s = contentType.substr(0, contentType.find(';'));
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

void CodecRegistry::Register(const std::string& name, DecodeFn fn) {
    codecs_[name] = Codec{name, fn};
}

const Codec* CodecRegistry::Find(const std::string& name) const {
    auto it = codecs_.find(name);
    return it == codecs_.end() ? nullptr : &it->second;
}

std::vector<std::string> CodecRegistry::Names() const {
    std::vector<std::string> names;
    for (const auto& kv : codecs_) names.push_back(kv.first);
    return names;
}

bool CodecRegistry::SetDefault(const std::string& name) {
    if (!Find(name)) return false;
    defaultCodec_ = name;
    return true;
}

bool CodecRegistry::SetOverride(const std::string& contentType, const std::string& name) {
    if (!Find(name)) return false;
    overrides_[NormalizeMediaType(contentType)] = name;
    return true;
}

bool CodecRegistry::Configure(const std::string& defaultCodec,
                              const std::map<std::string, std::string>& overrides,
                              std::string* error) {
    if (!SetDefault(defaultCodec)) {
        *error = "unknown codec '" + defaultCodec + "'";
        return false;
    }
    for (const auto& kv : overrides) {
        if (!SetOverride(kv.first, kv.second)) {
            *error = "unknown codec '" + kv.second + "' for content type '" + kv.first + "'";
            return false;
        }
    }
    return true;
}

const Codec* CodecRegistry::Resolve(const std::string& contentType) const {
    const std::string type = NormalizeMediaType(contentType);
    if (!type.empty()) {
        auto ov = overrides_.find(type);
        if (ov != overrides_.end()) return Find(ov->second);
        auto bi = builtinMapping_.find(type);
        if (bi != builtinMapping_.end()) return Find(bi->second);
    }
    return Find(defaultCodec_);
}

bool CodecRegistry::Decode(const Codec& codec, const std::string& body,
                           std::vector<Event>* out, std::string* error) const {
    std::vector<Event> events;
    std::string err;
    if (!codec.decode(body, &events, &err)) {
        LOG_DEBUG << "codec " << codec.name << " failed: " << err;
        *error = err.empty() ? "Failed to decode body with codec " + codec.name : err;
        return false;
    }
    for (auto& e : events) {
        out->push_back(std::move(e));
    }
    return true;
}

} // namespace codec
} // namespace ingest
