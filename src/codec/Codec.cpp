#include "ingest/codec/Codec.h"

#include <nlohmann/json.hpp>

#include <cctype>

namespace ingest {
namespace codec {
namespace codecs {

using json = nlohmann::json;

namespace {

bool IsBlank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

bool ParseJson(const std::string& text, json* out, std::string* error) {
    try {
        *out = json::parse(text);
    } catch (const json::exception& e) {
        *error = std::string("Invalid JSON: ") + e.what();
        return false;
    }
    return true;
}

} // namespace

bool DecodePlain(const std::string& body, std::vector<Event>* out, std::string* error) {
    (void)error;
    out->push_back(Event::FromMessage(body));
    return true;
}

bool DecodeLine(const std::string& body, std::vector<Event>* out, std::string* error) {
    (void)error;
    size_t start = 0;
    while (start < body.size()) {
        size_t nl = body.find('\n', start);
        if (nl == std::string::npos) nl = body.size();
        out->push_back(Event::FromMessage(body.substr(start, nl - start)));
        start = nl + 1;
    }
    return true;
}

bool DecodeJson(const std::string& body, std::vector<Event>* out, std::string* error) {
    json doc;
    if (!ParseJson(body, &doc, error)) return false;

    if (doc.is_object()) {
        out->push_back(Event(std::move(doc)));
        return true;
    }
    if (doc.is_array()) {
        size_t index = 0;
        for (auto& element : doc) {
            if (!element.is_object()) {
                *error = "JSON array element " + std::to_string(index) + " is not an object";
                return false;
            }
            out->push_back(Event(std::move(element)));
            ++index;
        }
        return true;
    }
    *error = "JSON body must be an object or an array of objects";
    return false;
}

bool DecodeJsonLines(const std::string& body, std::vector<Event>* out, std::string* error) {
    size_t start = 0;
    size_t lineNo = 0;
    while (start < body.size()) {
        size_t nl = body.find('\n', start);
        if (nl == std::string::npos) nl = body.size();
        std::string line = body.substr(start, nl - start);
        start = nl + 1;
        ++lineNo;
        if (!line.empty() && line[line.size() - 1] == '\r') line.resize(line.size() - 1);
        if (IsBlank(line)) continue;

        json doc;
        std::string lineError;
        if (!ParseJson(line, &doc, &lineError)) {
            *error = "line " + std::to_string(lineNo) + ": " + lineError;
            return false;
        }
        if (!doc.is_object()) {
            *error = "line " + std::to_string(lineNo) + ": JSON value is not an object";
            return false;
        }
        out->push_back(Event(std::move(doc)));
    }
    return true;
}

} // namespace codecs
} // namespace codec
} // namespace ingest
