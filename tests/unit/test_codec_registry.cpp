#include "ingest/codec/CodecRegistry.h"
#include "ingest/common/Logger.h"

#include <cassert>
#include <cctype>
#include <map>
#include <string>
#include <vector>

using namespace ingest::codec;
using namespace ingest::common;

static bool DecodeUpper(const std::string& body, std::vector<Event>* out, std::string* error) {
    (void)error;
    std::string up(body);
    for (auto& c : up) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
    out->push_back(Event::FromMessage(up));
    return true;
}

static bool DecodeAlwaysFails(const std::string& body, std::vector<Event>* out, std::string* error) {
    out->push_back(Event::FromMessage(body));
    *error = "nope";
    return false;
}

void testNormalize() {
    assert(CodecRegistry::NormalizeMediaType("application/json") == "application/json");
    assert(CodecRegistry::NormalizeMediaType("Application/JSON; charset=UTF-8") == "application/json");
    assert(CodecRegistry::NormalizeMediaType("  text/plain ;q=1") == "text/plain");
    assert(CodecRegistry::NormalizeMediaType("").empty());
    LOG_INFO << "Normalize PASS";
}

void testDefaultResolution() {
    CodecRegistry reg;
    assert(reg.defaultCodec() == "plain");
    assert(reg.Find("plain") && reg.Find("line") && reg.Find("json") && reg.Find("json_lines"));
    assert(!reg.Find("msgpack"));
    assert(reg.Names().size() == 4);

    assert(reg.Resolve("application/json")->name == "json");
    assert(reg.Resolve("APPLICATION/JSON; charset=utf-8")->name == "json");
    assert(reg.Resolve("text/plain")->name == "plain");
    assert(reg.Resolve("")->name == "plain");

    assert(reg.SetDefault("line"));
    assert(reg.Resolve("text/plain")->name == "line");
    assert(reg.Resolve("application/json")->name == "json");
    assert(!reg.SetDefault("msgpack"));
    assert(reg.defaultCodec() == "line");
    LOG_INFO << "Default resolution PASS";
}

void testOverrides() {
    CodecRegistry reg;
    assert(reg.SetOverride("Application/Json", "plain"));
    assert(reg.Resolve("application/json")->name == "plain");
    assert(reg.SetOverride("text/x-ndjson", "json_lines"));
    assert(reg.Resolve("text/x-ndjson; charset=utf-8")->name == "json_lines");
    assert(!reg.SetOverride("text/csv", "csv"));
    assert(reg.Resolve("text/csv")->name == "plain");

    CodecRegistry configured;
    std::map<std::string, std::string> overrides;
    overrides["application/json"] = "plain";
    std::string err;
    assert(configured.Configure("json", overrides, &err));
    assert(configured.Resolve("application/json")->name == "plain");
    assert(configured.Resolve("text/plain")->name == "json");

    CodecRegistry bad;
    overrides["text/csv"] = "csv";
    assert(!bad.Configure("plain", overrides, &err));
    assert(err.find("csv") != std::string::npos);
    assert(!bad.Configure("nope", std::map<std::string, std::string>(), &err));
    LOG_INFO << "Overrides PASS";
}

void testRegisterAndDecode() {
    CodecRegistry reg;
    reg.Register("upper", &DecodeUpper);
    reg.Register("broken", &DecodeAlwaysFails);
    assert(reg.SetOverride("text/upper", "upper"));

    std::vector<Event> events;
    std::string err;
    const Codec* codec = reg.Resolve("text/upper");
    assert(codec && codec->name == "upper");
    assert(reg.Decode(*codec, "abc", &events, &err));
    assert(events.size() == 1);
    assert(events[0].getString("message") == "ABC");

    // Partial output of a failed decode is not handed back.
    events.clear();
    assert(!reg.Decode(*reg.Find("broken"), "abc", &events, &err));
    assert(events.empty());
    assert(err == "nope");

    events.clear();
    assert(!reg.Decode(*reg.Find("json_lines"), "{\"a\":1}\nbad", &events, &err));
    assert(events.empty());

    // Plain override on a JSON body keeps the raw text.
    CodecRegistry plainJson;
    assert(plainJson.SetOverride("application/json", "plain"));
    events.clear();
    const std::string body = "{\"message\":\"Hello\"}";
    assert(plainJson.Decode(*plainJson.Resolve("application/json"), body, &events, &err));
    assert(events.size() == 1);
    assert(events[0].getString("message") == body);
    LOG_INFO << "Register and decode PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testNormalize();
    testDefaultResolution();
    testOverrides();
    testRegisterAndDecode();
    return 0;
}
