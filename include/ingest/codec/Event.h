#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace ingest {
namespace codec {

// One decoded record: a JSON object of fields. Never modified in place;
// WithField returns a new event.
class Event {
public:
    Event() : fields_(nlohmann::json::object()) {}
    // fields must be a JSON object.
    explicit Event(nlohmann::json fields) : fields_(std::move(fields)) {}

    static Event FromMessage(const std::string& message) {
        nlohmann::json fields = nlohmann::json::object();
        fields["message"] = message;
        return Event(std::move(fields));
    }

    const nlohmann::json& fields() const { return fields_; }

    bool has(const std::string& key) const { return fields_.contains(key); }

    // Empty when absent or not a string.
    std::string getString(const std::string& key) const {
        auto it = fields_.find(key);
        if (it == fields_.end() || !it->is_string()) return std::string();
        return it->get<std::string>();
    }

    Event WithField(const std::string& key, nlohmann::json value) const & {
        nlohmann::json fields = fields_;
        fields[key] = std::move(value);
        return Event(std::move(fields));
    }
    Event WithField(const std::string& key, nlohmann::json value) && {
        fields_[key] = std::move(value);
        return Event(std::move(fields_));
    }

    // Single-line JSON; invalid UTF-8 in strings is replaced rather than thrown on.
    std::string ToJson() const {
        return fields_.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

private:
    nlohmann::json fields_;
};

} // namespace codec
} // namespace ingest
