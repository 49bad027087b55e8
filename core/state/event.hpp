#pragma once

#include "common/attributes.hpp"
#include "common/errors.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace vita {

/// An environmental or internal stimulus. Immutable once built;
/// consumed once by the tick loop.
class Event {
public:
    Event(std::string type, double intensity, double timestamp, Attributes metadata = {})
        : type_(std::move(type)), intensity_(intensity),
          timestamp_(timestamp), metadata_(std::move(metadata)) {
        if (type_.empty()) {
            throw InvalidArgumentError("event type must not be empty");
        }
        if (!(intensity_ >= -1.0 && intensity_ <= 1.0)) {
            throw InvalidArgumentError("event intensity must be in [-1, 1], got " +
                                       std::to_string(intensity_));
        }
    }

    const std::string& type() const { return type_; }
    double intensity() const { return intensity_; }
    double timestamp() const { return timestamp_; }
    const Attributes& metadata() const { return metadata_; }

    /// Copy with one metadata key added or replaced.
    Event withMetadata(const std::string& key, const std::string& value) const {
        Attributes m = metadata_;
        m[key] = value;
        return Event(type_, intensity_, timestamp_, std::move(m));
    }

    bool operator==(const Event& other) const {
        return type_ == other.type_ && intensity_ == other.intensity_ &&
               timestamp_ == other.timestamp_ && metadata_ == other.metadata_;
    }

private:
    std::string type_;
    double intensity_;
    double timestamp_;
    Attributes metadata_;
};

inline nlohmann::json eventToJson(const Event& event) {
    return {
        {"type", event.type()},
        {"intensity", event.intensity()},
        {"timestamp", event.timestamp()},
        {"metadata", event.metadata()},
    };
}

} // namespace vita
