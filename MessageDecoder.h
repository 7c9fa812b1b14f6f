// MessageDecoder.h
#pragma once

#include <stdexcept>
#include <string>

#include "EntityRecord.h"

// Malformed UTF-8 / JSON, or a payload that is not a JSON object.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Well-formed JSON with a missing or unusable field.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// --- MessageDecoder ---
// Turns one datagram payload into an EntityRecord.
//
// Wire format:
//   { "entity_id": "<non-empty string>",   required
//     "state": <any JSON value>,           optional, null when absent
//     "attributes": { ... },               optional, {} when absent
//     "broadcaster_name": "<string>" }     optional, "Unknown" when absent
class MessageDecoder {
public:
    // Throws DecodeError or ValidationError. Never touches any registry.
    static EntityRecord Decode(const std::string& payload, const std::string& source_ip, TimePoint now);

    // True for an empty string or one made only of Unicode whitespace (UTF-8 input).
    static bool IsBlank(const std::string& s);
};
