#include "MessageDecoder.h"

#include <cstddef>
#include <cstdint>

namespace {

// Unicode White_Space property, plus the C0 separators U+001C..U+001F.
bool IsWhiteSpace(uint32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) ||
        cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
        (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 ||
        cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// Decodes the code point starting at s[i] and advances i. Malformed input yields
// 0xFFFD, which is never whitespace.
uint32_t NextCodePoint(const std::string& s, size_t& i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char lead = byte(i);
    size_t len = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 0;
    if (len == 0 || i + len > s.size()) {
        ++i;
        return 0xFFFD;
    }
    uint32_t cp = len == 1 ? lead : lead & (0xFF >> (len + 1));
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) {
            ++i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    i += len;
    return cp;
}

} // namespace

bool MessageDecoder::IsBlank(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        if (!IsWhiteSpace(NextCodePoint(s, i))) return false;
    }
    return true;
}

EntityRecord MessageDecoder::Decode(const std::string& payload, const std::string& source_ip, TimePoint now) {
    nlohmann::json message;
    try {
        // Invalid UTF-8 inside strings is reported as a parse_error too.
        message = nlohmann::json::parse(payload);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(e.what());
    }
    if (!message.is_object()) {
        throw DecodeError(std::string("payload is a JSON ") + message.type_name() + ", expected an object");
    }

    auto id_it = message.find("entity_id");
    if (id_it == message.end()) {
        throw ValidationError("missing entity_id");
    }
    if (!id_it->is_string()) {
        throw ValidationError(std::string("entity_id is a ") + id_it->type_name() + ", expected a string");
    }
    std::string entity_id = id_it->get<std::string>();
    if (IsBlank(entity_id)) {
        throw ValidationError("entity_id is empty");
    }

    EntityRecord record;
    record.entity_id = std::move(entity_id);
    record.source_ip = source_ip;
    record.last_updated = now;

    auto state_it = message.find("state");
    if (state_it != message.end()) {
        record.state = *state_it;
    }

    auto attr_it = message.find("attributes");
    if (attr_it != message.end() && !attr_it->is_null()) {
        if (!attr_it->is_object()) {
            throw ValidationError(std::string("attributes is a ") + attr_it->type_name() + ", expected an object");
        }
        record.attributes = *attr_it;
    }

    auto name_it = message.find("broadcaster_name");
    if (name_it != message.end() && !name_it->is_null()) {
        if (!name_it->is_string()) {
            throw ValidationError(std::string("broadcaster_name is a ") + name_it->type_name() + ", expected a string");
        }
        record.broadcaster_name = name_it->get<std::string>();
    }

    return record;
}
