#include "protocol/tool_output.hpp"

#include <nlohmann/json.hpp>

namespace snipexec::protocol {

using nlohmann::json;

namespace {

// Invalid UTF-8 from the child is replaced with U+FFFD instead of throwing.
std::string quote(const std::string& value) {
    return json(value).dump(-1, ' ', true, json::error_handler_t::replace);
}

}  // namespace

std::string serialize_streams(const std::string& stdout_text,
                              const std::string& stderr_text) {
    // Built by hand to keep key order and the ": " / ", " separators.
    return "{\"stdout\": " + quote(stdout_text) + ", \"stderr\": " +
           quote(stderr_text) + "}";
}

std::string build_envelope(const std::string& stdout_text,
                           const std::string& stderr_text) {
    std::string envelope = std::string(kEnvelopeOpen) +
                           serialize_streams(stdout_text, stderr_text) +
                           kEnvelopeClose;
    if (envelope.size() > kMaxEnvelopeChars) {
        envelope.resize(kMaxEnvelopeChars);
    }
    return envelope;
}

}  // namespace snipexec::protocol
