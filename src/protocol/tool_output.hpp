#pragma once

#include <cstddef>
#include <string>

namespace snipexec::protocol {

constexpr std::size_t kMaxEnvelopeChars = 3000;
constexpr const char* kEnvelopeOpen = "<tool_output>";
constexpr const char* kEnvelopeClose = "</tool_output>";

// {"stdout": "...", "stderr": "..."} with non-ASCII escaped as \uXXXX, so the
// payload is pure ASCII and one char is one byte.
std::string serialize_streams(const std::string& stdout_text,
                              const std::string& stderr_text);

// Wraps the serialized streams in <tool_output>...</tool_output> and cuts the
// result to kMaxEnvelopeChars, even if that splits the JSON or closing tag.
std::string build_envelope(const std::string& stdout_text,
                           const std::string& stderr_text);

}  // namespace snipexec::protocol
