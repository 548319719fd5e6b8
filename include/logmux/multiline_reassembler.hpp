#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace Logmux {

/**
 * @brief Groups the continuation lines of a multiline system log message
 * with their header line.
 *
 * Only the first physical line of a system log message carries the
 * "Runner[297] <Notice>: " style header (older OS versions) or
 * "Runner(Flutter)[297] <Notice>: " (newer ones). After a header of the
 * tracked process the reassembler is Printing: every following line without
 * a header of any process is a continuation and is emitted as-is. The next
 * header line ends the block and is then treated as a fresh line, emitted
 * only if it belongs to the tracked process.
 *
 * Emitted text is vis-decoded. One instance per byte stream.
 */
class MultilineReassembler {
public:
  enum class State : uint8_t { Idle, Printing };

  explicit MultilineReassembler(std::string_view process_name,
                                std::string_view header_suffix = "Flutter");

  /**
   * @brief Feeds one physical line.
   * @return The decoded text to emit, or std::nullopt if the line is not
   * output of the tracked process.
   */
  std::optional<std::string> handle(std::string_view line);

  State state() const { return _state; }
  void reset() { _state = State::Idle; }

private:
  std::regex _tracked_header;
  State _state = State::Idle;
};

// Escapes every ECMAScript regex metacharacter in `text`.
std::string regex_escape(std::string_view text);

} // namespace Logmux
