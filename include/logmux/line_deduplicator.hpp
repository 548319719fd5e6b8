#pragma once

#include "logmux/logmux_common_types.hpp"

#include <cstddef>
#include <deque>
#include <string>

namespace Logmux {

enum class Admission : uint8_t { Emit, Drop };

/**
 * @brief The duplicate suppression policy between a primary and a fallback
 * source.
 *
 * Fallback lines are emitted optimistically, but only application lines
 * ("flutter:" prefix): other lines are formatted differently by every source
 * and cannot be matched. Each emitted fallback line is remembered until the
 * primary produces the same text, which is then dropped. Once the primary
 * has produced an application line of its own the fallback is ignored
 * entirely.
 *
 * Not thread-safe. LogAggregator only calls it from its processing thread.
 */
class LineDeduplicator {
public:
  Admission admit(const std::string &line, SourceKind source,
                  const SourceSelection &selection);

  bool primary_saw_flutter_line() const { return _primary_saw_flutter_line; }
  size_t pending_fallback_line_count() const {
    return _pending_fallback_lines.size();
  }
  void reset();

private:
  bool _primary_saw_flutter_line = false;
  // FIFO, duplicates allowed. Entries leave only when matched by primary.
  std::deque<std::string> _pending_fallback_lines;
};

} // namespace Logmux
