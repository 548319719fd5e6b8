#include "logmux/line_deduplicator.hpp"

#include <algorithm>

namespace Logmux {

Admission LineDeduplicator::admit(const std::string &line, SourceKind source,
                                  const SourceSelection &selection) {
  if (!selection.fallback) {
    return Admission::Emit;
  }

  if (source == selection.primary) {
    if (!_primary_saw_flutter_line && is_flutter_line(line)) {
      _primary_saw_flutter_line = true;
    }
    // The fallback was quicker and already emitted this line.
    auto it = std::find(_pending_fallback_lines.begin(),
                        _pending_fallback_lines.end(), line);
    if (it != _pending_fallback_lines.end()) {
      _pending_fallback_lines.erase(it);
      return Admission::Drop;
    }
    return Admission::Emit;
  }

  if (_primary_saw_flutter_line) {
    return Admission::Drop;
  }
  if (!is_flutter_line(line)) {
    return Admission::Drop;
  }
  _pending_fallback_lines.push_back(line);
  return Admission::Emit;
}

void LineDeduplicator::reset() {
  _primary_saw_flutter_line = false;
  _pending_fallback_lines.clear();
}

} // namespace Logmux
