#include "logmux/multiline_reassembler.hpp"

#include "logmux/vis_decoder.hpp"

namespace Logmux {

namespace {
using SvMatch = std::match_results<std::string_view::const_iterator>;

// Header of any process. Loose enough to catch other apps and daemons
// without treating ordinary continuation text as a header.
const std::regex &any_header_regex() {
  static const std::regex regex(R"(\w+(\([^)]*\))?\[\d+\] <[A-Za-z]+>: )");
  return regex;
}
} // namespace

std::string regex_escape(std::string_view text) {
  static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
  std::string escaped;
  escaped.reserve(text.size() * 2);
  for (char c : text) {
    if (kSpecial.find(c) != std::string_view::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

MultilineReassembler::MultilineReassembler(std::string_view process_name,
                                           std::string_view header_suffix)
    // The name must not be the tail of a longer process name ("OtherApp").
    : _tracked_header(R"((?:^|\W))" + regex_escape(process_name) + R"((\()" +
                      regex_escape(header_suffix) +
                      R"(\))?\[\d+\] <[A-Za-z]+>: )") {}

std::optional<std::string>
MultilineReassembler::handle(std::string_view line) {
  if (_state == State::Printing) {
    if (!std::regex_search(line.begin(), line.end(), any_header_regex())) {
      return decode_syslog(line);
    }
    _state = State::Idle;
  }

  SvMatch match;
  if (std::regex_search(line.begin(), line.end(), match, _tracked_header)) {
    _state = State::Printing;
    // Only keep what follows the device and executable information.
    const auto offset =
        static_cast<size_t>(match[0].second - line.begin());
    return decode_syslog(line.substr(offset));
  }
  return std::nullopt;
}

} // namespace Logmux
