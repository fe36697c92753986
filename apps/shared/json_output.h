#pragma once

#include <nlohmann/json.hpp>

#include <ostream>

namespace sme::apps {

// print_json writes a pretty-printed document followed by a newline. Strings read
// from pool files or databases are not guaranteed to be UTF-8; invalid bytes are
// written as U+FFFD instead of throwing.
inline void print_json(std::ostream& os, const nlohmann::json& document) {
  os << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace sme::apps
