#pragma once

#include "model/device.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::parsing {

// Applies one structured template to command output and returns zero or more
// field/value records. Implementations are deterministic and keep no state
// between calls.
class ITemplateMatcher {
public:
  virtual ~ITemplateMatcher() = default;

  // Returns false with `error` for a malformed template or a template that
  // raises an error on this input. No records is a successful outcome.
  virtual bool Match(std::string_view template_text,
                     std::string_view text,
                     std::vector<model::NeighborRecord>& records,
                     std::string& error) const = 0;
};

} // namespace topocrawl::parsing
