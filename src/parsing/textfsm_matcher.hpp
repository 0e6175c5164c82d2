#pragma once

#include "parsing/template_matcher.hpp"

#include <cstddef>
#include <map>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace topocrawl::parsing {

struct TextFsmValue {
  std::string name;
  std::string regex;
  bool required = false;
  bool filldown = false;
  bool fillup = false;
  bool key = false;
  bool list = false;
};

enum class TextFsmLineOp {
  kNext,
  kContinue,
};

enum class TextFsmRecordOp {
  kNoRecord,
  kRecord,
  kClear,
  kClearAll,
};

struct TextFsmRule {
  std::string source;
  std::regex regex;
  // (value index, capture group) for every value referenced by the rule.
  std::vector<std::pair<std::size_t, std::size_t>> captures;
  TextFsmLineOp line_op = TextFsmLineOp::kNext;
  TextFsmRecordOp record_op = TextFsmRecordOp::kNoRecord;
  std::string next_state;
  bool raises_error = false;
  std::string error_message;
};

struct TextFsmTemplate {
  std::vector<TextFsmValue> values;
  std::map<std::string, std::vector<TextFsmRule>> states;
};

// Compiles TextFSM template text: `Value [Options] NAME (regex)` lines, a
// blank line, then named states holding `^regex [-> Action [State]]` rules.
// `Start` is required; `End` and `EOF` are reserved targets.
bool CompileTextFsmTemplate(std::string_view text, TextFsmTemplate& compiled, std::string& error);

// Runs a compiled template over `text` line by line. List values are joined
// with a single space in the output records.
bool RunTextFsm(const TextFsmTemplate& compiled,
                std::string_view text,
                std::vector<model::NeighborRecord>& records,
                std::string& error);

// STRUCTURED matcher backed by the in-tree TextFSM engine. Supports the
// template subset used by the CDP/LLDP neighbor templates: value options
// Required, Filldown, Fillup and List (Key is accepted), Next/Continue line
// actions, Record/NoRecord/Clear/Clearall record actions, state transitions,
// Error, and the implicit EOF record.
class TextFsmMatcher final : public ITemplateMatcher {
public:
  bool Match(std::string_view template_text,
             std::string_view text,
             std::vector<model::NeighborRecord>& records,
             std::string& error) const override;
};

} // namespace topocrawl::parsing
