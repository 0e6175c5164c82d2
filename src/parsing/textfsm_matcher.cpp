#include "parsing/textfsm_matcher.hpp"

#include "parsing/named_regex.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace topocrawl::parsing {

namespace {

constexpr std::string_view kStartState = "Start";
constexpr std::string_view kEndState = "End";
constexpr std::string_view kEofState = "EOF";

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    std::size_t end = text.find('\n', begin);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string line(text.substr(begin, end - begin));
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    if (end == text.size()) {
      break;
    }
    begin = end + 1U;
  }
  return lines;
}

std::string_view TrimLeft(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  return text;
}

std::string_view Trim(std::string_view text) {
  text = TrimLeft(text);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool IsBlank(std::string_view line) {
  return Trim(line).empty();
}

bool IsComment(std::string_view line) {
  const std::string_view trimmed = TrimLeft(line);
  return !trimmed.empty() && trimmed.front() == '#';
}

bool IsIdentifier(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

std::vector<std::string> SplitOn(std::string_view text, char separator) {
  std::vector<std::string> parts;
  std::size_t begin = 0;
  while (true) {
    const std::size_t end = text.find(separator, begin);
    parts.emplace_back(text.substr(begin, end == std::string_view::npos ? end : end - begin));
    if (end == std::string_view::npos) {
      return parts;
    }
    begin = end + 1U;
  }
}

bool ParseValueLine(std::string_view line, std::size_t line_no, TextFsmValue& value,
                    std::string& error) {
  const std::string prefix = "line " + std::to_string(line_no) + ": ";
  const std::vector<std::string> tokens = SplitOn(line, ' ');
  if (tokens.size() < 3U) {
    error = prefix + "value definition needs a name and a regex";
    return false;
  }

  std::size_t regex_token = 2;
  if (tokens[2].empty() || tokens[2].front() != '(') {
    for (const std::string& option : SplitOn(tokens[1], ',')) {
      if (option == "Required") {
        value.required = true;
      } else if (option == "Filldown") {
        value.filldown = true;
      } else if (option == "Fillup") {
        value.fillup = true;
      } else if (option == "Key") {
        value.key = true;
      } else if (option == "List") {
        value.list = true;
      } else {
        error = prefix + "unknown value option '" + option + "'";
        return false;
      }
    }
    value.name = tokens[2];
    regex_token = 3;
  } else {
    value.name = tokens[1];
  }

  if (!IsIdentifier(value.name)) {
    error = prefix + "invalid value name '" + value.name + "'";
    return false;
  }

  std::string regex;
  for (std::size_t i = regex_token; i < tokens.size(); ++i) {
    if (!regex.empty()) {
      regex.push_back(' ');
    }
    regex += tokens[i];
  }
  regex = std::string(Trim(regex));
  if (regex.size() < 2U || regex.front() != '(' || regex.back() != ')') {
    error = prefix + "value regex for '" + value.name + "' must be enclosed in parentheses";
    return false;
  }

  NamedPattern translated;
  if (!TranslateNamedGroups(regex, translated, error)) {
    error = prefix + error;
    return false;
  }
  value.regex = translated.ecmascript;
  return true;
}

bool ParseAction(std::string_view action, TextFsmRule& rule, std::string& error) {
  action = Trim(action);
  if (action == "Error" ||
      (action.substr(0, 5) == "Error" && std::isspace(static_cast<unsigned char>(action[5])) != 0)) {
    rule.raises_error = true;
    std::string_view message = Trim(action.substr(5));
    if (message.size() >= 2U && message.front() == '"' && message.back() == '"') {
      message = message.substr(1, message.size() - 2U);
    }
    rule.error_message = std::string(message);
    return true;
  }

  std::istringstream stream{std::string(action)};
  std::vector<std::string> tokens;
  for (std::string token; stream >> token;) {
    tokens.push_back(token);
  }
  if (tokens.empty() || tokens.size() > 2U) {
    error = "malformed rule action '" + std::string(action) + "'";
    return false;
  }

  const auto apply_op = [&rule](const std::string& op) {
    if (op == "Next") {
      rule.line_op = TextFsmLineOp::kNext;
    } else if (op == "Continue") {
      rule.line_op = TextFsmLineOp::kContinue;
    } else if (op == "NoRecord") {
      rule.record_op = TextFsmRecordOp::kNoRecord;
    } else if (op == "Record") {
      rule.record_op = TextFsmRecordOp::kRecord;
    } else if (op == "Clear") {
      rule.record_op = TextFsmRecordOp::kClear;
    } else if (op == "Clearall") {
      rule.record_op = TextFsmRecordOp::kClearAll;
    } else {
      return false;
    }
    return true;
  };

  const std::string& first = tokens.front();
  if (const std::size_t dot = first.find('.'); dot != std::string::npos) {
    const std::string line_op = first.substr(0, dot);
    const std::string record_op = first.substr(dot + 1U);
    if ((line_op != "Next" && line_op != "Continue") || !apply_op(line_op) ||
        !apply_op(record_op) || record_op == "Next" || record_op == "Continue") {
      error = "malformed rule action '" + first + "'";
      return false;
    }
  } else if (!apply_op(first)) {
    if (tokens.size() != 1U) {
      error = "malformed rule action '" + std::string(action) + "'";
      return false;
    }
    rule.next_state = first;
  }
  if (tokens.size() == 2U) {
    rule.next_state = tokens[1];
  }

  if (rule.line_op == TextFsmLineOp::kContinue && !rule.next_state.empty()) {
    error = "Continue cannot change state ('" + std::string(action) + "')";
    return false;
  }
  return true;
}

bool SubstituteValues(std::string_view match, const std::vector<TextFsmValue>& values,
                      TextFsmRule& rule, std::string& expanded, std::string& error) {
  const auto find_value = [&values](std::string_view name) -> std::size_t {
    for (std::size_t i = 0; i < values.size(); ++i) {
      if (values[i].name == name) {
        return i;
      }
    }
    return values.size();
  };

  expanded.clear();
  std::size_t i = 0;
  while (i < match.size()) {
    if (match[i] != '$') {
      expanded.push_back(match[i]);
      ++i;
      continue;
    }
    if (i + 1U < match.size() && match[i + 1U] == '$') {
      expanded.push_back('$');
      i += 2U;
      continue;
    }

    std::string_view name;
    std::size_t next = i + 1U;
    if (next < match.size() && match[next] == '{') {
      const std::size_t close = match.find('}', next);
      if (close == std::string_view::npos) {
        error = "unterminated ${ in rule '" + std::string(match) + "'";
        return false;
      }
      name = match.substr(next + 1U, close - next - 1U);
      next = close + 1U;
    } else {
      std::size_t end = next;
      while (end < match.size() &&
             (std::isalnum(static_cast<unsigned char>(match[end])) != 0 || match[end] == '_')) {
        ++end;
      }
      name = match.substr(next, end - next);
      next = end;
    }

    if (name.empty()) {
      expanded.push_back('$');
      ++i;
      continue;
    }
    const std::size_t index = find_value(name);
    if (index == values.size()) {
      error = "rule references undefined value '" + std::string(name) + "'";
      return false;
    }
    rule.captures.emplace_back(index, CountCaptureGroups(expanded) + 1U);
    expanded += values[index].regex;
    i = next;
  }
  return true;
}

bool ParseRuleLine(std::string_view line, std::size_t line_no,
                   const std::vector<TextFsmValue>& values, TextFsmRule& rule,
                   std::string& error) {
  const std::string prefix = "line " + std::to_string(line_no) + ": ";
  std::string_view body = TrimLeft(line);
  rule.source = std::string(body);

  // The action separator is the last whitespace-prefixed "->".
  std::string_view match = body;
  std::size_t arrow = body.rfind("->");
  while (arrow != std::string_view::npos && arrow > 0U &&
         std::isspace(static_cast<unsigned char>(body[arrow - 1U])) == 0) {
    arrow = arrow == 0U ? std::string_view::npos : body.rfind("->", arrow - 1U);
  }
  if (arrow != std::string_view::npos && arrow > 0U) {
    match = Trim(body.substr(0, arrow));
    if (!ParseAction(body.substr(arrow + 2U), rule, error)) {
      error = prefix + error;
      return false;
    }
  } else {
    match = Trim(body);
  }

  std::string expanded;
  if (!SubstituteValues(match, values, rule, expanded, error)) {
    error = prefix + error;
    return false;
  }
  NamedPattern translated;
  if (!TranslateNamedGroups(expanded, translated, error)) {
    error = prefix + error;
    return false;
  }
  try {
    rule.regex = std::regex(translated.ecmascript, std::regex::ECMAScript);
  } catch (const std::regex_error& ex) {
    error = prefix + "invalid rule regex '" + std::string(match) + "': " + ex.what();
    return false;
  }
  return true;
}

// Mutable per-run value storage.
class RecordBuilder {
public:
  explicit RecordBuilder(const std::vector<TextFsmValue>& values)
      : values_(values), scalars_(values.size()), lists_(values.size()) {}

  void Assign(std::size_t index, const std::string& text) {
    if (values_[index].list) {
      lists_[index].push_back(text);
    } else {
      scalars_[index] = text;
    }
    if (values_[index].fillup && !text.empty()) {
      for (auto row = rows_.rbegin(); row != rows_.rend(); ++row) {
        if (!(*row)[index].empty()) {
          break;
        }
        (*row)[index] = text;
      }
    }
  }

  void Append() {
    if (values_.empty()) {
      return;
    }
    std::vector<std::string> row(values_.size());
    bool any_set = false;
    for (std::size_t i = 0; i < values_.size(); ++i) {
      row[i] = Current(i);
      if (row[i].empty() && values_[i].required) {
        Clear();
        return;
      }
      any_set = any_set || !row[i].empty();
    }
    if (any_set) {
      rows_.push_back(std::move(row));
    }
    Clear();
  }

  // Resets every value that is not Filldown.
  void Clear() {
    for (std::size_t i = 0; i < values_.size(); ++i) {
      if (!values_[i].filldown) {
        scalars_[i].clear();
        lists_[i].clear();
      }
    }
  }

  void ClearAll() {
    for (std::size_t i = 0; i < values_.size(); ++i) {
      scalars_[i].clear();
      lists_[i].clear();
    }
  }

  std::vector<model::NeighborRecord> Records() const {
    std::vector<model::NeighborRecord> records;
    records.reserve(rows_.size());
    for (const auto& row : rows_) {
      model::NeighborRecord record;
      for (std::size_t i = 0; i < values_.size(); ++i) {
        record[values_[i].name] = row[i];
      }
      records.push_back(std::move(record));
    }
    return records;
  }

private:
  std::string Current(std::size_t index) const {
    if (!values_[index].list) {
      return scalars_[index];
    }
    std::string joined;
    for (const std::string& item : lists_[index]) {
      if (!joined.empty()) {
        joined.push_back(' ');
      }
      joined += item;
    }
    return joined;
  }

  const std::vector<TextFsmValue>& values_;
  std::vector<std::string> scalars_;
  std::vector<std::vector<std::string>> lists_;
  std::vector<std::vector<std::string>> rows_;
};

} // namespace

bool CompileTextFsmTemplate(std::string_view text, TextFsmTemplate& compiled, std::string& error) {
  compiled = TextFsmTemplate{};
  const std::vector<std::string> lines = SplitLines(text);

  std::size_t i = 0;
  for (; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    if (IsComment(line)) {
      continue;
    }
    if (IsBlank(line)) {
      break;
    }
    if (line.rfind("Value ", 0) != 0) {
      error = "line " + std::to_string(i + 1U) + ": expected a Value definition or blank line";
      return false;
    }
    TextFsmValue value;
    if (!ParseValueLine(line, i + 1U, value, error)) {
      return false;
    }
    const bool duplicate =
        std::any_of(compiled.values.begin(), compiled.values.end(),
                    [&value](const TextFsmValue& other) { return other.name == value.name; });
    if (duplicate) {
      error = "line " + std::to_string(i + 1U) + ": duplicate value '" + value.name + "'";
      return false;
    }
    compiled.values.push_back(std::move(value));
  }

  std::vector<TextFsmRule>* current = nullptr;
  for (; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    if (IsComment(line)) {
      continue;
    }
    if (IsBlank(line)) {
      current = nullptr;
      continue;
    }

    const bool indented = std::isspace(static_cast<unsigned char>(line.front())) != 0;
    if (!indented) {
      const std::string name(Trim(line));
      if (!IsIdentifier(name)) {
        error = "line " + std::to_string(i + 1U) + ": invalid state name '" + name + "'";
        return false;
      }
      if (name == kEndState) {
        error = "line " + std::to_string(i + 1U) + ": End is a reserved state";
        return false;
      }
      if (compiled.states.count(name) != 0U) {
        error = "line " + std::to_string(i + 1U) + ": duplicate state '" + name + "'";
        return false;
      }
      current = &compiled.states[name];
      continue;
    }

    if (current == nullptr) {
      error = "line " + std::to_string(i + 1U) + ": rule outside of a state";
      return false;
    }
    if (TrimLeft(line).front() != '^') {
      error = "line " + std::to_string(i + 1U) + ": rule must start with '^'";
      return false;
    }
    TextFsmRule rule;
    if (!ParseRuleLine(line, i + 1U, compiled.values, rule, error)) {
      return false;
    }
    current->push_back(std::move(rule));
  }

  if (compiled.states.count(std::string(kStartState)) == 0U) {
    error = "template has no Start state";
    return false;
  }
  // EOF only marks whether the final record is taken; it cannot hold rules.
  if (const auto eof = compiled.states.find(std::string(kEofState));
      eof != compiled.states.end() && !eof->second.empty()) {
    error = "EOF state must be empty";
    return false;
  }
  for (const auto& [state_name, rules] : compiled.states) {
    for (const TextFsmRule& rule : rules) {
      if (!rule.next_state.empty() && rule.next_state != kEndState &&
          rule.next_state != kEofState && compiled.states.count(rule.next_state) == 0U) {
        error = "state '" + state_name + "' transitions to undefined state '" + rule.next_state +
                "'";
        return false;
      }
    }
  }
  return true;
}

bool RunTextFsm(const TextFsmTemplate& compiled,
                std::string_view text,
                std::vector<model::NeighborRecord>& records,
                std::string& error) {
  records.clear();
  RecordBuilder builder(compiled.values);
  std::string state(kStartState);

  for (const std::string& line : SplitLines(text)) {
    const auto state_it = compiled.states.find(state);
    if (state_it == compiled.states.end()) {
      break;
    }

    for (const TextFsmRule& rule : state_it->second) {
      std::smatch match;
      if (!std::regex_search(line, match, rule.regex, std::regex_constants::match_continuous)) {
        continue;
      }

      for (const auto& [value_index, group] : rule.captures) {
        if (group < match.size() && match[group].matched) {
          builder.Assign(value_index, match[group].str());
        }
      }

      if (rule.raises_error) {
        error = "template error in state " + state + ": " +
                (rule.error_message.empty() ? rule.source : rule.error_message) +
                " (line: " + line + ")";
        return false;
      }

      switch (rule.record_op) {
      case TextFsmRecordOp::kRecord:
        builder.Append();
        break;
      case TextFsmRecordOp::kClear:
        builder.Clear();
        break;
      case TextFsmRecordOp::kClearAll:
        builder.ClearAll();
        break;
      case TextFsmRecordOp::kNoRecord:
        break;
      }

      if (!rule.next_state.empty()) {
        state = rule.next_state;
      }
      if (rule.line_op == TextFsmLineOp::kNext) {
        break;
      }
    }

    if (state == kEndState || state == kEofState) {
      break;
    }
  }

  // Implicit EOF record, suppressed by an explicit (empty) EOF state. As in
  // TextFSM, a row holding only Filldown values is still taken.
  if (state != kEndState && compiled.states.count(std::string(kEofState)) == 0U) {
    builder.Append();
  }
  records = builder.Records();
  return true;
}

bool TextFsmMatcher::Match(std::string_view template_text,
                           std::string_view text,
                           std::vector<model::NeighborRecord>& records,
                           std::string& error) const {
  records.clear();
  TextFsmTemplate compiled;
  if (!CompileTextFsmTemplate(template_text, compiled, error)) {
    return false;
  }
  return RunTextFsm(compiled, text, records, error);
}

} // namespace topocrawl::parsing
