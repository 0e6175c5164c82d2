#pragma once

#include "core/logging/logger.hpp"
#include "model/device.hpp"
#include "parsing/parse_template.hpp"
#include "parsing/template_matcher.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::parsing {

// Fixed discovery-command -> template file table. A command selects a file when
// its lowercased text contains the key.
struct CommandTemplateFile {
  std::string_view command_substring;
  std::string_view file_name;
};

const std::vector<CommandTemplateFile>& CommandTemplateFiles();

// Prioritized multi-method extraction pipeline.
//
// Templates are kept sorted by ParsesBefore() on every insert. Parse() never
// fails: a template that errors is logged with PARSE_ERROR and skipped, and no
// match at all yields an empty result (normal for leaf devices).
class ExtensibleParser {
public:
  ExtensibleParser(const ITemplateMatcher& matcher,
                   core::logging::Logger& logger,
                   ParsePolicy policy = ParsePolicy::kFirstMatchWins);

  // `name` defaults to "<METHOD>_<priority>".
  void AddTemplate(ParseMethod method, std::string pattern, int priority = 0,
                   std::string name = "");

  // Registers the STRUCTURED template for every command with an entry in
  // CommandTemplateFiles(). Missing or unreadable files are logged with
  // TEMPLATE_LOAD_ERROR and skipped. Returns the number of templates added.
  std::size_t LoadTemplatesFromDirectory(const std::vector<std::string>& commands,
                                         const std::filesystem::path& directory);

  std::vector<model::NeighborRecord> Parse(std::string_view text) const;

  const std::vector<ParseTemplate>& templates() const {
    return templates_;
  }

  ParsePolicy policy() const {
    return policy_;
  }

  void set_policy(ParsePolicy policy) {
    policy_ = policy;
  }

private:
  bool ApplyTemplate(const ParseTemplate& parse_template,
                     const std::string& text,
                     std::vector<model::NeighborRecord>& records,
                     std::string& error) const;

  const ITemplateMatcher& matcher_;
  core::logging::Logger& logger_;
  ParsePolicy policy_;
  std::vector<ParseTemplate> templates_;
};

// Applies `pattern` globally, multiline and case-insensitively, returning one
// record per match with the named groups that participated.
bool ParseWithRegex(std::string_view pattern,
                    const std::string& text,
                    std::vector<model::NeighborRecord>& records,
                    std::string& error);

// Template directory lookup: explicit value, else env NET_TEXTFSM, else
// ./templates/textfsm.
std::filesystem::path DefaultTemplateDirectory(const std::string& explicit_dir);

} // namespace topocrawl::parsing
