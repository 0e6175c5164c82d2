#include "parsing/extensible_parser.hpp"

#include "core/errors/discovery_error.hpp"
#include "core/fs_utils.hpp"
#include "parsing/named_regex.hpp"
#include "parsing/text_cleanup.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <system_error>

namespace topocrawl::parsing {

namespace {

using core::errors::DiscoveryErrorCode;
using core::errors::FormatDiscoveryError;

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

void CleanRecordValues(std::vector<model::NeighborRecord>& records) {
  for (model::NeighborRecord& record : records) {
    for (auto& [key, value] : record) {
      value = CleanValue(value);
    }
  }
}

} // namespace

const std::vector<CommandTemplateFile>& CommandTemplateFiles() {
  static const std::vector<CommandTemplateFile> kFiles = {
      {"show cdp neighbors detail", "cisco_ios_show_cdp_neighbors_detail.textfsm"},
      {"show lldp neighbors detail", "cisco_ios_show_lldp_neighbors_detail.textfsm"},
      {"show lldp neighbor detail", "arista_eos_show_lldp_neighbors_detail.textfsm"},
  };
  return kFiles;
}

std::filesystem::path DefaultTemplateDirectory(const std::string& explicit_dir) {
  if (!explicit_dir.empty()) {
    return explicit_dir;
  }
  const char* env_dir = std::getenv("NET_TEXTFSM");
  if (env_dir != nullptr && env_dir[0] != '\0') {
    return env_dir;
  }
  return std::filesystem::path("templates") / "textfsm";
}

ExtensibleParser::ExtensibleParser(const ITemplateMatcher& matcher,
                                   core::logging::Logger& logger,
                                   const ParsePolicy policy)
    : matcher_(matcher), logger_(logger), policy_(policy) {}

void ExtensibleParser::AddTemplate(const ParseMethod method, std::string pattern,
                                   const int priority, std::string name) {
  ParseTemplate parse_template;
  parse_template.method = method;
  parse_template.pattern = std::move(pattern);
  parse_template.priority = priority;
  parse_template.name =
      name.empty() ? std::string(ToString(method)) + "_" + std::to_string(priority)
                   : std::move(name);

  const auto position = std::upper_bound(templates_.begin(), templates_.end(), parse_template,
                                         ParsesBefore);
  templates_.insert(position, std::move(parse_template));
}

std::size_t ExtensibleParser::LoadTemplatesFromDirectory(const std::vector<std::string>& commands,
                                                         const std::filesystem::path& directory) {
  std::error_code ec;
  std::filesystem::path root = directory;
  if (!std::filesystem::is_directory(root, ec)) {
    logger_.Error("template directory does not exist",
                  {{"error", FormatDiscoveryError(DiscoveryErrorCode::kTemplateLoad,
                                                  "missing directory " + root.string())}});
    if (root.is_absolute()) {
      return 0;
    }
    const std::filesystem::path absolute = std::filesystem::absolute(root, ec);
    if (ec || !std::filesystem::is_directory(absolute, ec)) {
      return 0;
    }
    logger_.Info("found template directory at absolute path", {{"path", absolute.string()}});
    root = absolute;
  }

  std::size_t loaded = 0;
  for (const std::string& command : commands) {
    const std::string lowered = ToLower(command);
    for (const CommandTemplateFile& entry : CommandTemplateFiles()) {
      if (lowered.find(entry.command_substring) == std::string::npos) {
        continue;
      }
      const std::filesystem::path path = root / std::string(entry.file_name);
      std::string content;
      std::string read_error;
      if (!std::filesystem::is_regular_file(path, ec)) {
        logger_.Warn("template file not found",
                     {{"command", command},
                      {"error", FormatDiscoveryError(DiscoveryErrorCode::kTemplateLoad,
                                                     path.string())}});
        continue;
      }
      if (!core::ReadTextFile(path, content, read_error)) {
        logger_.Error("template file unreadable",
                      {{"command", command},
                       {"error", FormatDiscoveryError(DiscoveryErrorCode::kTemplateLoad,
                                                      read_error)}});
        continue;
      }

      std::string name = path.stem().string();
      AddTemplate(ParseMethod::kStructured, std::move(content), 0, std::move(name));
      ++loaded;
      logger_.Info("loaded structured template",
                   {{"template", entry.file_name}, {"command", command}});
    }
  }

  if (loaded == 0U) {
    logger_.Warn("no structured templates were loaded", {{"dir", root.string()}});
  }
  return loaded;
}

bool ParseWithRegex(std::string_view pattern,
                    const std::string& text,
                    std::vector<model::NeighborRecord>& records,
                    std::string& error) {
  records.clear();
  NamedPattern translated;
  if (!TranslateNamedGroups(pattern, translated, error)) {
    return false;
  }

  std::regex compiled;
  try {
    compiled = std::regex(translated.ecmascript,
                          std::regex::ECMAScript | std::regex::icase | std::regex::multiline);
  } catch (const std::regex_error& ex) {
    error = std::string("invalid regex: ") + ex.what();
    return false;
  }

  for (auto it = std::sregex_iterator(text.begin(), text.end(), compiled);
       it != std::sregex_iterator(); ++it) {
    const std::smatch& match = *it;
    model::NeighborRecord record;
    for (const auto& [name, group] : translated.groups) {
      if (group < match.size() && match[group].matched) {
        record[name] = match[group].str();
      }
    }
    if (!record.empty()) {
      records.push_back(std::move(record));
    }
  }
  return true;
}

bool ExtensibleParser::ApplyTemplate(const ParseTemplate& parse_template,
                                     const std::string& text,
                                     std::vector<model::NeighborRecord>& records,
                                     std::string& error) const {
  if (parse_template.pattern.empty()) {
    error = "template is empty";
    return false;
  }
  const bool ok = parse_template.method == ParseMethod::kStructured
                      ? matcher_.Match(parse_template.pattern, text, records, error)
                      : ParseWithRegex(parse_template.pattern, text, records, error);
  if (ok) {
    CleanRecordValues(records);
  }
  return ok;
}

std::vector<model::NeighborRecord> ExtensibleParser::Parse(std::string_view text) const {
  const std::string cleaned = CleanText(text);
  std::vector<model::NeighborRecord> accumulated;

  logger_.Debug("parsing output", {{"templates", std::to_string(templates_.size())}});
  for (const ParseTemplate& parse_template : templates_) {
    std::vector<model::NeighborRecord> records;
    std::string error;
    if (!ApplyTemplate(parse_template, cleaned, records, error)) {
      logger_.Warn("template failed; trying next",
                   {{"template", parse_template.name},
                    {"error", FormatDiscoveryError(DiscoveryErrorCode::kParse, error)}});
      continue;
    }
    if (records.empty()) {
      logger_.Debug("template produced no records", {{"template", parse_template.name}});
      continue;
    }

    logger_.Debug("template produced records",
                  {{"template", parse_template.name},
                   {"method", ToString(parse_template.method)},
                   {"records", std::to_string(records.size())}});
    if (policy_ == ParsePolicy::kFirstMatchWins) {
      return records;
    }
    accumulated.insert(accumulated.end(), std::make_move_iterator(records.begin()),
                       std::make_move_iterator(records.end()));
  }

  if (accumulated.empty()) {
    logger_.Debug("no parsing template produced results");
  }
  return accumulated;
}

} // namespace topocrawl::parsing
