#include "cleanroom/config.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"
#include "cleanroom/fs.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string required_string(const json &doc, const char *key) {
  const auto it = doc.find(key);
  if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw cleanroom::ConfigError(std::string("config: '") + key +
                                 "' must be a non-empty string");
  }
  return it->get<std::string>();
}

std::vector<std::string> string_list(const json &doc, const char *key) {
  std::vector<std::string> out;
  const auto it = doc.find(key);
  if (it == doc.end() || it->is_null())
    return out;
  if (!it->is_array())
    throw cleanroom::ConfigError(std::string("config: '") + key + "' must be an array");
  for (const auto &v : *it) {
    if (!v.is_string())
      throw cleanroom::ConfigError(std::string("config: '") + key + "' entries must be strings");
    out.push_back(v.get<std::string>());
  }
  return out;
}

std::string pair_field(const json &obj, const char *owner, const char *key, bool allow_empty) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    throw cleanroom::ConfigError(std::string("config: each ") + owner + " entry needs a string '" +
                                 key + "'");
  auto s = it->get<std::string>();
  if (s.empty() && !allow_empty)
    throw cleanroom::ConfigError(std::string("config: ") + owner + " '" + key +
                                 "' must not be empty");
  return s;
}

// Subset of git's check-ref-format rules that matter for a branch we create.
bool valid_branch_name(std::string_view b) {
  if (b.empty() || b.front() == '-' || b.front() == '/' || b.back() == '/' || b.back() == '.' ||
      b.ends_with(".lock") || b == "@")
    return false;
  if (b.find("..") != std::string_view::npos || b.find("//") != std::string_view::npos ||
      b.find("@{") != std::string_view::npos)
    return false;
  for (const char c : b) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7f || c == ' ' || c == '~' || c == '^' || c == ':' || c == '?' ||
        c == '*' || c == '[' || c == '\\')
      return false;
  }
  return true;
}

} // namespace

namespace cleanroom {

PublishConfig parse_config(std::string_view json_text) {
  json doc;
  try {
    doc = json::parse(json_text);
  } catch (const json::parse_error &e) {
    throw ConfigError(std::string("config: malformed JSON: ") + e.what());
  }
  if (!doc.is_object())
    throw ConfigError("config: top level must be an object");

  PublishConfig cfg;
  cfg.remote = required_string(doc, "remote");
  cfg.branch = required_string(doc, "branch");
  if (!valid_branch_name(cfg.branch))
    throw ConfigError("config: '" + cfg.branch + "' is not a valid branch name");

  const auto rules = doc.find("scrub_rules");
  if (rules == doc.end() || !rules->is_array())
    throw ConfigError("config: 'scrub_rules' must be an array");
  for (const auto &r : *rules) {
    if (!r.is_object())
      throw ConfigError("config: each scrub_rules entry must be an object");
    cfg.scrub_rules.push_back(ScrubRule{.find = pair_field(r, "scrub_rules", "find", false),
                                        .replace = pair_field(r, "scrub_rules", "replace", true)});
  }

  cfg.exclude_paths = string_list(doc, "exclude_paths");
  cfg.reset_to_templates = string_list(doc, "reset_to_templates");
  cfg.validation_blocklist = string_list(doc, "validation_blocklist");
  for (const auto &term : cfg.validation_blocklist) {
    if (term.empty())
      throw ConfigError("config: 'validation_blocklist' entries must not be empty");
  }

  if (const auto m = doc.find("markers"); m != doc.end() && !m->is_null()) {
    if (!m->is_array())
      throw ConfigError("config: 'markers' must be an array");
    for (const auto &p : *m) {
      if (!p.is_object())
        throw ConfigError("config: each markers entry must be an object");
      cfg.markers.push_back(MarkerPair{.start = pair_field(p, "markers", "start", false),
                                       .end = pair_field(p, "markers", "end", false)});
    }
  } else {
    cfg.markers.push_back(MarkerPair{.start = std::string(consts::kMarkerStart),
                                     .end = std::string(consts::kMarkerEnd)});
  }

  if (const auto t = doc.find("templates"); t != doc.end() && !t->is_null()) {
    if (!t->is_object())
      throw ConfigError("config: 'templates' must be an object of name -> body");
    for (const auto &[name, body] : t->items()) {
      if (!body.is_string())
        throw ConfigError("config: template '" + name + "' must be a string");
      cfg.templates[name] = body.get<std::string>();
    }
  }

  cfg.commit_message = std::string(consts::kDefaultMessage);
  if (const auto msg = doc.find("commit_message"); msg != doc.end()) {
    if (!msg->is_string() || msg->get<std::string>().empty())
      throw ConfigError("config: 'commit_message' must be a non-empty string");
    cfg.commit_message = msg->get<std::string>();
    if (cfg.commit_message.back() != '\n')
      cfg.commit_message.push_back('\n');
  }

  cfg.author = Identity{.name = std::string(consts::kDefaultAuthorName),
                        .email = std::string(consts::kDefaultAuthorEmail)};
  if (const auto a = doc.find("author"); a != doc.end()) {
    if (!a->is_object())
      throw ConfigError("config: 'author' must be an object with name and email");
    cfg.author.name = pair_field(*a, "author", "name", false);
    cfg.author.email = pair_field(*a, "author", "email", false);
  }
  return cfg;
}

PublishConfig load_config(const std::filesystem::path &path) {
  if (!fs::exists(path)) {
    throw ConfigError("config file not found: " + path.string());
  }
  std::string text;
  try {
    text = fs::read_text(path);
  } catch (const IoError &e) {
    throw ConfigError(std::string("config: ") + e.what());
  }
  return parse_config(text);
}

} // namespace cleanroom
