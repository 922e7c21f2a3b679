#include "newsdesk/config/config.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>

namespace newsdesk::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".newsdesk";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

using common::ErrorCode;
using Warnings = common::Result<std::vector<std::string>>;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("NEWSDESK_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("NEWSDESK_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool is_http_url(const std::string &url) {
  return common::starts_with(url, "https://") || common::starts_with(url, "http://");
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            ErrorCode::ConfigurationError, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *model = env_value("NEWSDESK_EMBEDDING_MODEL"); model != nullptr) {
    config.embedding.model = model;
  }
  if (const char *model = env_value("NEWSDESK_CHAT_MODEL"); model != nullptr) {
    config.llm.model = model;
  }
  if (const char *root = env_value("NEWSDESK_INDEX_ROOT"); root != nullptr) {
    config.persistence.root = expand_config_path(root);
  }

  if (const char *api_key = env_value("NEWSDESK_API_KEY"); api_key != nullptr) {
    config.api_key = std::string(api_key);
    return;
  }
  if (config.api_key.has_value() && !common::trim(*config.api_key).empty()) {
    return;
  }
  if (const char *api_key = env_value("OPENAI_API_KEY"); api_key != nullptr) {
    config.api_key = std::string(api_key);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error_detail());
  }
  const auto &doc = parsed.value();

  Config config;
  if (doc.has("api_key")) {
    config.api_key = expand_config_value(doc.get_string("api_key"));
  }

  auto &embedding = config.embedding;
  embedding.strategy = doc.get_string("embedding.strategy", embedding.strategy);
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.dimensions =
      static_cast<std::size_t>(doc.get_u64("embedding.dimensions", embedding.dimensions));
  embedding.base_url = expand_config_value(doc.get_string("embedding.base_url", embedding.base_url));
  embedding.timeout_ms = doc.get_u64("embedding.timeout_ms", embedding.timeout_ms);
  embedding.batch_size =
      static_cast<std::size_t>(doc.get_u64("embedding.batch_size", embedding.batch_size));

  auto &llm = config.llm;
  llm.model = doc.get_string("llm.model", llm.model);
  llm.base_url = expand_config_value(doc.get_string("llm.base_url", llm.base_url));
  llm.temperature = doc.get_double("llm.temperature", llm.temperature);
  llm.max_tokens = static_cast<std::uint32_t>(doc.get_u64("llm.max_tokens", llm.max_tokens));
  llm.timeout_ms = doc.get_u64("llm.timeout_ms", llm.timeout_ms);

  config.cache.capacity =
      static_cast<std::size_t>(doc.get_u64("cache.capacity", config.cache.capacity));
  config.cache.ttl_seconds = doc.get_u64("cache.ttl_seconds", config.cache.ttl_seconds);

  auto &retrieval = config.retrieval;
  retrieval.top_k = static_cast<std::size_t>(doc.get_u64("retrieval.top_k", retrieval.top_k));
  retrieval.per_category_k =
      static_cast<std::size_t>(doc.get_u64("retrieval.per_category_k", retrieval.per_category_k));
  retrieval.context_max_chars = static_cast<std::size_t>(
      doc.get_u64("retrieval.context_max_chars", retrieval.context_max_chars));
  retrieval.chunk_size =
      static_cast<std::size_t>(doc.get_u64("retrieval.chunk_size", retrieval.chunk_size));
  retrieval.chunk_overlap =
      static_cast<std::size_t>(doc.get_u64("retrieval.chunk_overlap", retrieval.chunk_overlap));

  config.taxonomy.categories =
      doc.get_string_array("taxonomy.categories", config.taxonomy.categories);

  config.persistence.root =
      expand_config_path(doc.get_string("persistence.root", config.persistence.root));
  config.persistence.keep_snapshots = static_cast<std::size_t>(
      doc.get_u64("persistence.keep_snapshots", config.persistence.keep_snapshots));

  config.backup.max_bundle_bytes =
      doc.get_u64("backup.max_bundle_bytes", config.backup.max_bundle_bytes);

  auto &reliability = config.reliability;
  reliability.max_retries = static_cast<std::uint32_t>(
      doc.get_u64("reliability.max_retries", reliability.max_retries));
  reliability.initial_backoff_ms =
      doc.get_u64("reliability.initial_backoff_ms", reliability.initial_backoff_ms);
  reliability.max_backoff_ms = doc.get_u64("reliability.max_backoff_ms", reliability.max_backoff_ms);
  reliability.breaker_failure_threshold = static_cast<std::uint32_t>(doc.get_u64(
      "reliability.breaker_failure_threshold", reliability.breaker_failure_threshold));
  reliability.breaker_open_ms =
      doc.get_u64("reliability.breaker_open_ms", reliability.breaker_open_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error_detail());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.persistence.root = expand_config_path(config.persistence.root);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(ErrorCode::ConfigurationError,
                                           "Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error_detail());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(ErrorCode::IoError,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }

  std::ostringstream file;
  if (config.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.api_key) << "\n";
  }

  file << "\n[embedding]\n";
  file << "strategy = " << common::quote_toml_string(config.embedding.strategy) << "\n";
  file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  file << "dimensions = " << config.embedding.dimensions << "\n";
  file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  file << "timeout_ms = " << config.embedding.timeout_ms << "\n";
  file << "batch_size = " << config.embedding.batch_size << "\n";

  file << "\n[llm]\n";
  file << "model = " << common::quote_toml_string(config.llm.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.llm.base_url) << "\n";
  file << "temperature = " << config.llm.temperature << "\n";
  file << "max_tokens = " << config.llm.max_tokens << "\n";
  file << "timeout_ms = " << config.llm.timeout_ms << "\n";

  file << "\n[cache]\n";
  file << "capacity = " << config.cache.capacity << "\n";
  file << "ttl_seconds = " << config.cache.ttl_seconds << "\n";

  file << "\n[retrieval]\n";
  file << "top_k = " << config.retrieval.top_k << "\n";
  file << "per_category_k = " << config.retrieval.per_category_k << "\n";
  file << "context_max_chars = " << config.retrieval.context_max_chars << "\n";
  file << "chunk_size = " << config.retrieval.chunk_size << "\n";
  file << "chunk_overlap = " << config.retrieval.chunk_overlap << "\n";

  file << "\n[taxonomy]\n";
  file << "categories = " << string_array_to_toml(config.taxonomy.categories) << "\n";

  file << "\n[persistence]\n";
  file << "root = " << common::quote_toml_string(config.persistence.root) << "\n";
  file << "keep_snapshots = " << config.persistence.keep_snapshots << "\n";

  file << "\n[backup]\n";
  file << "max_bundle_bytes = " << config.backup.max_bundle_bytes << "\n";

  file << "\n[reliability]\n";
  file << "max_retries = " << config.reliability.max_retries << "\n";
  file << "initial_backoff_ms = " << config.reliability.initial_backoff_ms << "\n";
  file << "max_backoff_ms = " << config.reliability.max_backoff_ms << "\n";
  file << "breaker_failure_threshold = " << config.reliability.breaker_failure_threshold << "\n";
  file << "breaker_open_ms = " << config.reliability.breaker_open_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(path, file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string strategy = common::to_lower(common::trim(config.embedding.strategy));
  if (strategy != "openai" && strategy != "local_hash") {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "Invalid embedding.strategy: " + config.embedding.strategy);
  }
  if (common::trim(config.embedding.model).empty() && strategy == "openai") {
    return Warnings::failure(ErrorCode::ConfigurationError, "embedding.model must be set");
  }
  if (config.embedding.dimensions == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError, "embedding.dimensions must be > 0");
  }
  if (config.embedding.batch_size == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError, "embedding.batch_size must be > 0");
  }
  if (config.embedding.timeout_ms == 0 || config.llm.timeout_ms == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "embedding.timeout_ms and llm.timeout_ms must be > 0");
  }
  if (strategy == "openai" && !is_http_url(config.embedding.base_url)) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "embedding.base_url is invalid: " + config.embedding.base_url);
  }
  if (!is_http_url(config.llm.base_url)) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "llm.base_url is invalid: " + config.llm.base_url);
  }
  if (common::trim(config.llm.model).empty()) {
    return Warnings::failure(ErrorCode::ConfigurationError, "llm.model must be set");
  }
  if (config.llm.temperature < 0.0 || config.llm.temperature > 2.0) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "llm.temperature must be between 0.0 and 2.0");
  }

  if (config.cache.capacity == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError, "cache.capacity must be > 0");
  }
  if (config.cache.ttl_seconds == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError, "cache.ttl_seconds must be > 0");
  }

  if (config.retrieval.top_k == 0 || config.retrieval.per_category_k == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "retrieval.top_k and retrieval.per_category_k must be > 0");
  }
  if (config.retrieval.chunk_size == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError, "retrieval.chunk_size must be > 0");
  }
  if (config.retrieval.chunk_overlap >= config.retrieval.chunk_size) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "retrieval.chunk_overlap must be smaller than chunk_size");
  }
  if (config.retrieval.context_max_chars < 600) {
    warnings.push_back("retrieval.context_max_chars below 600 is raised to the per-category floor");
  }

  if (config.taxonomy.categories.empty()) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "taxonomy.categories must list at least one category");
  }
  std::set<std::string> seen;
  for (const auto &category : config.taxonomy.categories) {
    if (common::trim(category).empty()) {
      return Warnings::failure(ErrorCode::ConfigurationError,
                               "taxonomy.categories contains an empty name");
    }
    if (!seen.insert(category).second) {
      return Warnings::failure(ErrorCode::ConfigurationError,
                               "taxonomy.categories contains duplicate: " + category);
    }
  }

  if (common::trim(config.persistence.root).empty()) {
    return Warnings::failure(ErrorCode::ConfigurationError, "persistence.root must be set");
  }
  if (config.persistence.keep_snapshots == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "persistence.keep_snapshots must be >= 1");
  }
  if (config.backup.max_bundle_bytes == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError, "backup.max_bundle_bytes must be > 0");
  }

  if (config.reliability.breaker_failure_threshold == 0) {
    return Warnings::failure(ErrorCode::ConfigurationError,
                             "reliability.breaker_failure_threshold must be > 0");
  }
  if (config.reliability.initial_backoff_ms > config.reliability.max_backoff_ms) {
    warnings.push_back("reliability.initial_backoff_ms exceeds max_backoff_ms");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace newsdesk::config
