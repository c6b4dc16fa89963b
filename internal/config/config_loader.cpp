#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace pricing::config {

using pricing::runtime::config::RuntimeConfig;
using pricing::runtime::config::SelectionPolicy;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Environment helpers
// ------------------------------------------------------------

namespace {

uint32_t ParseUnsigned(const char* name, const char* raw) {
  const std::string text(raw);
  uint64_t          parsed = 0;
  auto [ptr, ec]           = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || parsed > std::numeric_limits<uint32_t>::max()) {
    throw std::runtime_error(std::string("Invalid value for ") + name + ": '" + text + "'");
  }
  return static_cast<uint32_t>(parsed);
}

template <typename Setter>
void OverrideUnsigned(const char* name, Setter&& set) {
  if (const char* raw = std::getenv(name)) {
    set(ParseUnsigned(name, raw));
  }
}

SelectionPolicy ParseSelectionPolicy(const std::string& text) {
  if (text == "best_discount") return pricing::runtime::config::SELECTION_POLICY_BEST_DISCOUNT;
  if (text == "priority_exclusive") return pricing::runtime::config::SELECTION_POLICY_PRIORITY_EXCLUSIVE;
  throw std::runtime_error("Invalid value for PRICING_SELECTION_POLICY: '" + text + "' (expected best_discount or priority_exclusive)");
}

template <typename Getter, typename Setter>
void DefaultIfZero(Getter&& get, Setter&& set, uint32_t fallback) {
  if (get() == 0) set(fallback);
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  ApplyEnvironmentOverrides(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.database().backend_case() == pricing::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* cache = config.mutable_cache();
  DefaultIfZero([&] { return cache->default_ttl_seconds(); }, [&](uint32_t v) { cache->set_default_ttl_seconds(v); }, 300);
  DefaultIfZero([&] { return cache->cleanup_interval_seconds(); }, [&](uint32_t v) { cache->set_cleanup_interval_seconds(v); }, 300);
  DefaultIfZero([&] { return cache->max_size_mb(); }, [&](uint32_t v) { cache->set_max_size_mb(v); }, 100);
  DefaultIfZero([&] { return cache->max_key_length(); }, [&](uint32_t v) { cache->set_max_key_length(v); }, 200);

  auto* ttl = cache->mutable_ttl();
  DefaultIfZero([&] { return ttl->product_pricing_seconds(); }, [&](uint32_t v) { ttl->set_product_pricing_seconds(v); }, 300);
  DefaultIfZero([&] { return ttl->bulk_pricing_seconds(); }, [&](uint32_t v) { ttl->set_bulk_pricing_seconds(v); }, 300);
  DefaultIfZero([&] { return ttl->price_lists_seconds(); }, [&](uint32_t v) { ttl->set_price_lists_seconds(v); }, 600);
  DefaultIfZero([&] { return ttl->price_list_lines_seconds(); }, [&](uint32_t v) { ttl->set_price_list_lines_seconds(v); }, 600);
  DefaultIfZero([&] { return ttl->products_seconds(); }, [&](uint32_t v) { ttl->set_products_seconds(v); }, 600);
  DefaultIfZero([&] { return ttl->categories_seconds(); }, [&](uint32_t v) { ttl->set_categories_seconds(v); }, 1800);
  DefaultIfZero([&] { return ttl->customer_tiers_seconds(); }, [&](uint32_t v) { ttl->set_customer_tiers_seconds(v); }, 900);

  auto* prefixes = cache->mutable_prefixes();
  if (prefixes->products().empty()) prefixes->set_products("products");
  if (prefixes->categories().empty()) prefixes->set_categories("categories");
  if (prefixes->customer_tiers().empty()) prefixes->set_customer_tiers("customer_tiers");
  if (prefixes->pricing().empty()) prefixes->set_pricing("pricing");

  auto* engine = config.mutable_pricing();
  if (engine->default_tier().empty()) engine->set_default_tier("bronze");
  if (engine->selection_policy() == pricing::runtime::config::SELECTION_POLICY_UNSPECIFIED) {
    engine->set_selection_policy(pricing::runtime::config::SELECTION_POLICY_BEST_DISCOUNT);
  }
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  auto* cache = config.mutable_cache();
  auto* ttl   = cache->mutable_ttl();

  OverrideUnsigned("CACHE_DEFAULT_TTL", [&](uint32_t v) { cache->set_default_ttl_seconds(v); });
  OverrideUnsigned("CACHE_PRODUCT_PRICING_TTL", [&](uint32_t v) { ttl->set_product_pricing_seconds(v); });
  OverrideUnsigned("CACHE_BULK_PRICING_TTL", [&](uint32_t v) { ttl->set_bulk_pricing_seconds(v); });
  OverrideUnsigned("CACHE_PRICE_LISTS_TTL", [&](uint32_t v) { ttl->set_price_lists_seconds(v); });
  OverrideUnsigned("CACHE_PRICE_LIST_LINES_TTL", [&](uint32_t v) { ttl->set_price_list_lines_seconds(v); });
  OverrideUnsigned("CACHE_PRODUCT_DATA_TTL", [&](uint32_t v) { ttl->set_products_seconds(v); });
  OverrideUnsigned("CACHE_CATEGORY_DATA_TTL", [&](uint32_t v) { ttl->set_categories_seconds(v); });
  OverrideUnsigned("CACHE_TIER_DATA_TTL", [&](uint32_t v) { ttl->set_customer_tiers_seconds(v); });
  OverrideUnsigned("CACHE_CLEANUP_INTERVAL", [&](uint32_t v) { cache->set_cleanup_interval_seconds(v); });
  OverrideUnsigned("CACHE_MAX_SIZE_MB", [&](uint32_t v) { cache->set_max_size_mb(v); });
  OverrideUnsigned("CACHE_MAX_KEY_LENGTH", [&](uint32_t v) { cache->set_max_key_length(v); });

  if (const char* tier = std::getenv("PRICING_DEFAULT_TIER")) {
    if (*tier == '\0') {
      throw std::runtime_error("Invalid value for PRICING_DEFAULT_TIER: empty");
    }
    config.mutable_pricing()->set_default_tier(tier);
  }
  if (const char* policy = std::getenv("PRICING_SELECTION_POLICY")) {
    config.mutable_pricing()->set_selection_policy(ParseSelectionPolicy(policy));
  }
}

} // namespace pricing::config
