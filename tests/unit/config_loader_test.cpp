#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using pricing::config::ConfigLoader;
using pricing::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pricing_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\pricing\\\"quoted\"\\db.sqlite"
pricing:
  default_tier: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\pricing\\\"quoted\"\\db.sqlite");
  assert(config.pricing().default_tier() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(cache:
  default_ttl_seconds: 60
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/pricing-engine.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestDefaultsFillZeroValues() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(cache:
  ttl:
    product_pricing_seconds: 45
  prefixes:
    pricing: "px"
pricing:
  selection_policy: SELECTION_POLICY_PRIORITY_EXCLUSIVE
  sequential_line_fetch: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
  assert(config.cache().default_ttl_seconds() == 300);
  assert(config.cache().cleanup_interval_seconds() == 300);
  assert(config.cache().max_size_mb() == 100);
  assert(config.cache().max_key_length() == 200);
  assert(config.cache().ttl().product_pricing_seconds() == 45);
  assert(config.cache().ttl().bulk_pricing_seconds() == 300);
  assert(config.cache().ttl().price_lists_seconds() == 600);
  assert(config.cache().ttl().price_list_lines_seconds() == 600);
  assert(config.cache().ttl().products_seconds() == 600);
  assert(config.cache().ttl().categories_seconds() == 1800);
  assert(config.cache().ttl().customer_tiers_seconds() == 900);
  assert(config.cache().prefixes().pricing() == "px");
  assert(config.cache().prefixes().products() == "products");
  assert(config.pricing().default_tier() == "bronze");
  assert(config.pricing().selection_policy() == pricing::runtime::config::SELECTION_POLICY_PRIORITY_EXCLUSIVE);
  assert(config.pricing().sequential_line_fetch());

  const auto defaults = ConfigLoader::Defaults();
  assert(defaults.database().has_memory());
  assert(defaults.pricing().selection_policy() == pricing::runtime::config::SELECTION_POLICY_BEST_DISCOUNT);
}

void TestEnvironmentOverrides() {
  const auto yaml_path = WriteYaml("env",
                                   R"(cache:
  default_ttl_seconds: 60
  ttl:
    bulk_pricing_seconds: 30
)");

  setenv("CACHE_DEFAULT_TTL", "120", 1);
  setenv("CACHE_BULK_PRICING_TTL", "15", 1);
  setenv("CACHE_TIER_DATA_TTL", "5", 1);
  setenv("PRICING_DEFAULT_TIER", "silver", 1);
  setenv("PRICING_SELECTION_POLICY", "priority_exclusive", 1);

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.cache().default_ttl_seconds() == 120);
  assert(config.cache().ttl().bulk_pricing_seconds() == 15);
  assert(config.cache().ttl().customer_tiers_seconds() == 5);
  assert(config.pricing().default_tier() == "silver");
  assert(config.pricing().selection_policy() == pricing::runtime::config::SELECTION_POLICY_PRIORITY_EXCLUSIVE);

  unsetenv("CACHE_BULK_PRICING_TTL");
  unsetenv("CACHE_TIER_DATA_TTL");
  unsetenv("PRICING_DEFAULT_TIER");
  unsetenv("PRICING_SELECTION_POLICY");

  for (const char* bad : {"-1", "12s", "", "99999999999"}) {
    setenv("CACHE_DEFAULT_TTL", bad, 1);
    bool threw = false;
    try {
      (void)ConfigLoader::LoadFromYaml(yaml_path.string());
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("CACHE_DEFAULT_TTL") != std::string::npos;
    }
    assert(threw);
  }
  unsetenv("CACHE_DEFAULT_TTL");

  setenv("PRICING_SELECTION_POLICY", "cheapest", 1);
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  unsetenv("PRICING_SELECTION_POLICY");
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsAnError();
  TestDefaultsFillZeroValues();
  TestEnvironmentOverrides();

  std::cout << "pricing_engine_unit_config_loader: pass\n";
  return 0;
}
