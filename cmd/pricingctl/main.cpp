#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cache/keyed_cache.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/invalidation/entity_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pricing/bulk_pricing_resolver.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/pricing_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using pricing::engine::BulkPricingItem;
using pricing::engine::PricingInput;

static void Usage() {
  std::cout << "Usage:\n"
            << "  pricingctl --config <file.yaml> price <product_id|-> <base_price> <category_id|-> <tier|-> [quantity]\n"
            << "  pricingctl --config <file.yaml> product-price <product_id> <tier|-> [quantity]\n"
            << "  pricingctl --config <file.yaml> bulk <tier|-> <quantity> <id:price:category|->...\n"
            << "  pricingctl --config <file.yaml> invalidate <entity_type> <id|-> <specific|cross_domain|global>\n"
            << "  pricingctl --config <file.yaml> stats\n"
            << "  pricingctl --config <file.yaml> create-price-list <name> <priority> [valid_until]\n"
            << "  pricingctl --config <file.yaml> delete-price-list <price_list_id>\n"
            << "  pricingctl --config <file.yaml> add-line <price_list_id> <all|product:<id>|category:<id>> <percentage|flat> <amount> [min_qty] [max_qty]\n"
            << "  pricingctl --config <file.yaml> create-product <id> <name> <price> [category_id]\n";
}

// "-" means absent.
static std::optional<std::string> Optional(const std::string& value) {
  if (value == "-" || value.empty()) return std::nullopt;
  return value;
}

static std::optional<double> ParseDouble(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stod(value, &consumed);
    if (consumed != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<uint32_t> ParseUint(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stoul(value, &consumed);
    if (consumed != value.size() || value.front() == '-' || parsed > UINT32_MAX) return std::nullopt;
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static void Print(const pricing::model::PricingResult& result) {
  std::cout << "product_id=" << result.product_id.value_or("-") << "\n";
  std::cout << "base_price=" << result.base_price << "\n";
  std::cout << "final_price=" << result.final_price << "\n";
  std::cout << "discount_applied=" << result.discount_applied << "\n";
  std::cout << "discount_percentage=" << result.discount_percentage << "\n";
  std::cout << "applied_price_lists=";
  for (std::size_t i = 0; i < result.applied_price_lists.size(); ++i) {
    if (i > 0) std::cout << ",";
    std::cout << result.applied_price_lists[i];
  }
  std::cout << "\n";
  std::cout << "customer_tier=" << result.customer_tier << "\n";
}

// id:price[:category]
static std::optional<BulkPricingItem> ParseBulkItem(const std::string& value) {
  const auto first = value.find(':');
  if (first == std::string::npos) return std::nullopt;
  const auto second = value.find(':', first + 1);

  BulkPricingItem item;
  item.id    = value.substr(0, first);
  auto price = ParseDouble(value.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1));
  if (!price) return std::nullopt;
  item.price = *price;
  if (second != std::string::npos) item.category_id = Optional(value.substr(second + 1));
  return item;
}

static int Run(pricing::factory::Application& app, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "price") {
    if (args.size() < 5) {
      Usage();
      return 1;
    }

    auto base_price = ParseDouble(args[2]);
    if (!base_price) {
      std::cerr << "invalid base price: " << args[2] << "\n";
      return 1;
    }

    PricingInput input;
    input.product_id    = Optional(args[1]);
    input.base_price    = *base_price;
    input.category_id   = Optional(args[3]);
    input.customer_tier = Optional(args[4]).value_or("");
    if (args.size() >= 6) {
      auto quantity = ParseUint(args[5]);
      if (!quantity) {
        std::cerr << "invalid quantity: " << args[5] << "\n";
        return 1;
      }
      input.quantity = *quantity;
    }

    Print(app.pricing_service->ResolvePrice(input));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "product-price") {
    if (args.size() < 3) {
      Usage();
      return 1;
    }

    uint32_t quantity = 1;
    if (args.size() >= 4) {
      auto parsed = ParseUint(args[3]);
      if (!parsed) {
        std::cerr << "invalid quantity: " << args[3] << "\n";
        return 1;
      }
      quantity = *parsed;
    }

    auto result = app.pricing_service->ResolveProductPrice(args[1], Optional(args[2]), quantity);
    if (!result) {
      std::cerr << "product not found: " << args[1] << "\n";
      return 2;
    }
    Print(*result);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "bulk") {
    if (args.size() < 3) {
      Usage();
      return 1;
    }

    auto quantity = ParseUint(args[2]);
    if (!quantity) {
      std::cerr << "invalid quantity: " << args[2] << "\n";
      return 1;
    }

    std::vector<BulkPricingItem> items;
    for (std::size_t i = 3; i < args.size(); ++i) {
      auto item = ParseBulkItem(args[i]);
      if (!item) {
        std::cerr << "invalid item (want id:price[:category]): " << args[i] << "\n";
        return 1;
      }
      items.push_back(std::move(*item));
    }

    const auto results = app.pricing_service->ResolveBulkPrices(items, Optional(args[1]), *quantity);
    for (std::size_t i = 0; i < results.size(); ++i) {
      if (i > 0) std::cout << "--\n";
      Print(results[i]);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invalidate") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    auto scope = pricing::invalidation::ParseInvalidationScope(args[3]);
    if (!scope) {
      std::cerr << "unsupported scope: " << args[3] << "\n";
      return 1;
    }

    const auto removed = app.pricing_service->Invalidate(args[1], Optional(args[2]), *scope);
    std::cout << "keys_removed=" << removed << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    const auto stats        = app.pricing_service->CacheStats();
    const auto invalidation = app.pricing_service->InvalidationStats();

    std::cout << "hits=" << stats.hits << "\n";
    std::cout << "misses=" << stats.misses << "\n";
    std::cout << "hit_rate=" << stats.HitRate() << "\n";
    std::cout << "sets=" << stats.sets << "\n";
    std::cout << "deletes=" << stats.deletes << "\n";
    std::cout << "expired=" << stats.expired << "\n";
    std::cout << "swept=" << stats.swept << "\n";
    std::cout << "evicted=" << stats.evicted << "\n";
    std::cout << "backend_errors=" << stats.backend_errors << "\n";
    std::cout << "total_keys=" << stats.total_keys << "\n";
    std::cout << "live_keys=" << stats.live_keys << "\n";
    std::cout << "bytes=" << stats.bytes << "\n";
    for (const auto& [prefix, count] : stats.keys_by_prefix) {
      std::cout << "keys." << prefix << "=" << count << "\n";
    }
    std::cout << "invalidations=" << invalidation.calls << "\n";
    std::cout << "invalidated_keys=" << invalidation.keys_removed << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create-price-list") {
    if (args.size() < 3) {
      Usage();
      return 1;
    }

    auto priority = ParseUint(args[2]);
    if (!priority) {
      std::cerr << "invalid priority: " << args[2] << "\n";
      return 1;
    }

    pricing::db::model::PriceListRecord list;
    list.name       = args[1];
    list.priority   = *priority;
    list.valid_from = pricing::util::Now();
    if (args.size() >= 4) {
      list.valid_until = pricing::util::ParseTimestamp(args[3]);
      if (!list.valid_until) {
        std::cerr << "invalid timestamp: " << args[3] << "\n";
        return 1;
      }
    }

    std::cout << "id=" << app.admin_service->CreatePriceList(std::move(list)).id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-price-list") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    app.admin_service->DeletePriceList(args[1]);
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-line") {
    if (args.size() < 5) {
      Usage();
      return 1;
    }

    pricing::db::model::PriceListLineRecord line;
    line.price_list_id = args[1];

    const auto& scope = args[2];
    const auto  colon = scope.find(':');
    auto        type  = pricing::model::ParseLineType(scope.substr(0, colon));
    if (!type) {
      std::cerr << "unsupported line type: " << scope << "\n";
      return 1;
    }
    line.type = *type;
    if (colon != std::string::npos) {
      if (line.type == pricing::model::LineType::kProduct) line.product_id = scope.substr(colon + 1);
      if (line.type == pricing::model::LineType::kCategory) line.category_id = scope.substr(colon + 1);
    }

    auto discount_type = pricing::model::ParseDiscountType(args[3]);
    auto amount        = ParseDouble(args[4]);
    if (!discount_type || !amount) {
      std::cerr << "invalid discount: " << args[3] << " " << args[4] << "\n";
      return 1;
    }
    line.discount_type = *discount_type;
    line.amount        = *amount;

    if (args.size() >= 6) {
      auto min_quantity = ParseUint(args[5]);
      if (!min_quantity) {
        std::cerr << "invalid min quantity: " << args[5] << "\n";
        return 1;
      }
      line.min_quantity = *min_quantity;
    }
    if (args.size() >= 7) {
      line.max_quantity = ParseUint(args[6]);
      if (!line.max_quantity) {
        std::cerr << "invalid max quantity: " << args[6] << "\n";
        return 1;
      }
    }

    std::cout << "id=" << app.admin_service->CreatePriceListLine(std::move(line)).id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create-product") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    auto price = ParseDouble(args[3]);
    if (!price) {
      std::cerr << "invalid price: " << args[3] << "\n";
      return 1;
    }

    pricing::db::model::ProductRecord product;
    product.id    = args[1];
    product.name  = args[2];
    product.price = *price;
    if (args.size() >= 5) product.category_id = Optional(args[4]);

    std::cout << "id=" << app.admin_service->CreateProduct(std::move(product)).id << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = pricing::config::ConfigLoader::LoadFromYaml(config_path);
    pricing::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    pricing::factory::BuildOptions options;
    options.start_sweeper = false;
    auto app              = pricing::factory::Build(config, options);

    const int rc = Run(app, args);

    app.Shutdown();
    pricing::observability::ShutdownLogging();
    return rc;
  } catch (const pricing::util::ValidationError& e) {
    std::cerr << "validation failed: " << e.what() << "\n";
  } catch (const pricing::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const pricing::util::AlreadyExists& e) {
    std::cerr << "already exists: " << e.what() << "\n";
  } catch (const std::exception& e) {
    PRICING_LOG_ERROR("Fatal error", {pricing::observability::StringField("error", e.what())});
  }

  pricing::observability::ShutdownLogging();
  return 2;
}
