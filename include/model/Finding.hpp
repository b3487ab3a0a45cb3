#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sysvet::model {

enum class Category { Startup, Service, Process, Disk, Driver, ScheduledTask };

inline constexpr std::array<Category, 6> kAllCategories = {
  Category::Startup, Category::Service, Category::Process,
  Category::Disk, Category::Driver, Category::ScheduledTask
};

// Ordered: OK < Warning < Critical
enum class Severity { OK = 0, Warning = 1, Critical = 2 };

// Low/Medium/High are only assigned to startup items
enum class Impact { None, Low, Medium, High };

// A metric value that could not be read (usually a privilege problem)
struct Unknown {
  bool operator==(const Unknown&) const = default;
};

using MetricValue = std::variant<Unknown, double, std::string>;

// Ordered by name so descriptions and comparisons are deterministic
using Metrics = std::map<std::string, MetricValue, std::less<>>;

struct Finding {
  Category category{Category::Startup};
  std::string identifier;
  Metrics metrics;
  Severity severity{Severity::OK};
  Impact impact{Impact::None};
  std::string description;
  bool third_party{false};
  // A required metric was Unknown and known metrics did not raise the tier
  bool indeterminate{false};

  bool operator==(const Finding&) const = default;
};

[[nodiscard]] const char* to_string(Category c);
[[nodiscard]] const char* to_string(Severity s);
[[nodiscard]] const char* to_string(Impact i);

// Accepts "startup", "services"/"service", "processes"/"process", "disk",
// "drivers"/"driver", "tasks"/"scheduled"/"scheduledtask" (case-insensitive)
[[nodiscard]] std::optional<Category> parse_category(std::string_view name);

// Metric accessors. number()/text() return nullopt for Unknown or absent.
[[nodiscard]] bool has_metric(const Metrics& m, std::string_view key);
[[nodiscard]] bool is_unknown(const Metrics& m, std::string_view key);
[[nodiscard]] std::optional<double> number(const Metrics& m, std::string_view key);
[[nodiscard]] std::optional<std::string> text(const Metrics& m, std::string_view key);

} // namespace sysvet::model
