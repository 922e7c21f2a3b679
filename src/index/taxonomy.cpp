#include "newsdesk/index/taxonomy.hpp"

#include "newsdesk/common/fs.hpp"

#include <algorithm>
#include <unordered_set>

namespace newsdesk::index {

const std::vector<std::string> &default_categories() {
  static const std::vector<std::string> categories = {
      "Premium",  "Economy",    "Markets", "Law",
      "Technology", "Business", "RealEstate", "Jobs", "PersonalFinance"};
  return categories;
}

CategoryTaxonomy::CategoryTaxonomy() : names_(default_categories()) {}

CategoryTaxonomy::CategoryTaxonomy(std::vector<std::string> names) : names_(std::move(names)) {}

common::Result<CategoryTaxonomy> CategoryTaxonomy::create(std::vector<std::string> names) {
  if (names.empty()) {
    return common::Result<CategoryTaxonomy>::failure(common::ErrorCode::ConfigurationError,
                                                     "taxonomy must name at least one category");
  }
  std::unordered_set<std::string> seen;
  for (auto &name : names) {
    name = common::trim(name);
    if (name.empty()) {
      return common::Result<CategoryTaxonomy>::failure(common::ErrorCode::ConfigurationError,
                                                       "taxonomy contains an empty category");
    }
    if (!seen.insert(name).second) {
      return common::Result<CategoryTaxonomy>::failure(common::ErrorCode::ConfigurationError,
                                                       "duplicate category: " + name);
    }
  }
  return common::Result<CategoryTaxonomy>::success(CategoryTaxonomy(std::move(names)));
}

bool CategoryTaxonomy::contains(const std::string &name) const {
  return index_of(name).has_value();
}

std::optional<std::size_t> CategoryTaxonomy::index_of(const std::string &name) const {
  const auto it = std::find(names_.begin(), names_.end(), name);
  if (it == names_.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - names_.begin());
}

} // namespace newsdesk::index
