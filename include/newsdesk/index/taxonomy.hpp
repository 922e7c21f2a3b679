#pragma once

#include "newsdesk/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace newsdesk::index {

/// Fixed, ordered list of category names.
class CategoryTaxonomy {
public:
  CategoryTaxonomy();

  /// Rejects an empty list, empty names and duplicates.
  [[nodiscard]] static common::Result<CategoryTaxonomy> create(std::vector<std::string> names);

  [[nodiscard]] const std::vector<std::string> &names() const { return names_; }
  [[nodiscard]] std::size_t size() const { return names_.size(); }
  [[nodiscard]] bool contains(const std::string &name) const;
  [[nodiscard]] std::optional<std::size_t> index_of(const std::string &name) const;

  [[nodiscard]] bool operator==(const CategoryTaxonomy &other) const = default;

private:
  explicit CategoryTaxonomy(std::vector<std::string> names);

  std::vector<std::string> names_;
};

[[nodiscard]] const std::vector<std::string> &default_categories();

} // namespace newsdesk::index
