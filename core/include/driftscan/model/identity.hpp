// driftscan/model/identity.hpp - Deterministic ids and first-wins merging
#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "driftscan/model/component.hpp"
#include "driftscan/model/design_token.hpp"

namespace driftscan
{

/**
 * Token id derived from (source kind, path, name).
 *
 * - json:       `json:<path>:<key>`
 * - css:        `css:<path>:<name>`         (name without `--` / `$`)
 * - typescript: `typescript:<path>:<typeName>:<name>`
 */
[[nodiscard]] std::string make_token_id(const TokenSource & source, std::string_view name);

/// `<framework>:<path>:<exportName>`
[[nodiscard]] std::string make_component_id(const ComponentSource & source);

/**
 * Insertion-ordered collection keyed by `id` where the first record wins.
 *
 * Later records with an already-seen id are dropped, not merged.
 */
template <class T>
class DedupMap
{
public:
  /// Returns false when a record with the same id was already present.
  bool insert(T item)
  {
    if (!seen_.insert(item.id).second) return false;
    items_.push_back(std::move(item));
    return true;
  }

  void insert_all(std::vector<T> items)
  {
    for (auto & item : items) {
      insert(std::move(item));
    }
  }

  [[nodiscard]] bool contains(const std::string & id) const { return seen_.count(id) != 0; }
  [[nodiscard]] size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] const std::vector<T> & items() const noexcept { return items_; }

  [[nodiscard]] std::vector<T> take() &&
  {
    seen_.clear();
    return std::move(items_);
  }

private:
  std::vector<T> items_;
  std::unordered_set<std::string> seen_;
};

}  // namespace driftscan
