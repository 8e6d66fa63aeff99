#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "utils/exceptions.hpp"

namespace batchwire {
// =============================================================================
// Slot addressing
// -----------------------------------------------------------------------------
// A slot is either a positional index or a keyword name. The two alternatives
// of the variant keep both addressing spaces apart: index 0 and key "0" are
// different slots.
// =============================================================================

using SlotAddress = std::variant<std::size_t, std::string>;

inline auto
is_positional(const SlotAddress& address) -> bool
{
  return std::holds_alternative<std::size_t>(address);
}

inline auto
slot_address_to_string(const SlotAddress& address) -> std::string
{
  if (const auto* index = std::get_if<std::size_t>(&address)) {
    return std::to_string(*index);
  }
  return std::get<std::string>(address);
}

template <typename T>
struct SlotView {
  SlotAddress address;
  const T& value;
};

// =============================================================================
// Params<T>
// -----------------------------------------------------------------------------
// Ordered/named collection holding the positional and keyword arguments of a
// call. The same template is used for a call's arguments (Params<Payload>)
// and for per-slot batch data (Params<IndexList>, Params<std::vector<T>>).
//
// Instances are never mutated once built; every transformation returns a new
// container with the same slot addressing.
// =============================================================================

template <typename T>
class Params {
 public:
  using value_type = T;
  using PositionalList = std::vector<T>;
  using NamedMap = std::map<std::string, T, std::less<>>;

  Params() = default;
  explicit Params(PositionalList positional, NamedMap named = {})
      : positional_(std::move(positional)), named_(std::move(named))
  {
  }

  // Integer keys become positional slots in ascending key order; gaps between
  // keys are compacted, not filled. String keys become named slots.
  [[nodiscard]] static auto from_mapping(std::map<SlotAddress, T> data)
      -> Params<T>
  {
    PositionalList positional;
    NamedMap named;
    for (auto& [address, value] : data) {
      if (is_positional(address)) {
        positional.push_back(std::move(value));
      } else {
        named.emplace(std::get<std::string>(address), std::move(value));
      }
    }
    return Params<T>(std::move(positional), std::move(named));
  }

  [[nodiscard]] auto positional() const -> const PositionalList&
  {
    return positional_;
  }
  [[nodiscard]] auto named() const -> const NamedMap& { return named_; }

  [[nodiscard]] auto size() const -> std::size_t
  {
    return positional_.size() + named_.size();
  }
  [[nodiscard]] auto empty() const -> bool { return size() == 0; }

  [[nodiscard]] auto at(const SlotAddress& address) const -> const T&
  {
    if (const auto* index = std::get_if<std::size_t>(&address)) {
      if (*index >= positional_.size()) {
        throw MissingSlotException(
            "No positional slot " + std::to_string(*index) + " (call has " +
            std::to_string(positional_.size()) + ")");
      }
      return positional_[*index];
    }
    const auto iter = named_.find(std::get<std::string>(address));
    if (iter == named_.end()) {
      throw MissingSlotException(
          "No named slot '" + std::get<std::string>(address) + "'");
    }
    return iter->second;
  }

  // Positional slots first in index order, then named slots in key order.
  // Each call builds a fresh sequence of views into this container, valid
  // while the container lives; temporaries cannot be viewed.
  [[nodiscard]] auto items() const& -> std::vector<SlotView<T>>
  {
    std::vector<SlotView<T>> result;
    result.reserve(size());
    for (std::size_t idx = 0; idx < positional_.size(); ++idx) {
      result.push_back(SlotView<T>{SlotAddress{idx}, positional_[idx]});
    }
    for (const auto& [key, value] : named_) {
      result.push_back(SlotView<T>{SlotAddress{key}, value});
    }
    return result;
  }
  auto items() const&& -> std::vector<SlotView<T>> = delete;

  [[nodiscard]] auto sample() const -> const T&
  {
    if (!positional_.empty()) {
      return positional_.front();
    }
    if (!named_.empty()) {
      return named_.begin()->second;
    }
    throw EmptyParamsException(
        "Cannot sample a Params container with no slot");
  }

  [[nodiscard]] auto all_equal() const -> bool
  {
    const T& first = sample();
    const auto equals_first = [&first](const T& value) {
      return value == first;
    };
    return std::all_of(positional_.begin(), positional_.end(), equals_first) &&
           std::all_of(named_.begin(), named_.end(), [&](const auto& entry) {
             return equals_first(entry.second);
           });
  }

  [[nodiscard]] auto same_addressing(const Params<T>& other) const -> bool
  {
    if (positional_.size() != other.positional_.size() ||
        named_.size() != other.named_.size()) {
      return false;
    }
    return std::equal(
        named_.begin(), named_.end(), other.named_.begin(),
        [](const auto& lhs, const auto& rhs) {
          return lhs.first == rhs.first;
        });
  }

  [[nodiscard]] auto describe_addressing() const -> std::string
  {
    std::string description =
        "positional=" + std::to_string(positional_.size()) + ", named=[";
    bool first = true;
    for (const auto& [key, value] : named_) {
      if (!first) {
        description += ", ";
      }
      description += key;
      first = false;
    }
    description += "]";
    return description;
  }

  template <typename Func>
  [[nodiscard]] auto map(Func&& func) const
      -> Params<std::remove_cvref_t<std::invoke_result_t<Func&, const T&>>>
  {
    using Out = std::remove_cvref_t<std::invoke_result_t<Func&, const T&>>;
    typename Params<Out>::PositionalList positional;
    positional.reserve(positional_.size());
    for (const auto& value : positional_) {
      positional.push_back(std::invoke(func, value));
    }
    typename Params<Out>::NamedMap named;
    for (const auto& [key, value] : named_) {
      named.emplace(key, std::invoke(func, value));
    }
    return Params<Out>(std::move(positional), std::move(named));
  }

  // Lock-step iteration over sequence-valued slots: the i-th container holds
  // the i-th element of every slot. Iteration stops with the shortest slot.
  template <typename U = T>
  [[nodiscard]] auto iter() const
      -> std::vector<Params<typename U::value_type>>
  {
    using Element = typename U::value_type;
    std::vector<Params<Element>> rows;
    if (empty()) {
      return rows;
    }

    std::size_t length = std::numeric_limits<std::size_t>::max();
    for (const auto& value : positional_) {
      length = std::min<std::size_t>(length, std::size(value));
    }
    for (const auto& [key, value] : named_) {
      length = std::min<std::size_t>(length, std::size(value));
    }

    rows.reserve(length);
    for (std::size_t row = 0; row < length; ++row) {
      typename Params<Element>::PositionalList positional;
      positional.reserve(positional_.size());
      for (const auto& value : positional_) {
        positional.push_back(value[row]);
      }
      typename Params<Element>::NamedMap named;
      for (const auto& [key, value] : named_) {
        named.emplace(key, value[row]);
      }
      rows.emplace_back(std::move(positional), std::move(named));
    }
    return rows;
  }

  // Splits a container of pairs into two containers with the same addressing.
  template <typename U = T>
  [[nodiscard]] auto unzip() const -> std::pair<
      Params<typename U::first_type>, Params<typename U::second_type>>
  {
    return {
        map([](const U& pair) { return pair.first; }),
        map([](const U& pair) { return pair.second; })};
  }

  // Applies `agg_func` to the ordered values found at each slot across
  // `params_list`. Every container must share the addressing of the first.
  template <typename Func>
  [[nodiscard]] static auto agg(
      std::span<const Params<T>> params_list, Func&& agg_func)
      -> Params<std::remove_cvref_t<
          std::invoke_result_t<Func&, std::span<const T>>>>
  {
    using Out = std::remove_cvref_t<
        std::invoke_result_t<Func&, std::span<const T>>>;
    if (params_list.empty()) {
      return Params<Out>{};
    }

    const Params<T>& first = params_list.front();
    for (std::size_t idx = 1; idx < params_list.size(); ++idx) {
      if (!first.same_addressing(params_list[idx])) {
        throw SlotAddressingMismatchException(
            "Call " + std::to_string(idx) + " has slots {" +
            params_list[idx].describe_addressing() +
            "} but call 0 has slots {" + first.describe_addressing() + "}");
      }
    }

    std::vector<T> column;
    column.reserve(params_list.size());
    const auto aggregate_column = [&](const auto& pick) {
      column.clear();
      for (const auto& params : params_list) {
        column.push_back(pick(params));
      }
      return std::invoke(agg_func, std::span<const T>(column));
    };

    typename Params<Out>::PositionalList positional;
    positional.reserve(first.positional_.size());
    for (std::size_t slot = 0; slot < first.positional_.size(); ++slot) {
      positional.push_back(
          aggregate_column([slot](const Params<T>& params) -> const T& {
            return params.positional_[slot];
          }));
    }

    typename Params<Out>::NamedMap named;
    for (const auto& [key, value] : first.named_) {
      named.emplace(
          key, aggregate_column([&key](const Params<T>& params) -> const T& {
            return params.named_.find(key)->second;
          }));
    }
    return Params<Out>(std::move(positional), std::move(named));
  }

  // Without an aggregate function the per-slot value sequences are returned.
  [[nodiscard]] static auto agg(std::span<const Params<T>> params_list)
      -> Params<std::vector<T>>
  {
    return agg(params_list, [](std::span<const T> values) {
      return std::vector<T>(values.begin(), values.end());
    });
  }

  auto operator==(const Params&) const -> bool = default;

 private:
  PositionalList positional_;
  NamedMap named_;
};

}  // namespace batchwire
