#pragma once

/** \file filter_expr.hpp
 *  \brief Conjunctive property filter as handed over by the service layer.
 *
 * Ownership: value-semantic and self-contained.
 * Semantics: every predicate and every required flag must hold (logical AND).
 * An empty filter matches every property.
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace homeindex {

/** \brief Raw predicate operand before type checking against the attribute. */
using predicate_value = std::variant<std::string, double, std::int64_t, bool>;

/** \brief Equality predicate field == value. */
struct term {
  std::string field; /**< attribute name */
  predicate_value value;
};

/** \brief Inclusive range predicate min_value <= field <= max_value. */
struct range {
  std::string field; /**< attribute name */
  predicate_value min_value; /**< inclusive */
  predicate_value max_value; /**< inclusive */
};

using predicate = std::variant<term, range>;

/** \brief AND of predicates plus feature flags that must be true. */
struct query_filter {
  std::vector<predicate> predicates;
  std::vector<std::string> required_flags; /**< e.g. "has_garage" */

  auto empty() const noexcept -> bool { return predicates.empty() && required_flags.empty(); }
};

} // namespace homeindex
