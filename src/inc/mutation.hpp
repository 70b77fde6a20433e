#pragma once

#include "candidate.hpp"
#include "errors.hpp"
#include "random.hpp"

#include <fmt/format.h>

#include <cmath>

namespace evo::mutate {

namespace details {

  template<typename Candidate, typename Generator>
  inline void apply(Candidate& target, Generator& generator, double strength) {
    if constexpr (strength_mutable<Candidate, Generator>) {
      target.mutate(generator, strength);
    }
    else {
      target.mutate(generator);
    }
  }

} // namespace details

/** \brief Probabilistic mutation.
 *
 * Each call performs one Bernoulli trial with probability \b rate and, on
 * success, mutates the candidate. Candidates accepting a strength receive
 * \b strength as the bound of the perturbation, others fall back to their plain
 * mutation. */
class gaussian {
public:
  inline gaussian(double rate, double strength)
      : rate_{rate}
      , strength_{strength} {
    if (!is_probability(rate_)) {
      throw contract_violation{
          fmt::format("mutation rate {} is outside [0, 1]", rate_)};
    }

    if (!std::isfinite(strength_) || strength_ < 0.) {
      throw contract_violation{fmt::format(
          "mutation strength {} must be finite and non-negative", strength_)};
    }
  }

  template<typename Candidate, std::uniform_random_bit_generator Generator>
    requires candidate<Candidate, Generator>
  inline void operator()(Candidate& target, Generator& generator) const {
    if (probabilistic_operation<Generator>{generator, rate_}()) {
      details::apply(target, generator, strength_);
    }
  }

  inline auto rate() const noexcept {
    return rate_;
  }

  inline auto strength() const noexcept {
    return strength_;
  }

private:
  double rate_;
  double strength_;
};

class none {
public:
  template<typename Candidate, typename Generator>
  inline void operator()(Candidate& /*unused*/,
                         Generator& /*unused*/) const noexcept {
  }
};

} // namespace evo::mutate
