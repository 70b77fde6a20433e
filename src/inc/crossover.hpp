#pragma once

#include "candidate.hpp"

#include <vector>

namespace evo::cross {

// children produced by the candidate's own crossover, returned unmodified
class singlepoint {
public:
  template<basic_candidate Candidate>
  inline std::vector<Candidate> operator()(Candidate const& left,
                                           Candidate const& right) const {
    auto [first, second] = left.crossover(right);

    std::vector<Candidate> children;
    children.reserve(2);
    children.push_back(std::move(first));
    children.push_back(std::move(second));

    return children;
  }
};

class clone {
public:
  template<basic_candidate Candidate>
  inline std::vector<Candidate> operator()(Candidate const& left,
                                           Candidate const& right) const {
    return {left, right};
  }
};

} // namespace evo::cross
