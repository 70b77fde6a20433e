#pragma once

#include <stdexcept>
#include <string>

namespace evo {

// every failure of an evolve call is terminal, no partial results are returned
class evolution_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// operator or engine called outside of its contract (sizes, empty inputs,
// invalid parameters)
class contract_violation : public evolution_error {
public:
  using evolution_error::evolution_error;
};

class noncomparable_fitness : public evolution_error {
public:
  using evolution_error::evolution_error;
};

class missing_generator : public evolution_error {
public:
  inline missing_generator()
      : evolution_error{"no initial population was supplied and no spawn "
                        "function is configured"} {
  }

  using evolution_error::evolution_error;
};

} // namespace evo
