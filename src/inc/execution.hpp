#pragma once

#include <cstddef>
#include <exception>
#include <string_view>

namespace evo {

enum class execution { sequential, parallel };

inline constexpr std::string_view execution_name(execution mode) noexcept {
  return mode == execution::parallel ? "parallel" : "sequential";
}

/** \brief Invokes \b fn once for every index in [0, count).
 *
 * With execution::parallel iterations are distributed over OpenMP threads in
 * no particular order, so \b fn must only touch state owned by its index.
 * An exception escaping \b fn is captured and rethrown on the calling thread
 * once all iterations have joined; when several iterations throw, one of the
 * exceptions is rethrown. */
template<typename Fn>
void for_each_index(execution mode, std::size_t count, Fn&& fn) {
  std::exception_ptr failure{};

  auto const last = static_cast<std::ptrdiff_t>(count);

#pragma omp parallel for if (mode == execution::parallel) schedule(dynamic)
  for (std::ptrdiff_t idx = 0; idx < last; ++idx) {
    try {
      fn(static_cast<std::size_t>(idx));
    }
    catch (...) {
#pragma omp critical(evo_for_each_index_failure)
      if (!failure) {
        failure = std::current_exception();
      }
    }
  }

  if (failure) {
    std::rethrow_exception(failure);
  }
}

} // namespace evo
