#pragma once

#include "population.hpp"
#include "statistics.hpp"

#include <functional>
#include <tuple>

namespace evo {

template<typename Event>
struct observer_definition;

template<typename Observer, typename Definitions, typename Event>
concept observer =
    observer_definition<Event>::template satisfies<Observer, Definitions>;

template<typename... Events>
struct observer_tags {};

// raised after every completed generation with the new population and the
// measurements of that generation
struct generation_event_t {};

inline constexpr generation_event_t generation_event{};

template<>
struct observer_definition<generation_event_t> {
  template<typename Observer, typename Definitions>
  inline static constexpr auto satisfies = std::is_invocable_v<
      util::const_ref_t<Observer>,
      util::const_ref_t<population<typename Definitions::candidate_t>>,
      util::const_ref_t<stats::generation_statistics>>;
};

namespace details {

  template<std::size_t Idx, typename Event, typename List>
  struct event_index_impl;

  template<std::size_t Idx, typename Event, typename Ty, typename... Rest>
  struct event_index_impl<Idx, Event, observer_tags<Ty, Rest...>>
      : event_index_impl<Idx + 1, Event, observer_tags<Rest...>> {};

  template<std::size_t Idx, typename Event, typename... Rest>
  struct event_index_impl<Idx, Event, observer_tags<Event, Rest...>>
      : std::integral_constant<std::size_t, Idx> {};

  template<typename Event, typename List>
  inline constexpr auto event_index_v =
      event_index_impl<0, Event, List>::value;

  template<typename Event, typename Observers>
  struct has_observer : std::false_type {};

  template<typename Event, typename... Rest>
  struct has_observer<Event, observer_tags<Event, Rest...>> : std::true_type {};

  template<typename Event, typename This, typename... Rest>
  struct has_observer<Event, observer_tags<This, Rest...>>
      : has_observer<Event, observer_tags<Rest...>> {};

  template<typename Event, typename Observers>
  inline constexpr auto has_observer_v = has_observer<Event, Observers>::value;

} // namespace details

template<typename Event, typename Observer>
class observe {
public:
  using event_t = Event;
  using observer_t = Observer;

public:
  inline constexpr observe(event_t /*unused*/, observer_t const& observer)
      : observer_{observer} {
  }

  inline constexpr observe(event_t /*unused*/, observer_t&& observer)
      : observer_{std::move(observer)} {
  }

  inline auto&& observer() && noexcept {
    return std::move(observer_);
  }

  inline auto& observer() & noexcept {
    return observer_;
  }

private:
  observer_t observer_;
};

template<typename Events, typename... Observers>
class observer_pack {
private:
  using events_t = Events;
  using observers_t = std::tuple<Observers...>;

public:
  inline constexpr explicit observer_pack(events_t /*unused*/,
                                          Observers... observers)
      : observers_{std::move(observers)...} {
  }

  template<typename Event, typename... Args>
  inline void observe(Event /*unused*/, Args&&... args) const {
    if constexpr (details::has_observer_v<Event, events_t>) {
      std::invoke(std::get<details::event_index_v<Event, events_t>>(observers_),
                  std::forward<Args>(args)...);
    }
  }

private:
  observers_t observers_;
};

// no observers registered
using observer_none = observer_pack<observer_tags<>>;

} // namespace evo
