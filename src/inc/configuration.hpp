#pragma once

#include "candidate.hpp"
#include "execution.hpp"
#include "observing.hpp"
#include "operation.hpp"

namespace evo {
namespace config {

  // clang-format off

  template<typename Section>
  concept section =
      !std::is_final_v<Section> && std::copy_constructible<Section> &&
      std::move_constructible<Section>;

  // clang-format on

  template<template<typename> class... Interfaces>
  struct plist {};

  template<template<typename> class Key, typename Unlocked>
  struct entry {};

  template<typename... Maps>
  struct entry_map {};

  namespace details {

    template<typename Map, template<typename> class Match>
    struct entry_map_match;

    template<template<typename> class Match>
    struct entry_map_match<entry_map<>, Match> {
      using unlocked_t = plist<>;
    };

    template<typename Unlocked,
             typename... Rest,
             template<typename>
             class Match>
    struct entry_map_match<entry_map<entry<Match, Unlocked>, Rest...>, Match> {
      using unlocked_t = Unlocked;
    };

    template<typename Entry, typename... Rest, template<typename> class Match>
    struct entry_map_match<entry_map<Entry, Rest...>, Match>
        : entry_map_match<entry_map<Rest...>, Match> {};

    class empty_section {};

    template<section... Sections>
    class section_node;

    template<>
    class section_node<> {};

    template<section... Sections>
    class section_node<details::empty_section, Sections...>
        : public section_node<Sections...> {
    public:
      using section_t = details::empty_section;
      using base_t = section_node<Sections...>;

    public:
      inline constexpr section_node() noexcept {
      }

      inline constexpr section_node(section_t const& /*unused*/,
                                    base_t const& /*unused*/) noexcept {
      }
    };

    template<section Section, section... Sections>
    class section_node<Section, Sections...>
        : public Section, public section_node<Sections...> {
    public:
      using section_t = Section;
      using base_t = section_node<Sections...>;

    public:
      inline constexpr section_node(section_t const& current,
                                    base_t const& base)
          : section_t{current}
          , base_t{base} {
      }
    };

    template<typename Left, typename Right>
    struct plist_merge;

    template<template<typename> class... Lefts,
             template<typename>
             class... Rights>
    struct plist_merge<plist<Lefts...>, plist<Rights...>> {
      using type = plist<Lefts..., Rights...>;
    };

    template<typename Left, typename Right>
    using plist_merge_t = typename plist_merge<Left, Right>::type;

    template<template<typename> class Interface, typename Interfaces>
    struct plist_add;

    template<template<typename> class Interface,
             template<typename>
             class... Interfaces>
    struct plist_add<Interface, plist<Interfaces...>> {
      using type = plist<Interface, Interfaces...>;
    };

    template<template<typename> class Interface, typename Interfaces>
    using plist_add_t = typename plist_add<Interface, Interfaces>::type;

    template<template<typename> class Interface, typename Interfaces>
    struct plist_remove;

    template<template<typename> class Interface>
    struct plist_remove<Interface, plist<>> {
      using type = plist<>;
    };

    template<template<typename> class Interface,
             template<typename>
             class Current,
             template<typename>
             class... Interfaces>
    struct plist_remove<Interface, plist<Current, Interfaces...>> {
      using type = plist_add_t<
          Current,
          typename plist_remove<Interface, plist<Interfaces...>>::type>;
    };

    template<template<typename> class Interface,
             template<typename>
             class... Interfaces>
    struct plist_remove<Interface, plist<Interface, Interfaces...>> {
      using type = plist<Interfaces...>;
    };

    template<template<typename> class Interface, typename Interfaces>
    using plist_remove_t = typename plist_remove<Interface, Interfaces>::type;

    template<typename Built, typename Interfaces>
    class ptype_node {};

    template<typename Built>
    class ptype_node<Built, plist<>> {
    public:
      inline constexpr explicit ptype_node(Built const* /*unused*/) noexcept {
      }
    };

    template<typename Built,
             template<typename>
             class Interface,
             template<typename>
             class... Interfaces>
    class ptype_node<Built, plist<Interface, Interfaces...>>
        : public Interface<Built>,
          public ptype_node<Built, plist<Interfaces...>> {
    public:
      inline constexpr explicit ptype_node(Built const* current)
          : Interface<Built>{current}
          , ptype_node<Built, plist<Interfaces...>>{current} {
      }
    };

    template<typename Entries,
             typename Available,
             typename Used,
             section... Sections>
    class builder_node;

    template<typename Entries,
             typename Available,
             typename Used,
             typename Section,
             typename... Sections>
    class built : public section_node<Section, Sections...> {
    public:
      using entries_t = Entries;
      using section_t = Section;

      using previous_t = section_node<Sections...>;
      using base_t = section_node<Section, Sections...>;

    public:
      inline constexpr built() noexcept
        requires(std::is_same_v<section_t, empty_section>)
      {
      }

      inline constexpr built(section_t const& current,
                             previous_t const& previous)
          : base_t{current, previous} {
      }

      template<template<typename> class This,
               typename Unlocked,
               section Appended>
      using builder_t =
          builder_node<entries_t,
                       plist_remove_t<This, plist_merge_t<Unlocked, Available>>,
                       plist_add_t<This, Used>,
                       Appended,
                       Section,
                       Sections...>;
    };

    template<typename Entries, typename Available, typename Used>
    class builder_node<Entries, Available, Used> {};

    template<typename Entries,
             typename Available,
             typename Used,
             section Section,
             section... Rest>
    class builder_node<Entries, Available, Used, Section, Rest...>
        : public built<Entries, Available, Used, Section, Rest...>,
          public ptype_node<built<Entries, Available, Used, Section, Rest...>,
                            Available> {
    public:
      using built_base_t = built<Entries, Available, Used, Section, Rest...>;
      using ptype_base_t = ptype_node<built_base_t, Available>;
      using current_section_t = typename built_base_t::section_t;
      using previous_section_t = typename built_base_t::previous_t;

    public:
      inline constexpr builder_node() noexcept
        requires(std::is_same_v<current_section_t, empty_section>)
          : ptype_base_t{this} {
      }

      inline constexpr builder_node(current_section_t const& current,
                                    previous_section_t const& previous)
          : built_base_t{current, previous}
          , ptype_base_t{this} {
      }

      inline constexpr auto end() const {
        return static_cast<built_base_t>(*this);
      }

      template<template<typename> class Algorithm, typename... Args>
      inline constexpr auto build(Args&&... args) const {
        return Algorithm<built_base_t>{static_cast<built_base_t>(*this),
                                       std::forward<Args>(args)...};
      }
    };

    template<typename Built>
    using get_entry_map = typename Built::entries_t::type;

    template<typename Built,
             template<typename>
             class Current,
             section Appended,
             typename Unlocked>
    using next_builder_t =
        typename Built::template builder_t<Current, Unlocked, Appended>;

    template<typename Built, template<typename> class Derived>
    class ptype_base {
    private:
      using entry_map_t = entry_map_match<get_entry_map<Built>, Derived>;

    public:
      inline constexpr explicit ptype_base(Built const* current)
          : current_{current} {
      }

    protected:
      template<section Appended>
      inline constexpr auto next(Appended&& section) const {
        return next_builder_t<Built,
                              Derived,
                              std::remove_cvref_t<Appended>,
                              typename entry_map_t::unlocked_t>{
            std::forward<Appended>(section), *current_};
      }

    private:
      Built const* current_;
    };

  } // namespace details

  template<typename Events, typename... Observers>
  class observe_body {
  public:
    using events_t = Events;
    using observers_t = observer_pack<events_t, Observers...>;

  public:
    inline constexpr explicit observe_body(events_t events,
                                           Observers... observers)
        : observers_{events, std::move(observers)...} {
    }

    inline auto const& observers() const noexcept {
      return observers_;
    }

  private:
    observers_t observers_;
  };

  template<typename Built>
  class observe_ptype : public details::ptype_base<Built, observe_ptype> {
  public:
    inline constexpr explicit observe_ptype(Built const* current)
        : details::ptype_base<Built, observe_ptype>{current} {
    }

    template<typename... Events, typename... Observers>
      requires(evo::observer<Observers, Built, Events> && ...)
    inline constexpr auto
        observe(evo::observe<Events, Observers>... observers) const {
      return this->next(observe_body<observer_tags<Events...>, Observers...>{
          observer_tags<Events...>{}, std::move(observers).observer()...});
    }
  };

  class execute_body {
  public:
    inline constexpr explicit execute_body(evo::execution mode) noexcept
        : mode_{mode} {
    }

    inline auto execution_mode() const noexcept {
      return mode_;
    }

  private:
    evo::execution mode_;
  };

  template<typename Built>
  struct execute_ptype : public details::ptype_base<Built, execute_ptype> {
    inline constexpr explicit execute_ptype(Built const* current)
        : details::ptype_base<Built, execute_ptype>{current} {
    }

    inline constexpr auto execute(evo::execution mode) const {
      return this->next(execute_body{mode});
    }
  };

  template<typename Mutation>
  class mutate_body {
  public:
    using mutation_t = Mutation;

  public:
    inline constexpr explicit mutate_body(mutation_t const& mutation)
        : mutation_{mutation} {
    }

    inline auto const& mutation() const noexcept {
      return mutation_;
    }

  private:
    mutation_t mutation_;
  };

  template<typename Built>
  struct mutate_ptype : public details::ptype_base<Built, mutate_ptype> {
    inline constexpr explicit mutate_ptype(Built const* current)
        : details::ptype_base<Built, mutate_ptype>{current} {
    }

    template<std::copy_constructible Mutation>
    inline constexpr auto mutate(Mutation const& mutation) const {
      return this->next(mutate_body<Mutation>{mutation});
    }
  };

  template<typename Crossover>
  class cross_body {
  public:
    using crossover_t = Crossover;

  public:
    inline constexpr explicit cross_body(crossover_t const& crossover)
        : crossover_{crossover} {
    }

    inline auto const& crossover() const noexcept {
      return crossover_;
    }

  private:
    crossover_t crossover_;
  };

  template<typename Built>
  struct cross_ptype : public details::ptype_base<Built, cross_ptype> {
    inline constexpr explicit cross_ptype(Built const* current)
        : details::ptype_base<Built, cross_ptype>{current} {
    }

    template<std::copy_constructible Crossover>
      requires evo::crossover<Crossover, typename Built::candidate_t>
    inline constexpr auto cross(Crossover const& crossover) const {
      return this->next(cross_body<Crossover>{crossover});
    }
  };

  template<typename Selection>
  class select_body {
  public:
    using selection_t = Selection;

  public:
    inline constexpr explicit select_body(selection_t const& selection)
        : selection_{selection} {
    }

    inline auto const& selection() const noexcept {
      return selection_;
    }

  private:
    selection_t selection_;
  };

  template<typename Built>
  struct select_ptype : public details::ptype_base<Built, select_ptype> {
    inline constexpr explicit select_ptype(Built const* current)
        : details::ptype_base<Built, select_ptype>{current} {
    }

    template<std::copy_constructible Selection>
    inline constexpr auto select(Selection const& selection) const {
      return this->next(select_body<Selection>{selection});
    }
  };

  template<typename Initializator>
  class spawn_body {
  public:
    using initializator_t = Initializator;

  public:
    inline constexpr explicit spawn_body(initializator_t const& initializator)
        : initializator_{initializator} {
    }

    inline auto const& initializator() const noexcept {
      return initializator_;
    }

  private:
    initializator_t initializator_;
  };

  template<typename Built>
  struct spawn_ptype : public details::ptype_base<Built, spawn_ptype> {
    inline constexpr explicit spawn_ptype(Built const* current)
        : details::ptype_base<Built, spawn_ptype>{current} {
    }

    template<std::copy_constructible Initializator>
    inline constexpr auto spawn(Initializator const& initializator) const {
      return this->next(spawn_body<Initializator>{initializator});
    }
  };

  template<basic_candidate Candidate>
  struct candidate_body {
    using candidate_t = Candidate;
  };

  template<typename Built>
  struct candidate_ptype : public details::ptype_base<Built, candidate_ptype> {
    inline constexpr explicit candidate_ptype(Built const* current)
        : details::ptype_base<Built, candidate_ptype>{current} {
    }

    template<basic_candidate Candidate>
    inline constexpr auto candidate() const {
      return this->next(candidate_body<Candidate>{});
    }
  };

  class size_body {
  public:
    inline constexpr explicit size_body(std::size_t size) noexcept
        : size_{size} {
    }

    inline auto population_size() const noexcept {
      return size_;
    }

  private:
    std::size_t size_;
  };

  template<typename Built>
  struct size_ptype : public details::ptype_base<Built, size_ptype> {
    inline constexpr explicit size_ptype(Built const* current)
        : details::ptype_base<Built, size_ptype>{current} {
    }

    inline constexpr auto limit(std::size_t size) const {
      return this->next(size_body{size});
    }
  };

  template<typename Built>
  struct root_ptype : public details::ptype_base<Built, root_ptype> {
    inline constexpr explicit root_ptype(Built const* current)
        : details::ptype_base<Built, root_ptype>{current} {
    }

    inline constexpr auto begin() const {
      return this->next(details::empty_section{});
    }
  };

  template<typename Entries, template<typename> class Root>
  struct builder : details::builder_node<Entries,
                                         plist<Root>,
                                         plist<>,
                                         details::empty_section> {};

  template<typename Map, template<typename> class Root = root_ptype>
  inline constexpr auto for_map() {
    return builder<Map, Root>();
  }

} // namespace config
} // namespace evo
