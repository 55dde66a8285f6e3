#ifndef NEXUS_BRIDGE_OVERLOADED_HPP
#define NEXUS_BRIDGE_OVERLOADED_HPP

namespace utils {
    // Lambda set for std::visit.
    template <class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}  // namespace utils

#endif
