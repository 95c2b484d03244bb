#ifndef JACK_UTIL_HPP
#define JACK_UTIL_HPP

template <typename... Args>
struct overloaded : Args... {
    using Args::operator()...;
};

template <typename... Args>
overloaded(Args...) -> overloaded<Args...>;

#endif
