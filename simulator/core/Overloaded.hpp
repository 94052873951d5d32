#pragma once

// Builds a std::visit visitor out of lambdas. A variant alternative without a
// matching lambda fails to compile.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
