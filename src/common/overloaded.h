#ifndef SKYVAULT_COMMON_OVERLOADED_H_
#define SKYVAULT_COMMON_OVERLOADED_H_

namespace Skyvault {

// Lets std::visit take a set of lambdas, one per alternative.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace Skyvault

#endif // SKYVAULT_COMMON_OVERLOADED_H_
