#pragma once

namespace emrun {

// Builds one visitor out of several lambdas for std::visit over the record
// and frame-event variants:
//
//   std::visit(Overloaded{
//       [](const TestStart& s) { ... },
//       [](const PassThrough&) {},
//   }, kind);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace emrun
