//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

namespace argon {

//! Overloads pattern, used to create a lambda that can handle multiple
//! types within a `variant`, in a type-safe manner.
/*!
 Omit any catch-all lambda to get a compile time error when a new alternative
 is added to the variant and not handled.

 <b>Example usage:</b>
 \code
 using Kind = std::variant<Pivot, Mesh, Camera>;

 auto Describe(const Kind& kind) -> std::string_view {
    return std::visit(
        Overloads {
            [](const Pivot&) { return "pivot"; },
            [](const Mesh&) { return "mesh"; },
            [](const Camera&) { return "camera"; },
        },
        kind);
 }
 \endcode
*/
template <class... Ts> struct Overloads : Ts... {
  using Ts::operator()...;
};

} // namespace argon
