#pragma once

#include "util/convert.hh"
#include "util/error.hh"

// Visitor is a helper type to be used with std::visit. Usage:
//
// ```
// std::variant<tabstate::UnsavedTabMetadata, tabstate::SavedTabMetadata> m;
//
// uint64_t size = std::visit(Visitor {
//   [](const tabstate::UnsavedTabMetadata& u) { return u.file_size; },
//   [](const tabstate::SavedTabMetadata& s) { return s.file_size; },
// }, m);
// ```
template<class... Ts>
struct Visitor: Ts... { using Ts::operator()...; };

// Deduction guide for Visitor.
template<class... Ts>
Visitor(Ts...) -> Visitor<Ts...>;
