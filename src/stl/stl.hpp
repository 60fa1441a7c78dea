#pragma once

#include <string_view>

#include "typesys/builder.hpp"
#include "typesys/symbolic.hpp"
#include "typesys/type_lib.hpp"

namespace st::stl {

inline constexpr std::string_view kLibNameStd = "Std";
inline constexpr std::string_view kLibNameStrictTypes = "StrictTypes";

/// Built-in libraries. Each is built on first use and never changes
/// afterwards; a failure to build one is a defect and throws
/// std::logic_error.
auto std_sym() -> const typesys::SymbolicLib&;
auto std_stl() -> const typesys::TypeLib&;

/// Types describing the type system's own entities. Depends on `Std`.
auto strict_types_sym() -> const typesys::SymbolicLib&;
auto strict_types_stl() -> const typesys::TypeLib&;

/// `Std` and `StrictTypes` merged into one system.
auto builtin_system() -> const typesys::SymbolicSys&;

}  // namespace st::stl
