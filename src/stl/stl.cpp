#include "stl/stl.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace st::stl {

using namespace st::typesys;

namespace {

using Variants = std::vector<EnumVariant>;

auto letters(char from, char to) -> Variants {
  Variants out;
  for (char c = from; c <= to; ++c) {
    out.push_back(decl::enum_variant(std::string(1, c), static_cast<std::uint8_t>(c)));
  }
  return out;
}

auto digits() -> Variants {
  static constexpr const char* kNames[] = {"zero", "one", "two",   "three", "four",
                                           "five", "six", "seven", "eight", "nine"};
  Variants out;
  for (int i = 0; i < 10; ++i) {
    out.push_back(decl::enum_variant(kNames[i], static_cast<std::uint8_t>('0' + i)));
  }
  return out;
}

// Unsigned integer of `bits` width as an enum over its values.
auto uint_values(unsigned bits) -> Variants {
  Variants out;
  for (unsigned v = 0; v < (1u << bits); ++v) {
    out.push_back(decl::enum_variant(fmt::format("v{}", v), static_cast<std::uint8_t>(v)));
  }
  return out;
}

auto ascii_symbols() -> Variants {
  static constexpr std::pair<char, const char*> kSymbols[] = {
      {' ', "space"},      {'!', "excl"},       {'"', "quotes"},     {'#', "hash"},
      {'$', "dollar"},     {'%', "percent"},    {'&', "ampersand"},  {'\'', "apostrophe"},
      {'(', "bracketL"},   {')', "bracketR"},   {'*', "asterisk"},   {'+', "plus"},
      {',', "comma"},      {'-', "minus"},      {'.', "dot"},        {'/', "slash"},
      {':', "colon"},      {';', "semiColon"},  {'<', "less"},       {'=', "equal"},
      {'>', "greater"},    {'?', "question"},   {'@', "at"},         {'[', "sqBracketL"},
      {'\\', "backSlash"}, {']', "sqBracketR"}, {'^', "caret"},      {'_', "lodash"},
      {'`', "backtick"},   {'{', "cBracketL"},  {'|', "pipe"},       {'}', "cBracketR"},
      {'~', "tilde"},
  };
  Variants out;
  for (const auto& [c, name] : kSymbols) {
    out.push_back(decl::enum_variant(name, static_cast<std::uint8_t>(c)));
  }
  return out;
}

auto concat(std::initializer_list<Variants> parts) -> Variants {
  Variants out;
  for (const auto& part : parts) {
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

auto enumerate(Variants variants) -> Ty<SymRef> { return Ty<SymRef>::enumerate(std::move(variants)); }

template <typename T>
auto expect_built(ExpectedAll<T> result, std::string_view lib) -> T {
  if (!result) {
    std::string message = fmt::format("invalid built-in strict type library {}", lib);
    for (const auto& error : result.error()) {
      message += "\n  " + error.to_string();
    }
    log::critical("{}", message);
    throw std::logic_error(message);
  }
  return std::move(*result);
}

auto build_std() -> ExpectedAll<SymbolicLib> {
  const auto caps = letters('A', 'Z');
  const auto small = letters('a', 'z');
  const auto dec = digits();

  LibBuilder builder(LibName::from(kLibNameStd));
  builder.transpile("Bool", enumerate({decl::enum_variant("false", 0), decl::enum_variant("true", 1)}))
      .transpile("U2", enumerate(uint_values(2)))
      .transpile("U3", enumerate(uint_values(3)))
      .transpile("U4", enumerate(uint_values(4)))
      .transpile("U5", enumerate(uint_values(5)))
      .transpile("U6", enumerate(uint_values(6)))
      .transpile("U7", enumerate(uint_values(7)))
      .transpile("AsciiSym", enumerate(ascii_symbols()))
      .transpile("AsciiPrintable", enumerate(concat({ascii_symbols(), dec, caps, small})))
      .transpile("Dec", enumerate(dec))
      .transpile("HexDecCaps", enumerate(concat({dec, letters('A', 'F')})))
      .transpile("HexDecSmall", enumerate(concat({dec, letters('a', 'f')})))
      .transpile("AlphaCaps", enumerate(caps))
      .transpile("AlphaSmall", enumerate(small))
      .transpile("Alpha", enumerate(concat({caps, small})))
      .transpile("AlphaNum", enumerate(concat({caps, small, dec})))
      .transpile("AlphaCapsNum", enumerate(concat({caps, dec})))
      .transpile("AlphaNumDash",
                 enumerate(concat({caps, small, dec, {decl::enum_variant("dash", '-')}})))
      .transpile("AlphaNumLodash",
                 enumerate(concat({caps, small, dec, {decl::enum_variant("lodash", '_')}})));
  return builder.compile_symbols();
}

auto build_strict_types() -> ExpectedAll<SymbolicLib> {
  using namespace decl;
  const auto members = Sizing::u8_nonempty();

  LibBuilder builder(LibName::from(kLibNameStrictTypes), {std_stl().to_dependency()});
  builder.transpile("SemId", Ty<SymRef>::array(byte(), 32))
      .transpile("ShapeId", Ty<SymRef>::array(byte(), 32))
      .transpile("TypeLibId", Ty<SymRef>::array(byte(), 32))
      .transpile("TypeSysId", Ty<SymRef>::array(byte(), 32))
      .transpile("Ident", Ty<SymRef>::list(named("Std.AlphaNumLodash"), Sizing{1, 32}))
      .transpile("TypeFqn", Ty<SymRef>::composition({field("lib", named("Ident")),
                                                     field("name", named("Ident"))}))
      .transpile("Sizing", Ty<SymRef>::composition({field("min", u16()), field("max", u16())}))
      .transpile("Primitive", Ty<SymRef>::primitive(prim::kU8))
      .transpile("EnumVariant", Ty<SymRef>::composition({field("name", named("Ident")),
                                                         field("tag", u8())}))
      .transpile("Variant",
                 Ty<SymRef>::composition({field("name", named("Ident")), field("tag", u8()),
                                          field("ty", named("SemId"))}))
      .transpile("Field", Ty<SymRef>::composition({field("name", named("Ident")),
                                                   field("ty", named("SemId"))}))
      .transpile(
          "Ty",
          Ty<SymRef>::union_of({
              variant("primitive", 0, named("Primitive")),
              variant("unicode", 1, unit()),
              variant("enum", 2, list(named("EnumVariant"), members)),
              variant("union", 3, list(named("Variant"), members)),
              variant("tuple", 4, list(named("SemId"), members)),
              variant("struct", 5, list(named("Field"), members)),
              variant("array", 6, tuple({named("SemId"), u16()})),
              variant("list", 7, tuple({named("SemId"), named("Sizing")})),
              variant("set", 8, tuple({named("SemId"), named("Sizing")})),
              variant("map", 9, tuple({named("SemId"), named("SemId"), named("Sizing")})),
              variant("option", 10, named("SemId")),
              variant("recursive", 11, tuple({named("SemId"), named("ShapeId")})),
          }))
      .transpile("SymTy", Ty<SymRef>::composition({field("ty", named("Ty")),
                                                   field("names", set(named("TypeFqn"), Sizing::u8()))}))
      .transpile("Dependency", Ty<SymRef>::composition({field("name", named("Ident")),
                                                        field("id", named("TypeLibId"))}))
      .transpile("TypeLib",
                 Ty<SymRef>::composition(
                     {field("name", named("Ident")),
                      field("dependencies", list(named("Dependency"), Sizing::u8())),
                      field("types", map(named("SemId"), named("SymTy"), Sizing::u16()))}))
      .transpile("TypeSystem",
                 Ty<SymRef>::composition(
                     {field("libs", set(named("TypeLibId"), Sizing::u16())),
                      field("types", map(named("SemId"), named("Ty"), Sizing::u16()))}));
  return builder.compile_symbols();
}

auto build_builtin_system() -> ExpectedAll<SymbolicSys> {
  SystemBuilder builder;
  for (const auto* lib : {&std_stl(), &strict_types_stl()}) {
    if (auto imported = builder.import(*lib); !imported) {
      return tl::unexpected(ErrorList{imported.error()});
    }
  }
  return builder.finalize_symbolic();
}

}  // namespace

auto std_sym() -> const SymbolicLib& {
  static const SymbolicLib lib = expect_built(build_std(), kLibNameStd);
  return lib;
}

auto std_stl() -> const TypeLib& {
  static const TypeLib lib = expect_built(std_sym().compile(), kLibNameStd);
  return lib;
}

auto strict_types_sym() -> const SymbolicLib& {
  static const SymbolicLib lib = expect_built(build_strict_types(), kLibNameStrictTypes);
  return lib;
}

auto strict_types_stl() -> const TypeLib& {
  static const TypeLib lib = expect_built(strict_types_sym().compile(), kLibNameStrictTypes);
  return lib;
}

auto builtin_system() -> const SymbolicSys& {
  static const SymbolicSys system = expect_built(build_builtin_system(), "system");
  return system;
}

}  // namespace st::stl
