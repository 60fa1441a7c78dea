#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "layout/type_layout.hpp"
#include "stl/stl.hpp"

DEFINE_string(format, "text", "Output format: text, armor or binary");
DEFINE_string(output_dir, "", "Directory to write the dumps to; stdout when empty (text and armor only)");
DEFINE_string(layout, "", "Also print the layout of this type, e.g. StrictTypes.TypeLib");

namespace {

namespace fs = std::filesystem;
using st::typesys::Bytes;
using st::typesys::Expected;

auto write_file(const fs::path& path, std::string_view content) -> bool {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    st::log::error("cannot open '{}' for writing", path.string());
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  st::log::info("wrote {} bytes to {}", content.size(), path.string());
  return static_cast<bool>(out);
}

// Renders one entity in the requested format; binary yields raw bytes.
template <typename T>
auto render(const T& entity) -> Expected<std::string> {
  if (FLAGS_format == "text") {
    return entity.to_string();
  }
  if (FLAGS_format == "armor") {
    return entity.to_armored();
  }
  return entity.encode().map([](const Bytes& bytes) { return std::string(bytes.begin(), bytes.end()); });
}

auto extension() -> std::string_view {
  if (FLAGS_format == "armor") return "sta";
  if (FLAGS_format == "binary") return "stl";
  return "sty";
}

template <typename T>
auto dump(const T& entity, std::string_view stem) -> bool {
  auto content = render(entity);
  if (!content) {
    st::log::error("cannot render {}: {}", stem, content.error().to_string());
    return false;
  }
  if (FLAGS_output_dir.empty()) {
    std::cout << *content << "\n";
    return true;
  }
  return write_file(fs::path(FLAGS_output_dir) / fmt::format("{}.{}", stem, extension()), *content);
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Dump the built-in strict type libraries and their merged type system");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  st::log::init();

  if (FLAGS_format != "text" && FLAGS_format != "armor" && FLAGS_format != "binary") {
    std::cerr << "unknown --format '" << FLAGS_format << "', expected text, armor or binary\n";
    return 1;
  }
  if (FLAGS_format == "binary" && FLAGS_output_dir.empty()) {
    std::cerr << "--format=binary requires --output_dir\n";
    return 1;
  }
  if (!FLAGS_output_dir.empty()) {
    std::error_code ec;
    fs::create_directories(FLAGS_output_dir, ec);
    if (ec) {
      std::cerr << "cannot create '" << FLAGS_output_dir << "': " << ec.message() << "\n";
      return 1;
    }
  }

  bool ok = true;
  try {
    const auto& std_lib = st::stl::std_stl();
    const auto& strict_types = st::stl::strict_types_stl();
    const auto& system = st::stl::builtin_system();

    st::log::info("stl_dump", {{"std", std_lib.id().to_string()},
                               {"strict_types", strict_types.id().to_string()},
                               {"system", system.id().to_string()}});

    ok = dump(std_lib, "Std") && ok;
    ok = dump(strict_types, "StrictTypes") && ok;
    ok = dump(system.system(), "Builtin") && ok;

    if (!FLAGS_layout.empty()) {
      auto name = st::typesys::TypeFqn::parse(FLAGS_layout);
      if (!name) {
        std::cerr << name.error().to_string() << "\n";
        ok = false;
      } else if (auto layout = st::layout::flatten(system, *name); !layout) {
        std::cerr << layout.error().to_string() << "\n";
        ok = false;
      } else {
        std::cout << layout->to_string();
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "stl_dump failed: " << ex.what() << "\n";
    ok = false;
  }

  st::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return ok ? 0 : 1;
}
