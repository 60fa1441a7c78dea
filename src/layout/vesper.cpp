#include "layout/vesper.hpp"

#include <fmt/format.h>

namespace st::layout {

auto LayoutItem::to_string() const -> std::string {
  std::string out = name;
  for (const auto* part : {&descr, &type_name}) {
    if (part->empty()) {
      continue;
    }
    if (!out.empty()) {
      out += ' ';
    }
    out += *part;
  }
  return out;
}

auto Vesper::add_child(Vesper child) -> typesys::Expected<std::size_t> {
  if (children_.size() >= kMaxChildren) {
    return tl::unexpected(typesys::make_error(
        typesys::ErrorKind::Layout,
        fmt::format("invalid type layout: too many children under '{}' (at most {})",
                    item_.to_string(), kMaxChildren)));
  }
  children_.push_back(std::move(child));
  return children_.size() - 1;
}

auto Vesper::to_string() const -> std::string {
  std::string out;
  render(out, 0);
  return out;
}

auto Vesper::render(std::string& out, std::size_t depth) const -> void {
  out.append(depth * 2, ' ');
  out += item_.to_string();
  out += '\n';
  for (const auto& child : children_) {
    child.render(out, depth + 1);
  }
}

auto Vesper::flatten() const -> std::vector<LayoutEntry> {
  std::vector<LayoutEntry> out;
  flatten_into(out, 0);
  return out;
}

auto Vesper::flatten_into(std::vector<LayoutEntry>& out, std::size_t depth) const -> void {
  out.push_back(LayoutEntry{item_, depth});
  for (const auto& child : children_) {
    child.flatten_into(out, depth + 1);
  }
}

}  // namespace st::layout
