#pragma once
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace wsv {

// Non-owning view over one parsed row. Cells point into the parsed buffer
// or into the row arena, so a RowView must not outlive the callback it was
// handed to.
class RowView {
public:
  using CellView = std::optional<std::string_view>;

  RowView() = default;
  RowView(const std::vector<CellView>* cells, std::size_t line)
      : cells_(cells), line_(line) {}

  std::size_t size() const noexcept { return cells_ ? cells_->size() : 0; }
  bool empty() const noexcept { return size() == 0; }

  // Out of range reads as null.
  CellView at(std::size_t i) const {
    return (cells_ && i < cells_->size()) ? (*cells_)[i] : CellView{};
  }
  bool is_null(std::size_t i) const { return !at(i).has_value(); }

  // Source line the row started on (1-based).
  std::size_t line() const noexcept { return line_; }

  const std::vector<CellView>* cells() const noexcept { return cells_; }

private:
  const std::vector<CellView>* cells_{nullptr};
  std::size_t line_{0};
};

}
