#pragma once
#include <cstddef>
#include <iterator>
#include <string>

namespace spyio {

// Single-pass input iterator over anything with `bool next(std::string&)`.
// The sequence ends the first time next() returns false and cannot be
// restarted; a default-constructed iterator is the end sentinel.
template <class Source>
class PullIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type        = std::string;
  using difference_type   = std::ptrdiff_t;
  using pointer           = const std::string*;
  using reference         = const std::string&;

  PullIterator() = default;
  explicit PullIterator(Source* src) : src_(src) { advance(); }

  reference operator*() const { return cur_; }
  pointer operator->() const { return &cur_; }

  PullIterator& operator++() { advance(); return *this; }

  bool operator==(const PullIterator& o) const { return src_ == o.src_; }
  bool operator!=(const PullIterator& o) const { return src_ != o.src_; }

private:
  void advance() {
    if (src_ && !src_->next(cur_)) { src_ = nullptr; cur_.clear(); }
  }

  Source* src_{nullptr};
  std::string cur_;
};

}
