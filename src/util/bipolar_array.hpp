#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>

namespace patchy {

// Array indexed from `min` to `max`, both inclusive. The Myers algorithm uses
// it to track the furthest reaching path for each diagonal k in -D..D.
template <typename Type>
struct BipolarArray {
    int64_t min_;
    int64_t max_;
    std::size_t capacity_;
    std::unique_ptr<Type[]> arr_;

    BipolarArray(int64_t min, int64_t max)
        : min_(min), max_(max), capacity_(static_cast<std::size_t>(max - min + 1)) {
        assert(max - min + 1 >= 0);
        arr_ = std::make_unique<Type[]>(capacity_);
    }

    BipolarArray(const BipolarArray& other) : min_(other.min_), max_(other.max_), capacity_(other.capacity_) {
        // Skip value-initialization; the contents are overwritten right away.
        arr_ = std::unique_ptr<Type[]>{new Type[capacity_]};
        std::memmove(arr_.get(), other.arr_.get(), other.capacity_ * sizeof(Type));
    }

    Type&
    operator[](int64_t index) {
        auto offset = -min_ + index;
        assert(offset >= 0);
        assert(offset < static_cast<int64_t>(capacity_));
        return arr_.get()[offset];
    }
};

}  // namespace patchy
