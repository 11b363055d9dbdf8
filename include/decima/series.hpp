#pragma once

#include <cstddef>
#include <decima/geometry.hpp>
#include <initializer_list>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace decima
{

// Immutable, cheaply copyable ordered sequence.
// Copies share the same storage; nothing ever writes to it after construction,
// so a Series can be handed to worker threads without further synchronization.
template <typename T>
class Series
{
   public:
    using value_type     = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    Series() : storage_(empty_storage()) {}

    explicit Series(std::vector<T> values)
        : storage_(std::make_shared<const std::vector<T>>(std::move(values)))
    {
    }

    Series(std::initializer_list<T> values) : Series(std::vector<T>(values)) {}

    explicit Series(std::span<const T> values) : Series(std::vector<T>(values.begin(), values.end()))
    {
    }

    std::size_t size() const { return storage_->size(); }
    bool        empty() const { return storage_->empty(); }

    const T& operator[](std::size_t i) const { return (*storage_)[i]; }
    const T& front() const { return storage_->front(); }
    const T& back() const { return storage_->back(); }

    const_iterator begin() const { return storage_->begin(); }
    const_iterator end() const { return storage_->end(); }

    std::span<const T>    span() const { return {storage_->data(), storage_->size()}; }
    const std::vector<T>& values() const { return *storage_; }

    // New series holding [first, last). The full range shares storage.
    Series slice(std::size_t first, std::size_t last) const
    {
        if (first > last || last > size())
        {
            throw std::out_of_range("Series::slice: range [" + std::to_string(first) + ", "
                                    + std::to_string(last) + ") outside series of size "
                                    + std::to_string(size()));
        }
        if (first == 0 && last == size())
            return *this;
        return Series(std::vector<T>(storage_->begin() + static_cast<std::ptrdiff_t>(first),
                                     storage_->begin() + static_cast<std::ptrdiff_t>(last)));
    }

    Series slice(const IndexRange& range) const { return slice(range.first, range.last); }

    // True when both series share the same storage (no copy was made).
    bool shares_storage_with(const Series& other) const { return storage_ == other.storage_; }

    bool operator==(const Series& other) const
    {
        return storage_ == other.storage_ || *storage_ == *other.storage_;
    }

   private:
    static std::shared_ptr<const std::vector<T>> empty_storage()
    {
        static const auto empty = std::make_shared<const std::vector<T>>();
        return empty;
    }

    std::shared_ptr<const std::vector<T>> storage_;
};

}   // namespace decima
