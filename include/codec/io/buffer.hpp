////////////////////////////////////////////////////////////////////////////////
//
// codec/io/buffer.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_6A2D8F04_E5B1_4C93_97F0_B81C4E25A3D7
#define CODEC_INCLUDED_6A2D8F04_E5B1_4C93_97F0_B81C4E25A3D7


#include <codec/error.hpp>
#include <codec/memory.hpp>
#include <codec/stddef.hpp>
#include <codec/type_traits.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <string_view>
#include <utility>


namespace codec {
namespace io {

// Heap-allocated byte storage. Shrinking never releases memory, so a buffer
// resized for each call of a loop only allocates while it grows.
class buffer
{
public:
    using value_type     = uint8;
    using iterator       = uint8*;
    using const_iterator = uint8 const*;

    explicit buffer(std::size_t const n, uninitialized_t) :
        data_{n ? static_cast<uint8*>(std::malloc(n)) : nullptr},
        size_{n},
        capacity_{n}
    {
        if (data() == nullptr && size() != 0) {
            raise_bad_alloc();
        }
    }

    explicit buffer(std::size_t const n) :
        buffer{n, uninitialized}
    {
        std::fill(begin(), end(), uint8{0});
    }

    explicit buffer(void const* const src, std::size_t const n) :
        buffer{n, uninitialized}
    {
        std::copy_n(static_cast<uint8 const*>(src), n, data());
    }

    constexpr buffer() noexcept :
        data_{nullptr},
        size_{0},
        capacity_{0}
    {}

    buffer(buffer const& x) :
        buffer{x.data(), x.size()}
    {}

    buffer(buffer&& x) noexcept :
        data_{std::exchange(x.data_, nullptr)},
        size_{std::exchange(x.size_, 0)},
        capacity_{std::exchange(x.capacity_, 0)}
    {}

    ~buffer()
    {
        std::free(data_);
    }

    buffer& operator=(buffer const& x) &
    {
        buffer{x}.swap(*this);
        return *this;
    }

    buffer& operator=(buffer&& x) & noexcept
    {
        buffer{std::move(x)}.swap(*this);
        return *this;
    }

    void swap(buffer& x) noexcept
    {
        using std::swap;
        swap(data_,     x.data_);
        swap(size_,     x.size_);
        swap(capacity_, x.capacity_);
    }

    uint8* data() noexcept
    { return data_; }

    uint8 const* data() const noexcept
    { return data_; }

    std::size_t size() const noexcept
    { return size_; }

    std::size_t capacity() const noexcept
    { return capacity_; }

    bool empty() const noexcept
    { return (size() == 0); }

    iterator begin() noexcept
    { return data(); }

    iterator end() noexcept
    { return data() + size(); }

    const_iterator begin() const noexcept
    { return cbegin(); }

    const_iterator end() const noexcept
    { return cend(); }

    const_iterator cbegin() const noexcept
    { return data(); }

    const_iterator cend() const noexcept
    { return data() + size(); }

    uint8& operator[](std::size_t const i) noexcept
    { return data()[i]; }

    uint8 const& operator[](std::size_t const i) const noexcept
    { return data()[i]; }

    // The contents viewed as text; encoder output is always ASCII.
    std::string_view str() const noexcept
    {
        return {reinterpret_cast<char const*>(data()), size()};
    }

    int compare(buffer const& x) const noexcept
    { return mem::compare(data(), size(), x.data(), x.size()); }

    void clear() noexcept
    { size_ = 0; }

    void reserve(std::size_t const n)
    {
        if (n > capacity()) {
            reallocate_(n);
        }
    }

    void resize(std::size_t const n)
    {
        if (n > size()) {
            if (n > capacity()) {
                reallocate_(n);
            }
            std::fill(begin() + size(), begin() + n, uint8{});
        }
        size_ = n;
    }

    void resize(std::size_t const n, uninitialized_t)
    {
        if (n > capacity()) {
            reallocate_(n);
        }
        size_ = n;
    }

    void assign(void const* const src, std::size_t const n)
    {
        resize(n, uninitialized);
        std::copy_n(static_cast<uint8 const*>(src), n, data());
    }

private:
    void reallocate_(std::size_t const n)
    {
        auto const tmp = std::realloc(data_, n);
        if (tmp == nullptr) {
            raise_bad_alloc();
        }
        data_ = static_cast<uint8*>(tmp);
        capacity_ = n;
    }

    friend void swap(buffer& x, buffer& y) noexcept
    { x.swap(y); }

    friend bool operator==(buffer const& x, buffer const& y) noexcept
    { return mem::equal(x.data(), x.size(), y.data(), y.size()); }

    friend bool operator!=(buffer const& x, buffer const& y) noexcept
    { return !(x == y); }

    friend bool operator<(buffer const& x, buffer const& y) noexcept
    { return (x.compare(y) < 0); }

    uint8*      data_;
    std::size_t size_;
    std::size_t capacity_;
};

}}    // namespace codec::io


#endif  // CODEC_INCLUDED_6A2D8F04_E5B1_4C93_97F0_B81C4E25A3D7
