/**
 *  @file cubedist.hpp
 *  @brief Shared vocabulary of the hypercube distance estimator:
 *         platform switches, memory views and the error model.
 */
#ifndef UNUM_CUBEDIST_HPP
#define UNUM_CUBEDIST_HPP

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#define CUBEDIST_DEFINED_WINDOWS
#endif

#if defined(__aarch64__)
#define CUBEDIST_DEFINED_ARM
#endif

#if !defined(CUBEDIST_USE_OPENMP)
#define CUBEDIST_USE_OPENMP 0
#endif

#include <algorithm> // `std::min`
#include <cmath>     // `std::pow`
#include <cstdint>   // `std::uint64_t`
#include <cstring>   // `std::strlen`
#include <exception> // `std::uncaught_exceptions`
#include <stdexcept> // `std::runtime_error`
#include <utility>   // `std::swap`

// Bounds checks only survive in debug builds
#if defined(NDEBUG)
#define cubedist_assert_m(must_be_true, message)
#define cubedist_noexcept_m noexcept
#else
#define cubedist_assert_m(must_be_true, message)                                                                       \
    if (!(must_be_true)) {                                                                                             \
        throw std::out_of_range(message);                                                                              \
    }
#define cubedist_noexcept_m
#endif

namespace unum {
namespace cubedist {

template <std::size_t multiple_ak> std::size_t divide_round_up(std::size_t num) noexcept {
    return (num + multiple_ak - 1) / multiple_ak;
}

inline std::size_t divide_round_up(std::size_t num, std::size_t denominator) noexcept {
    return (num + denominator - 1) / denominator;
}

template <typename at, typename other_at = at> at exchange(at& obj, other_at&& new_value) {
    at old_value = std::move(obj);
    obj = std::forward<other_at>(new_value);
    return old_value;
}

/**
 *  @brief  Non-owning view of a row of scalars.
 */
template <typename scalar_at> class span_gt {
    scalar_at* data_ = nullptr;
    std::size_t size_ = 0;

  public:
    span_gt() noexcept = default;
    span_gt(scalar_at* data, std::size_t size) noexcept : data_(data), size_(size) {}
    scalar_at* data() const noexcept { return data_; }
    std::size_t size() const noexcept { return size_; }
    scalar_at* begin() const noexcept { return data_; }
    scalar_at* end() const noexcept { return data_ + size_; }
    scalar_at& operator[](std::size_t i) const noexcept { return data_[i]; }
};

/**
 *  @brief  Error message with static storage duration.
 *          Dropping an error nobody looked at raises it as `std::runtime_error`.
 */
class error_t {
    char const* message_{};

  public:
    error_t(char const* message = nullptr) noexcept : message_(message) {}
    error_t(error_t&& other) noexcept : message_(exchange(other.message_, nullptr)) {}
    error_t& operator=(error_t&& other) noexcept {
        std::swap(message_, other.message_);
        return *this;
    }
    ~error_t() noexcept(false) {
        if (message_ && !std::uncaught_exceptions())
            raise();
    }

    explicit operator bool() const noexcept { return message_ != nullptr; }
    char const* what() const noexcept { return message_; }

    /// @brief  Marks the error as handled and hands out its message.
    char const* release() noexcept { return exchange(message_, nullptr); }

    void raise() noexcept(false) {
        if (message_)
            throw std::runtime_error(exchange(message_, nullptr));
    }
};

/**
 *  @brief  Either a result or the reason it couldn't be produced.
 *  @tparam result_at The type of the expected result.
 */
template <typename result_at> struct expected_gt {
    result_at result;
    error_t error;

    result_at const& operator*() const noexcept { return result; }
    explicit operator bool() const noexcept { return !error; }
    expected_gt failed(error_t message) noexcept {
        error = std::move(message);
        return std::move(*this);
    }
};

/**
 *  @brief  Progress callback that never interrupts the run.
 */
struct dummy_progress_t {
    bool operator()(std::size_t, std::size_t) const noexcept { return true; }
};

} // namespace cubedist
} // namespace unum

#endif // UNUM_CUBEDIST_HPP
