#pragma once
#include <stdlib.h> // `aligned_alloc`

#include <new>         // `std::bad_alloc`
#include <random>      // `std::mt19937_64`
#include <thread>      // `std::thread`
#include <type_traits> // `std::is_same`
#include <vector>      // `std::vector`

#include <cubedist/cubedist.hpp> // `expected_gt` and macros

#if CUBEDIST_USE_OPENMP
#include <omp.h> // `omp_get_thread_num()`
#endif

#if defined(CUBEDIST_DEFINED_WINDOWS)
#include <malloc.h> // `_aligned_malloc`
#endif

#if !defined(CUBEDIST_USE_NATIVE_F16)
#if defined(__AVX512F__) || defined(CUBEDIST_DEFINED_ARM)
#define CUBEDIST_USE_NATIVE_F16 1
#else
#define CUBEDIST_USE_NATIVE_F16 0
#endif
#endif

#if CUBEDIST_USE_NATIVE_F16
#if defined(CUBEDIST_DEFINED_ARM)
#include <arm_fp16.h> // `__fp16`
#endif
#else
#include <fp16/fp16.h> // `fp16_ieee_to_fp32_value`
#endif

namespace unum {
namespace cubedist {

/**
 *  @brief  Floating point width used for every generated number and
 *          every arithmetic operation of a single experiment.
 */
enum class scalar_kind_t : std::uint8_t {
    unknown_k = 0,
    f64_k,
    f32_k,
    f16_k,
};

inline bool str_equals(char const* begin, std::size_t len, char const* other_begin) noexcept {
    return len == std::strlen(other_begin) && std::strncmp(begin, other_begin, len) == 0;
}

inline std::size_t bits_per_scalar(scalar_kind_t kind) noexcept {
    switch (kind) {
    case scalar_kind_t::f64_k: return 64;
    case scalar_kind_t::f32_k: return 32;
    case scalar_kind_t::f16_k: return 16;
    default: return 0;
    }
}

inline char const* scalar_kind_name(scalar_kind_t kind) noexcept {
    switch (kind) {
    case scalar_kind_t::f64_k: return "f64";
    case scalar_kind_t::f32_k: return "f32";
    case scalar_kind_t::f16_k: return "f16";
    default: return "";
    }
}

/**
 *  @brief  Accepts both the user-facing names, like "half", and the short ones, like "f16".
 */
inline expected_gt<scalar_kind_t> scalar_kind_from_name(char const* name, std::size_t len) {
    expected_gt<scalar_kind_t> parsed;
    parsed.result = scalar_kind_t::unknown_k;
    if (str_equals(name, len, "double") || str_equals(name, len, "f64"))
        parsed.result = scalar_kind_t::f64_k;
    else if (str_equals(name, len, "single") || str_equals(name, len, "f32"))
        parsed.result = scalar_kind_t::f32_k;
    else if (str_equals(name, len, "half") || str_equals(name, len, "f16"))
        parsed.result = scalar_kind_t::f16_k;
    else
        return parsed.failed("Unknown precision, choose: half, single, double");
    return parsed;
}

#if !CUBEDIST_USE_NATIVE_F16

/**
 *  @brief  Software IEEE 754 half. Stores 16 bits, computes in `float`,
 *          and rounds the result of every operation back to 16 bits.
 */
class f16_bits_t {
    std::uint16_t bits_{};

  public:
    f16_bits_t() noexcept = default;
    f16_bits_t(float v) noexcept : bits_(fp16_ieee_from_fp32_value(v)) {}
    f16_bits_t(double v) noexcept : bits_(fp16_ieee_from_fp32_value(static_cast<float>(v))) {}
    operator float() const noexcept { return fp16_ieee_to_fp32_value(bits_); }

    f16_bits_t operator+(f16_bits_t other) const noexcept { return {float(*this) + float(other)}; }
    f16_bits_t operator-(f16_bits_t other) const noexcept { return {float(*this) - float(other)}; }
    f16_bits_t operator*(f16_bits_t other) const noexcept { return {float(*this) * float(other)}; }
    f16_bits_t operator/(f16_bits_t other) const noexcept { return {float(*this) / float(other)}; }

    std::uint16_t bits() const noexcept { return bits_; }
};

using f16_t = f16_bits_t;
#elif defined(CUBEDIST_DEFINED_ARM)
using f16_t = __fp16;
#else
using f16_t = _Float16;
#endif

using f32_t = float;
using f64_t = double;

template <typename scalar_at> scalar_kind_t scalar_kind() noexcept {
    if (std::is_same<scalar_at, f64_t>())
        return scalar_kind_t::f64_k;
    if (std::is_same<scalar_at, f32_t>())
        return scalar_kind_t::f32_k;
    if (std::is_same<scalar_at, f16_t>())
        return scalar_kind_t::f16_k;
    return scalar_kind_t::unknown_k;
}

/**
 *  @brief  Describes how a scalar type is generated and which wider
 *          type is used to call into the `<cmath>` functions.
 */
template <typename scalar_at> struct scalar_traits_gt {};

template <> struct scalar_traits_gt<f64_t> {
    using compute_t = f64_t;
    static constexpr std::size_t mantissa_bits() noexcept { return 52; }
};

template <> struct scalar_traits_gt<f32_t> {
    using compute_t = f32_t;
    static constexpr std::size_t mantissa_bits() noexcept { return 23; }
};

template <> struct scalar_traits_gt<f16_t> {
    using compute_t = f32_t;
    static constexpr std::size_t mantissa_bits() noexcept { return 10; }
};

/// @brief  Absolute value, rounded to the scalar type.
template <typename scalar_at> scalar_at absolute(scalar_at value) noexcept {
    return value < scalar_at(0.f) ? scalar_at(scalar_at(0.f) - value) : value;
}

/// @brief  Raises @p base to a possibly fractional @p exponent, rounding the result to the scalar type.
template <typename scalar_at> scalar_at power(scalar_at base, scalar_at exponent) noexcept {
    using compute_t = typename scalar_traits_gt<scalar_at>::compute_t;
    return scalar_at(std::pow(compute_t(base), compute_t(exponent)));
}

/// @brief  Widens any supported scalar to `f64_t` without changing its value.
template <typename scalar_at> f64_t to_f64(scalar_at value) noexcept {
    using compute_t = typename scalar_traits_gt<scalar_at>::compute_t;
    return static_cast<f64_t>(compute_t(value));
}

/**
 *  @brief  Explicitly passed source of pseudo-random numbers.
 *          Not thread-safe: every draw happens on the thread owning it.
 */
class random_source_t {
    std::uint64_t seed_{};
    std::mt19937_64 engine_;

  public:
    /**
     *  @param seed Zero picks a non-deterministic seed from `std::random_device`.
     */
    explicit random_source_t(std::uint64_t seed = 0) noexcept(false)
        : seed_(seed ? seed : random_seed_()), engine_(seed_) {}

    std::uint64_t seed() const noexcept { return seed_; }

    /**
     *  @brief  Uniform value on [0, 1) in the given precision.
     *          Draws as many random bits as the type has explicit mantissa bits,
     *          so every possible output is exactly representable and 1 is never returned.
     */
    template <typename scalar_at> scalar_at uniform() noexcept {
        using compute_t = typename scalar_traits_gt<scalar_at>::compute_t;
        constexpr std::size_t bits_k = scalar_traits_gt<scalar_at>::mantissa_bits();
        std::uint64_t integer = engine_() >> (64 - bits_k);
        return scalar_at(compute_t(integer) / compute_t(std::uint64_t(1) << bits_k));
    }

    template <typename scalar_at> void fill_uniform(scalar_at* begin, std::size_t count) noexcept {
        for (std::size_t i = 0; i != count; ++i)
            begin[i] = uniform<scalar_at>();
    }

  private:
    static std::uint64_t random_seed_() noexcept(false) {
        std::random_device device;
        std::uint64_t seed = (std::uint64_t(device()) << 32) | std::uint64_t(device());
        return seed ? seed : 1;
    }
};

inline std::size_t hardware_threads() noexcept { return (std::max)(std::thread::hardware_concurrency(), 1u); }

/**
 *  @brief  Spawns fresh `std::thread`s on every call, handing each one
 *          a contiguous range of task indices. The caller thread takes the first range.
 */
class executor_stl_t {
    std::size_t threads_count_{};

  public:
    /**
     *  @param threads_count Zero uses every hardware thread.
     */
    executor_stl_t(std::size_t threads_count = 0) noexcept
        : threads_count_(threads_count ? threads_count : hardware_threads()) {}

    std::size_t size() const noexcept { return threads_count_; }

    /**
     *  @brief  Calls `function(thread_idx, task_idx)` once for every task in `[0, tasks)`.
     */
    template <typename function_at> void fixed(std::size_t tasks, function_at&& function) noexcept(false) {
        std::size_t threads = (std::min)(threads_count_, tasks);
        if (threads <= 1) {
            for (std::size_t task_idx = 0; task_idx != tasks; ++task_idx)
                function(0, task_idx);
            return;
        }

        std::size_t tasks_per_thread = divide_round_up(tasks, threads);
        auto run_range = [&](std::size_t thread_idx) {
            std::size_t end = (std::min)(tasks, (thread_idx + 1) * tasks_per_thread);
            for (std::size_t task_idx = thread_idx * tasks_per_thread; task_idx < end; ++task_idx)
                function(thread_idx, task_idx);
        };

        std::vector<std::thread> workers;
        workers.reserve(threads - 1);
        for (std::size_t thread_idx = 1; thread_idx != threads; ++thread_idx)
            workers.emplace_back(run_range, thread_idx);
        try {
            run_range(0);
        } catch (...) {
            for (std::thread& worker : workers)
                worker.join();
            throw;
        }
        for (std::thread& worker : workers)
            worker.join();
    }
};

#if CUBEDIST_USE_OPENMP

/**
 *  @brief  Same contract as `executor_stl_t`, backed by the OpenMP runtime thread pool.
 */
class executor_openmp_t {
    std::size_t threads_count_{};

  public:
    executor_openmp_t(std::size_t threads_count = 0) noexcept
        : threads_count_(threads_count ? threads_count : hardware_threads()) {
        omp_set_num_threads(static_cast<int>(threads_count_));
    }

    std::size_t size() const noexcept { return threads_count_; }

    template <typename function_at> void fixed(std::size_t tasks, function_at&& function) noexcept(false) {
#pragma omp parallel for schedule(static)
        for (std::size_t task_idx = 0; task_idx < tasks; ++task_idx)
            function(static_cast<std::size_t>(omp_get_thread_num()), task_idx);
    }
};

using executor_default_t = executor_openmp_t;

#else

using executor_default_t = executor_stl_t;

#endif

/**
 *  @brief  `std::vector`-compatible allocator returning cache-line aligned blocks.
 */
template <typename element_at = char, std::size_t alignment_ak = 64> //
class aligned_allocator_gt {
  public:
    using value_type = element_at;
    using size_type = std::size_t;
    using pointer = element_at*;
    template <typename other_element_at> struct rebind {
        using other = aligned_allocator_gt<other_element_at, alignment_ak>;
    };

    aligned_allocator_gt() = default;
    template <typename other_element_at>
    aligned_allocator_gt(aligned_allocator_gt<other_element_at, alignment_ak> const&) noexcept {}

    pointer allocate(size_type length) const {
        std::size_t length_bytes = alignment_ak * divide_round_up<alignment_ak>(length * sizeof(value_type));
#if defined(CUBEDIST_DEFINED_WINDOWS)
        pointer result = (pointer)_aligned_malloc(length_bytes, alignment_ak);
#else
        pointer result = (pointer)aligned_alloc(alignment_ak, length_bytes);
#endif
        if (!result && length_bytes)
            throw std::bad_alloc();
        return result;
    }

    void deallocate(pointer begin, size_type) const noexcept {
#if defined(CUBEDIST_DEFINED_WINDOWS)
        _aligned_free(begin);
#else
        free(begin);
#endif
    }

    template <typename other_element_at>
    bool operator==(aligned_allocator_gt<other_element_at, alignment_ak> const&) const noexcept {
        return true;
    }
    template <typename other_element_at>
    bool operator!=(aligned_allocator_gt<other_element_at, alignment_ak> const&) const noexcept {
        return false;
    }
};

} // namespace cubedist
} // namespace unum
