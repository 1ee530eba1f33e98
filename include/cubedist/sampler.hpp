#pragma once
#include <vector> // `std::vector`

#include <cubedist/cubedist_plugins.hpp>

namespace unum {
namespace cubedist {

/**
 *  @brief  Dense row-major table with one row per hypercube dimension
 *          and one column per norm power. Rows and columns are 0-based,
 *          so cell `(d - 1, p - 1)` describes the @b d-dimensional L@b p distance.
 *
 *  @tparam scalar_at   Precision of every stored value.
 */
template <typename scalar_at, typename allocator_at = aligned_allocator_gt<scalar_at>> //
class distance_table_gt {
  public:
    using scalar_t = scalar_at;
    using allocator_t = allocator_at;
    using cells_t = std::vector<scalar_t, allocator_t>;

  private:
    cells_t cells_;
    std::size_t dimensions_ = 0;
    std::size_t powers_ = 0;

  public:
    distance_table_gt() noexcept = default;
    distance_table_gt(distance_table_gt&&) = default;
    distance_table_gt& operator=(distance_table_gt&&) = default;
    distance_table_gt(distance_table_gt const&) = default;
    distance_table_gt& operator=(distance_table_gt const&) = default;

    /**
     *  @brief  Allocates a zero-initialized table.
     *  @throws `std::invalid_argument` if either side is zero.
     */
    distance_table_gt(std::size_t dimensions, std::size_t powers) noexcept(false)
        : dimensions_(dimensions), powers_(powers) {
        if (!dimensions || !powers)
            throw std::invalid_argument("Distance table can't have zero rows or columns");
        cells_.resize(dimensions * powers);
    }

    std::size_t dimensions() const noexcept { return dimensions_; }
    std::size_t powers() const noexcept { return powers_; }
    std::size_t size() const noexcept { return cells_.size(); }

    scalar_t* data() noexcept { return cells_.data(); }
    scalar_t const* data() const noexcept { return cells_.data(); }

    scalar_t& operator()(std::size_t row, std::size_t column) noexcept { return cells_[row * powers_ + column]; }
    scalar_t const& operator()(std::size_t row, std::size_t column) const noexcept {
        return cells_[row * powers_ + column];
    }

    span_gt<scalar_t const> row(std::size_t row) const cubedist_noexcept_m {
        cubedist_assert_m(row < dimensions_, "Row index is out of bounds");
        return {cells_.data() + row * powers_, powers_};
    }

    void reset() noexcept {
        for (scalar_t& cell : cells_)
            cell = scalar_t(0.f);
    }

    /**
     *  @brief  Elementwise addition, rounding every sum to the table precision.
     *  @throws `std::invalid_argument` on shape mismatch.
     */
    distance_table_gt& operator+=(distance_table_gt const& other) noexcept(false) {
        if (other.dimensions_ != dimensions_ || other.powers_ != powers_)
            throw std::invalid_argument("Distance tables have different shapes");
        for (std::size_t i = 0; i != cells_.size(); ++i)
            cells_[i] = scalar_t(cells_[i] + other.cells_[i]);
        return *this;
    }

    /**
     *  @brief  Divides every cell by the same @p divisor, in the table precision.
     */
    void divide(scalar_t divisor) noexcept {
        for (scalar_t& cell : cells_)
            cell = scalar_t(cell / divisor);
    }

    /**
     *  @brief  Converts to a different precision. Widening conversions are exact.
     */
    template <typename other_scalar_at> distance_table_gt<other_scalar_at> cast() const noexcept(false) {
        using other_compute_t = typename scalar_traits_gt<other_scalar_at>::compute_t;
        distance_table_gt<other_scalar_at> result(dimensions_, powers_);
        for (std::size_t i = 0; i != cells_.size(); ++i)
            result.data()[i] = other_scalar_at(other_compute_t(to_f64(cells_[i])));
        return result;
    }
};

using means_table_t = distance_table_gt<f64_t>;

/**
 *  @brief  Sums a stream of equally shaped tables in a balanced binary tree,
 *          keeping at most one pending table per tree level.
 *
 *  Adding `n` tables one after another in half precision stalls once the sum
 *  outgrows the increments. Merging only tables that absorbed the same number
 *  of inputs keeps the operands of every addition of similar magnitude.
 */
template <typename scalar_at> //
class table_cascade_gt {
  public:
    using table_t = distance_table_gt<scalar_at>;

  private:
    struct level_t {
        table_t sum;
        std::size_t inputs = 0;
    };
    std::vector<level_t> levels_;

  public:
    bool empty() const noexcept { return levels_.empty(); }

    void push(table_t table) noexcept(false) {
        std::size_t inputs = 1;
        while (!levels_.empty() && levels_.back().inputs == inputs) {
            levels_.back().sum += table;
            table = std::move(levels_.back().sum);
            levels_.pop_back();
            inputs *= 2;
        }
        levels_.push_back(level_t{std::move(table), inputs});
    }

    /**
     *  @brief  Folds the pending levels, smallest first.
     *  @throws `std::logic_error` if nothing was pushed.
     */
    table_t sum() const noexcept(false) {
        if (levels_.empty())
            throw std::logic_error("Nothing to sum");
        table_t total = levels_.back().sum;
        for (std::size_t level_idx = levels_.size() - 1; level_idx != 0; --level_idx)
            total += levels_[level_idx - 1].sum;
        return total;
    }
};

/**
 *  @brief  Monte Carlo kernel. Draws pairs of points in the unit hypercube
 *          and sums their L1, L2, ... Lp distances, for every prefix of the coordinates.
 *
 *  For one pair of points the kernel walks the coordinates once, keeping a
 *  running sum of `|b - a|^k` per power. Every power is produced by multiplying
 *  the previous one by `|b - a|` again, and every running sum is then
 *  raised to `1 / k`. All of it happens in `scalar_at` precision.
 *
 *  The per-sample norms land in a `samples x dimensions x powers` buffer,
 *  which is then reduced over samples pairwise. The shape of that reduction
 *  tree only depends on the number of samples, so the thread count never
 *  changes the result.
 *
 *  @tparam scalar_at   One of `f16_t`, `f32_t`, `f64_t`.
 */
template <typename scalar_at> //
class batch_sampler_gt {
  public:
    using scalar_t = scalar_at;
    using compute_t = typename scalar_traits_gt<scalar_t>::compute_t;
    using table_t = distance_table_gt<scalar_t>;
    using buffer_t = std::vector<scalar_t, aligned_allocator_gt<scalar_t>>;

  private:
    std::size_t dimensions_ = 0;
    std::size_t powers_ = 0;
    std::vector<scalar_t> inverse_powers_;
    buffer_t points_a_;
    buffer_t points_b_;
    buffer_t norms_;

  public:
    /**
     *  @throws `std::invalid_argument` if either limit is zero.
     */
    batch_sampler_gt(std::size_t max_dimensions, std::size_t max_power) noexcept(false)
        : dimensions_(max_dimensions), powers_(max_power) {
        if (!max_dimensions || !max_power)
            throw std::invalid_argument("Sampler needs at least one dimension and one power");

        // The exponents are computed in the same precision as everything else.
        inverse_powers_.resize(powers_);
        for (std::size_t k = 0; k != powers_; ++k)
            inverse_powers_[k] = scalar_t(scalar_t(1.f) / scalar_t(compute_t(k + 1)));
    }

    std::size_t dimensions() const noexcept { return dimensions_; }
    std::size_t powers() const noexcept { return powers_; }
    span_gt<scalar_t const> inverse_powers() const noexcept { return {inverse_powers_.data(), powers_}; }

    /**
     *  @brief  Draws @p samples pairs of points and sums their distances.
     *
     *  Points are generated sequentially on the calling thread, first all of `A`,
     *  then all of `B`. Only the distance computations are spread across the executor.
     *
     *  @return Table of shape `max_dimensions x max_power` with sums over all samples.
     */
    template <typename executor_at = executor_default_t>
    table_t sample(std::size_t samples, random_source_t& random, executor_at&& executor = executor_at{}) noexcept(false) {
        std::size_t count_scalars = samples * dimensions_;
        points_a_.resize(count_scalars);
        points_b_.resize(count_scalars);
        random.fill_uniform(points_a_.data(), count_scalars);
        random.fill_uniform(points_b_.data(), count_scalars);
        return accumulate(points_a_.data(), points_b_.data(), samples, executor);
    }

    /**
     *  @brief  Sums the distances between externally provided pairs of points.
     *  @param points_a Row-major `samples x max_dimensions` coordinates of the first points.
     *  @param points_b Row-major `samples x max_dimensions` coordinates of the second points.
     */
    template <typename executor_at = executor_default_t>
    table_t accumulate(scalar_t const* points_a, scalar_t const* points_b, std::size_t samples,
                       executor_at&& executor = executor_at{}) noexcept(false) {

        table_t result(dimensions_, powers_);
        if (!samples)
            return result;

        std::size_t const cells = dimensions_ * powers_;
        norms_.resize(samples * cells);
        scalar_t* norms = norms_.data();

        std::size_t slices = (std::min)(executor.size(), samples);
        std::size_t samples_per_slice = divide_round_up(samples, slices);
        executor.fixed(slices, [&](std::size_t, std::size_t slice_idx) {
            std::size_t begin = slice_idx * samples_per_slice;
            std::size_t end = (std::min)(samples, begin + samples_per_slice);
            for (std::size_t sample_idx = begin; sample_idx < end; ++sample_idx)
                norms_of_pair_(points_a + sample_idx * dimensions_, points_b + sample_idx * dimensions_,
                               norms + sample_idx * cells);
        });

        reduce_pairwise_(norms, samples, cells, executor);
        for (std::size_t cell_idx = 0; cell_idx != cells; ++cell_idx)
            result.data()[cell_idx] = norms[cell_idx];
        return result;
    }

  private:
    /**
     *  @brief  Fills one `dimensions x powers` row-major block with the norms
     *          of every coordinate prefix of `b - a`.
     */
    void norms_of_pair_(scalar_t const* a, scalar_t const* b, scalar_t* block) const noexcept {
        for (std::size_t dim_idx = 0; dim_idx != dimensions_; ++dim_idx) {
            scalar_t* current = block + dim_idx * powers_;
            scalar_t const* previous = dim_idx ? current - powers_ : nullptr;
            scalar_t delta = absolute(scalar_t(b[dim_idx] - a[dim_idx]));
            scalar_t term = delta;
            for (std::size_t power_idx = 0; power_idx != powers_; ++power_idx) {
                if (power_idx)
                    term = scalar_t(term * delta);
                current[power_idx] = previous ? scalar_t(previous[power_idx] + term) : term;
            }
        }

        // Every cell holds a running sum of powers until here.
        scalar_t const* inverse_powers = inverse_powers_.data();
        for (std::size_t dim_idx = 0; dim_idx != dimensions_; ++dim_idx)
            for (std::size_t power_idx = 0; power_idx != powers_; ++power_idx) {
                scalar_t& cell = block[dim_idx * powers_ + power_idx];
                cell = power(cell, inverse_powers[power_idx]);
            }
    }

    /**
     *  @brief  Adds `count` consecutive rows of `row_length` scalars into the first one,
     *          pairing neighbors at doubling strides: `(0, 1), (2, 3), ...`, then `(0, 2), (4, 6), ...`.
     */
    template <typename executor_at>
    static void reduce_pairwise_(scalar_t* rows, std::size_t count, std::size_t row_length,
                                 executor_at& executor) noexcept(false) {
        for (std::size_t stride = 1; stride < count; stride *= 2) {
            std::size_t pairs = divide_round_up(count - stride, 2 * stride);
            std::size_t chunks = (std::min)(executor.size(), pairs);
            std::size_t pairs_per_chunk = divide_round_up(pairs, chunks);
            executor.fixed(chunks, [&](std::size_t, std::size_t chunk_idx) {
                std::size_t end = (std::min)(pairs, (chunk_idx + 1) * pairs_per_chunk);
                for (std::size_t pair_idx = chunk_idx * pairs_per_chunk; pair_idx < end; ++pair_idx) {
                    scalar_t* target = rows + pair_idx * 2 * stride * row_length;
                    scalar_t const* source = target + stride * row_length;
                    for (std::size_t i = 0; i != row_length; ++i)
                        target[i] = scalar_t(target[i] + source[i]);
                }
            });
        }
    }
};

/**
 *  @brief  Stateless shortcut over `batch_sampler_gt` for one-off batches.
 *  @return Sums of distances for all `1..max_dimensions` and `1..max_power`.
 */
template <typename scalar_at, typename executor_at = executor_default_t>
distance_table_gt<scalar_at> sample_batch(std::size_t samples, std::size_t max_dimensions, std::size_t max_power,
                                          random_source_t& random, executor_at&& executor = executor_at{}) {
    batch_sampler_gt<scalar_at> sampler(max_dimensions, max_power);
    return sampler.sample(samples, random, executor);
}

} // namespace cubedist
} // namespace unum
