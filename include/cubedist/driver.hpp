#pragma once
#include <cstdio> // `std::snprintf`
#include <string> // `std::string`

#include <cubedist/sampler.hpp>

namespace unum {
namespace cubedist {

inline constexpr std::size_t default_dimensions() { return 100; }
inline constexpr std::size_t default_powers() { return 3; }
inline constexpr std::size_t default_samples() { return 1000000; }
inline constexpr std::size_t default_batch_size() { return 1000000; }

/**
 *  @brief  Parameters of a single run.
 */
struct experiment_config_t {
    /// @brief Largest hypercube dimension. Every dimension from 1 up to it is evaluated.
    std::size_t dimensions = default_dimensions();
    /// @brief Largest norm power. Every power from 1 up to it is evaluated.
    std::size_t powers = default_powers();
    /// @brief Number of point pairs averaged for each table entry.
    std::size_t samples = default_samples();
    /// @brief Upper bound on `samples x dimensions x powers` processed at once.
    std::size_t batch_size = default_batch_size();
    /// @brief Divide the means by the length of the longest diagonal of each hypercube.
    bool normalize = false;
    scalar_kind_t precision = scalar_kind_t::f64_k;
    /// @brief Zero picks a non-deterministic seed.
    std::uint64_t seed = 0;
    /// @brief Zero uses every available core.
    std::size_t threads = 0;

    /**
     *  @brief  Number of point pairs drawn in one batch, never less than one.
     */
    std::size_t samples_per_batch() const noexcept {
        if (!dimensions || !powers)
            return 1;
        return (std::max<std::size_t>)(1, batch_size / dimensions / powers);
    }

    /**
     *  @brief  Checks that the run can start. Nothing is sampled before it passes.
     */
    error_t validate() const noexcept {
        if (precision == scalar_kind_t::unknown_k)
            return "Unknown precision, choose: half, single, double";
        if (!dimensions)
            return "The maximum dimension must be positive";
        if (!powers)
            return "The maximum power must be positive";
        if (!samples)
            return "The number of samples must be positive";
        if (!batch_size)
            return "The batch size must be positive";
        return {};
    }
};

/**
 *  @brief  Divides every cell by the L@b p length of the all-ones vector in @b d dimensions,
 *          which is `d ^ (1 / p)`, computed in the table precision.
 */
template <typename scalar_at> void normalize_to_diagonal(distance_table_gt<scalar_at>& table) noexcept {
    using scalar_t = scalar_at;
    using compute_t = typename scalar_traits_gt<scalar_t>::compute_t;
    for (std::size_t row = 0; row != table.dimensions(); ++row) {
        scalar_t dimension = scalar_t(compute_t(row + 1));
        for (std::size_t column = 0; column != table.powers(); ++column) {
            scalar_t inverse_power = scalar_t(scalar_t(1.f) / scalar_t(compute_t(column + 1)));
            table(row, column) = scalar_t(table(row, column) / power(dimension, inverse_power));
        }
    }
}

/**
 *  @brief  Runs the whole experiment in a fixed precision. Samples batch after batch,
 *          sums the batches pairwise, then converts to means and optionally normalizes.
 *
 *  @param[in] progress Called after every batch with the number of processed and total samples.
 *                      Returning `false` interrupts the run.
 *  @return Means table in @p scalar_at precision, or an error if the config is invalid.
 */
template <typename scalar_at, typename executor_at = executor_default_t, typename progress_at = dummy_progress_t>
expected_gt<distance_table_gt<scalar_at>> estimate_gt( //
    experiment_config_t const& config, random_source_t& random, executor_at&& executor = executor_at{},
    progress_at&& progress = progress_at{}) noexcept(false) {

    using scalar_t = scalar_at;
    using compute_t = typename scalar_traits_gt<scalar_t>::compute_t;
    using table_t = distance_table_gt<scalar_t>;

    expected_gt<table_t> result;
    error_t error = config.validate();
    if (error)
        return result.failed(std::move(error));

    batch_sampler_gt<scalar_t> sampler(config.dimensions, config.powers);
    table_cascade_gt<scalar_t> batches;
    std::size_t samples_per_batch = config.samples_per_batch();
    std::size_t processed = 0;

    while (processed < config.samples) {
        std::size_t batch = (std::min)(config.samples - processed, samples_per_batch);
        batches.push(sampler.sample(batch, random, executor));
        processed += batch;
        if (!progress(processed, config.samples))
            return result.failed("Interrupted by the progress callback");
    }

    table_t sums = batches.sum();
    sums.divide(scalar_t(compute_t(config.samples)));
    if (config.normalize)
        normalize_to_diagonal(sums);

    result.result = std::move(sums);
    return result;
}

/**
 *  @brief  Type-punned entry point, dispatching on `config.precision`.
 *          Values are widened to `f64_t` after all arithmetic is done in the requested precision.
 */
template <typename progress_at = dummy_progress_t>
expected_gt<means_table_t> estimate(experiment_config_t const& config, random_source_t& random,
                                    progress_at&& progress = progress_at{}) noexcept(false) {
    expected_gt<means_table_t> result;
    executor_default_t executor(config.threads);
    switch (config.precision) {
    case scalar_kind_t::f64_k: return estimate_gt<f64_t>(config, random, executor, progress);
    case scalar_kind_t::f32_k: {
        expected_gt<distance_table_gt<f32_t>> typed = estimate_gt<f32_t>(config, random, executor, progress);
        if (!typed)
            return result.failed(std::move(typed.error));
        result.result = typed.result.template cast<f64_t>();
        return result;
    }
    case scalar_kind_t::f16_k: {
        expected_gt<distance_table_gt<f16_t>> typed = estimate_gt<f16_t>(config, random, executor, progress);
        if (!typed)
            return result.failed(std::move(typed.error));
        result.result = typed.result.template cast<f64_t>();
        return result;
    }
    default: return result.failed("Unknown precision, choose: half, single, double");
    }
}

/**
 *  @brief  Renders the means as comma-separated values: a header with the powers,
 *          then one line per dimension, with 6 digits after the decimal point.
 */
inline std::string format_csv(means_table_t const& table) {
    std::string csv = "DIM\\Power";
    char buffer[64];
    for (std::size_t column = 0; column != table.powers(); ++column) {
        std::snprintf(buffer, sizeof(buffer), ", %zu", column + 1);
        csv += buffer;
    }
    csv += '\n';
    for (std::size_t row = 0; row != table.dimensions(); ++row) {
        std::snprintf(buffer, sizeof(buffer), "%zu", row + 1);
        csv += buffer;
        for (std::size_t column = 0; column != table.powers(); ++column) {
            std::snprintf(buffer, sizeof(buffer), ", %.6f", table(row, column));
            csv += buffer;
        }
        csv += '\n';
    }
    return csv;
}

inline void print_csv(means_table_t const& table, std::FILE* stream = stdout) {
    std::string csv = format_csv(table);
    std::fwrite(csv.data(), 1, csv.size(), stream);
    std::fflush(stream);
}

} // namespace cubedist
} // namespace unum
