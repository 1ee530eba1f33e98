/**
 *  @file       test.cpp
 *  @brief      Unit-testing the hypercube distance estimator.
 *  @date       June 10, 2023
 */
#include <atomic>    // `std::atomic`
#include <cmath>     // `std::fabs`
#include <cstring>   // `std::strlen`
#include <cstdio>    // `std::printf`
#include <stdexcept> // `std::runtime_error`
#include <string>    // `std::string`
#include <vector>    // `std::vector`

#include <cubedist/driver.hpp>
#include <cubedist/sampler.hpp>

using namespace unum::cubedist;
using namespace unum;

void expect(bool must_be_true) {
    if (!must_be_true)
        throw std::runtime_error("Failed!");
}

template <typename value_at> void expect_eq(value_at a, value_at b) { expect(a == b); }

void expect_near(f64_t a, f64_t b, f64_t tolerance) { expect(std::fabs(a - b) <= tolerance); }

template <typename scalar_at> f64_t epsilon_for() noexcept {
    switch (scalar_kind<scalar_at>()) {
    case scalar_kind_t::f64_k: return 1e-12;
    case scalar_kind_t::f32_k: return 1e-6;
    default: return 1e-3;
    }
}

/**
 *  Half-precision arithmetic must lose the increments below its resolution,
 *  otherwise the whole pipeline would silently run in a wider type.
 */
void test_half_rounding() {
    // Native and software halves are both exactly 16 bits wide.
    static_assert(sizeof(f16_t) == 2, "Half must take two bytes");
#if CUBEDIST_USE_NATIVE_F16
    static_assert(!std::is_class<f16_t>::value, "Native half must be a builtin type");
#else
    static_assert(std::is_same<f16_t, f16_bits_t>::value, "Software half must be used");
#endif
    f16_t one = f16_t(1.f);
    f16_t tiny = f16_t(0.0001f);
    f16_t sum = f16_t(one + tiny);
    expect_eq(to_f64(sum), 1.0);

    // 2049 is the first integer that half can't represent.
    f16_t big = f16_t(2048.f);
    f16_t next = f16_t(big + f16_t(1.f));
    expect_eq(to_f64(next), 2048.0);

    // Single precision keeps it.
    f32_t single = 1.f + 0.0001f;
    expect(single != 1.f);
}

void test_precision_names() {
    struct case_t {
        char const* name;
        scalar_kind_t kind;
    };
    for (case_t c : {case_t{"double", scalar_kind_t::f64_k}, case_t{"f64", scalar_kind_t::f64_k},
                     case_t{"single", scalar_kind_t::f32_k}, case_t{"f32", scalar_kind_t::f32_k},
                     case_t{"half", scalar_kind_t::f16_k}, case_t{"f16", scalar_kind_t::f16_k}}) {
        expected_gt<scalar_kind_t> parsed = scalar_kind_from_name(c.name, std::strlen(c.name));
        expect(bool(parsed));
        expect(*parsed == c.kind);
    }

    for (char const* name : {"quad", "", "Double", "halff"}) {
        expected_gt<scalar_kind_t> parsed = scalar_kind_from_name(name, std::strlen(name));
        expect(!parsed);
        expect(parsed.error.what() != nullptr);
        expect(std::string(parsed.error.release()) == "Unknown precision, choose: half, single, double");
    }

    // Only the first `len` characters are compared.
    char const* padded = "half-precision";
    expected_gt<scalar_kind_t> prefix = scalar_kind_from_name(padded, 4);
    expect(bool(prefix));
    expect(*prefix == scalar_kind_t::f16_k);

    expect_eq(bits_per_scalar(scalar_kind_t::f16_k), std::size_t(16));
    expect_eq(bits_per_scalar(scalar_kind_t::f64_k), std::size_t(64));
    expect_eq(std::string(scalar_kind_name(scalar_kind_t::f32_k)), std::string("f32"));
}

template <typename scalar_at> void test_uniform(std::size_t count) {
    random_source_t random(42);
    expect_eq(random.seed(), std::uint64_t(42));

    std::vector<scalar_at> values(count);
    random.fill_uniform(values.data(), count);

    f64_t sum = 0;
    for (scalar_at value : values) {
        f64_t widened = to_f64(value);
        expect(widened >= 0.0);
        expect(widened < 1.0);
        sum += widened;
    }
    expect_near(sum / count, 0.5, 0.02);

    // Same seed, same stream.
    random_source_t replay(42);
    for (std::size_t i = 0; i != 16; ++i)
        expect_eq(to_f64(replay.uniform<scalar_at>()), to_f64(values[i]));

    // Zero asks for a fresh seed.
    random_source_t fresh(0);
    expect(fresh.seed() != 0);
}

void test_executor(std::size_t threads, std::size_t tasks) {
    executor_stl_t executor(threads);
    expect_eq(executor.size(), threads);

    // Workers can't throw into this thread, so they only leave marks.
    std::vector<std::atomic<std::size_t>> visits(tasks);
    for (std::atomic<std::size_t>& visit : visits)
        visit = 0;
    std::atomic<bool> thread_ids_in_range{true};
    executor.fixed(tasks, [&](std::size_t thread_idx, std::size_t task_idx) {
        if (thread_idx >= threads)
            thread_ids_in_range = false;
        visits[task_idx]++;
    });
    expect(thread_ids_in_range.load());
    for (std::atomic<std::size_t>& visit : visits)
        expect_eq(visit.load(), std::size_t(1));
}

void test_table() {
    distance_table_gt<f64_t> table(3, 2);
    expect_eq(table.dimensions(), std::size_t(3));
    expect_eq(table.powers(), std::size_t(2));
    expect_eq(table.size(), std::size_t(6));
    for (std::size_t i = 0; i != table.size(); ++i)
        expect_eq(table.data()[i], 0.0);

    table(2, 1) = 4;
    expect_eq(table.row(2)[1], 4.0);
    table += table;
    expect_eq(table(2, 1), 8.0);
    table.divide(2);
    expect_eq(table(2, 1), 4.0);

    distance_table_gt<f32_t> narrow = table.cast<f32_t>();
    expect_eq(narrow(2, 1), 4.f);
    table.reset();
    expect_eq(table(2, 1), 0.0);

    bool thrown = false;
    try {
        distance_table_gt<f64_t> other(2, 2);
        table += other;
    } catch (std::invalid_argument const&) {
        thrown = true;
    }
    expect(thrown);

    thrown = false;
    try {
        distance_table_gt<f64_t> degenerate(0, 2);
    } catch (std::invalid_argument const&) {
        thrown = true;
    }
    expect(thrown);
}

/**
 *  Walks the kernel through one known pair of points:
 *  `a = {0, 0}` and `b = {0.5, 0.25}`.
 */
template <typename scalar_at> void test_kernel_on_known_points() {
    using scalar_t = scalar_at;
    batch_sampler_gt<scalar_t> sampler(2, 2);
    expect_near(to_f64(sampler.inverse_powers()[0]), 1.0, 0);
    expect_near(to_f64(sampler.inverse_powers()[1]), 0.5, 0);

    std::vector<scalar_t> a{scalar_t(0.f), scalar_t(0.f)};
    std::vector<scalar_t> b{scalar_t(0.5f), scalar_t(0.25f)};
    executor_stl_t executor(1);
    distance_table_gt<scalar_t> sums = sampler.accumulate(a.data(), b.data(), 1, executor);

    f64_t epsilon = epsilon_for<scalar_t>();
    expect_near(to_f64(sums(0, 0)), 0.5, epsilon);
    expect_near(to_f64(sums(0, 1)), 0.5, epsilon);
    expect_near(to_f64(sums(1, 0)), 0.75, epsilon);
    expect_near(to_f64(sums(1, 1)), 0.5590169943749474, epsilon);

    // Swapping the points changes nothing.
    distance_table_gt<scalar_t> swapped = sampler.accumulate(b.data(), a.data(), 1, executor);
    for (std::size_t i = 0; i != sums.size(); ++i)
        expect_eq(to_f64(swapped.data()[i]), to_f64(sums.data()[i]));
}

/**
 *  Summing one batch of samples must be the same as summing
 *  two halves of it separately and adding the tables.
 */
void test_batch_additivity(std::size_t samples, std::size_t dimensions, std::size_t powers) {
    random_source_t random(3);
    std::vector<f64_t> a(samples * dimensions), b(samples * dimensions);
    random.fill_uniform(a.data(), a.size());
    random.fill_uniform(b.data(), b.size());

    batch_sampler_gt<f64_t> sampler(dimensions, powers);
    executor_stl_t executor(1);
    means_table_t whole = sampler.accumulate(a.data(), b.data(), samples, executor);

    std::size_t half = samples / 2;
    means_table_t first = sampler.accumulate(a.data(), b.data(), half, executor);
    means_table_t second = sampler.accumulate(a.data() + half * dimensions, b.data() + half * dimensions,
                                              samples - half, executor);
    first += second;
    for (std::size_t i = 0; i != whole.size(); ++i)
        expect_near(first.data()[i], whole.data()[i], 1e-9 * (1 + whole.data()[i]));

    // The reduction tree doesn't depend on the number of threads.
    executor_stl_t parallel(4);
    means_table_t spread = sampler.accumulate(a.data(), b.data(), samples, parallel);
    for (std::size_t i = 0; i != whole.size(); ++i)
        expect_eq(spread.data()[i], whole.data()[i]);
}

/**
 *  Sums are non-decreasing along the dimensions for every pair of points,
 *  and non-increasing along the powers.
 */
void test_sums_monotonicity() {
    random_source_t random(11);
    std::size_t const dimensions = 16, powers = 4;
    means_table_t sums = sample_batch<f64_t>(1000, dimensions, powers, random, executor_stl_t(2));
    for (std::size_t row = 1; row != dimensions; ++row)
        for (std::size_t column = 0; column != powers; ++column)
            expect(sums(row, column) >= sums(row - 1, column));
    for (std::size_t row = 0; row != dimensions; ++row)
        for (std::size_t column = 1; column != powers; ++column)
            expect(sums(row, column) <= sums(row, column - 1) * (1 + 1e-12));
}

/**
 *  A hundred thousand increments of one third stall a naive half-precision sum
 *  at 2048. Summing them pairwise stays close to the exact total.
 */
void test_half_pairwise_sums() {
    std::size_t const samples = 100000;
    std::vector<f16_t> a(samples, f16_t(0.f)), b(samples, f16_t(0.333251953125f));
    batch_sampler_gt<f16_t> sampler(1, 1);
    distance_table_gt<f16_t> sums = sampler.accumulate(a.data(), b.data(), samples, executor_stl_t(3));
    expect_near(to_f64(sums(0, 0)), 0.333251953125 * samples, 0.01 * 0.333251953125 * samples);
}

void test_table_cascade() {
    table_cascade_gt<f16_t> cascade;
    expect(cascade.empty());

    distance_table_gt<f16_t> third(1, 2);
    third(0, 0) = f16_t(0.333251953125f);
    third(0, 1) = f16_t(1.f);
    for (std::size_t i = 0; i != 30000; ++i)
        cascade.push(third);
    expect(!cascade.empty());

    distance_table_gt<f16_t> total = cascade.sum();
    expect_near(to_f64(total(0, 0)), 0.333251953125 * 30000, 0.01 * 0.333251953125 * 30000);
    expect_near(to_f64(total(0, 1)), 30000, 0.01 * 30000);

    bool thrown = false;
    try {
        table_cascade_gt<f64_t> nothing;
        nothing.sum();
    } catch (std::logic_error const&) {
        thrown = true;
    }
    expect(thrown);
}

void test_samples_per_batch() {
    experiment_config_t config;
    expect_eq(config.samples_per_batch(), std::size_t(1000000 / 100 / 3));

    config.dimensions = 4;
    config.powers = 3;
    config.batch_size = 1;
    expect_eq(config.samples_per_batch(), std::size_t(1));

    config.batch_size = 120;
    expect_eq(config.samples_per_batch(), std::size_t(10));
    config.batch_size = 131;
    expect_eq(config.samples_per_batch(), std::size_t(10));
}

void test_validation() {
    struct case_t {
        std::size_t dimensions, powers, samples, batch_size;
    };
    for (case_t c : {case_t{0, 3, 10, 100}, case_t{3, 0, 10, 100}, case_t{3, 3, 0, 100}, case_t{3, 3, 10, 0}}) {
        experiment_config_t config;
        config.dimensions = c.dimensions;
        config.powers = c.powers;
        config.samples = c.samples;
        config.batch_size = c.batch_size;

        cubedist::error_t error = config.validate();
        expect(bool(error));
        error.release();

        random_source_t random(1);
        expected_gt<means_table_t> means = estimate(config, random);
        expect(!means);
        expect(means.error.release() != nullptr);
    }

    experiment_config_t unknown;
    unknown.precision = scalar_kind_t::unknown_k;
    random_source_t random(1);
    expected_gt<means_table_t> means = estimate(unknown, random);
    expect(!means);
    expect(std::string(means.error.release()) == "Unknown precision, choose: half, single, double");
}

/**
 *  The mean distance between two uniform points on a segment is 1/3.
 */
void test_segment_convergence() {
    experiment_config_t config;
    config.dimensions = 1;
    config.powers = 1;
    config.samples = 200000;
    config.seed = 7;

    random_source_t random(config.seed);
    expected_gt<means_table_t> means = estimate(config, random);
    expect(bool(means));
    expect_eq(means.result.dimensions(), std::size_t(1));
    expect_eq(means.result.powers(), std::size_t(1));
    expect_near(means.result(0, 0), 1.0 / 3, 0.005);

    config.precision = scalar_kind_t::f32_k;
    config.samples = 100000;
    random_source_t random_single(config.seed);
    expected_gt<means_table_t> single = estimate(config, random_single);
    expect(bool(single));
    expect_near(single.result(0, 0), 1.0 / 3, 0.01);
}

/**
 *  A short half-precision run, where the second power still lands near 1/3
 *  because a single coordinate has the same norm in every power.
 */
void test_half_precision_run() {
    experiment_config_t config;
    config.dimensions = 1;
    config.powers = 2;
    config.samples = 400;
    config.precision = scalar_kind_t::f16_k;
    config.seed = 5;
    config.threads = 1;

    random_source_t random(config.seed);
    expected_gt<means_table_t> means = estimate(config, random);
    expect(bool(means));
    expect_near(means.result(0, 0), 1.0 / 3, 0.06);
    expect_near(means.result(0, 1), 1.0 / 3, 0.06);
}

/**
 *  Sixty thousand samples fit the half range, and the estimate must not
 *  depend on how many threads shared the work.
 */
void test_half_precision_threads(std::size_t samples, std::size_t batch_size) {
    experiment_config_t config;
    config.dimensions = 1;
    config.powers = 1;
    config.samples = samples;
    config.batch_size = batch_size;
    config.precision = scalar_kind_t::f16_k;
    config.seed = 5;

    config.threads = 1;
    random_source_t random_single(config.seed);
    expected_gt<means_table_t> single = estimate(config, random_single);
    expect(bool(single));
    expect_near(single.result(0, 0), 1.0 / 3, 0.02);

    config.threads = 16;
    random_source_t random_many(config.seed);
    expected_gt<means_table_t> many = estimate(config, random_many);
    expect(bool(many));
    expect_near(many.result(0, 0), 1.0 / 3, 0.02);
    expect_eq(many.result(0, 0), single.result(0, 0));
}

void test_batching_invariance() {
    experiment_config_t config;
    config.dimensions = 3;
    config.powers = 2;
    config.samples = 200000;
    config.seed = 13;
    config.threads = 1;

    random_source_t random_large(config.seed);
    expected_gt<means_table_t> large = estimate(config, random_large);
    expect(bool(large));

    config.batch_size = 60;
    expect_eq(config.samples_per_batch(), std::size_t(10));
    random_source_t random_small(config.seed);
    expected_gt<means_table_t> small = estimate(config, random_small);
    expect(bool(small));

    for (std::size_t i = 0; i != large.result.size(); ++i)
        expect_near(small.result.data()[i], large.result.data()[i], 1e-2 * large.result.data()[i]);
}

void test_reproducibility() {
    experiment_config_t config;
    config.dimensions = 5;
    config.powers = 3;
    config.samples = 5000;
    config.batch_size = 3000;
    config.seed = 99;
    config.threads = 2;

    random_source_t first_random(config.seed);
    random_source_t second_random(config.seed);
    expected_gt<means_table_t> first = estimate(config, first_random);
    expected_gt<means_table_t> second = estimate(config, second_random);
    expect(bool(first) && bool(second));
    for (std::size_t i = 0; i != first.result.size(); ++i)
        expect_eq(first.result.data()[i], second.result.data()[i]);
}

void test_normalization() {
    experiment_config_t config;
    config.dimensions = 6;
    config.powers = 3;
    config.samples = 2000;
    config.seed = 21;
    config.threads = 2;

    random_source_t raw_random(config.seed);
    expected_gt<means_table_t> raw = estimate(config, raw_random);
    config.normalize = true;
    random_source_t normalized_random(config.seed);
    expected_gt<means_table_t> normalized = estimate(config, normalized_random);
    expect(bool(raw) && bool(normalized));

    for (std::size_t row = 0; row != config.dimensions; ++row)
        for (std::size_t column = 0; column != config.powers; ++column) {
            f64_t diagonal = std::pow(f64_t(row + 1), 1.0 / (column + 1));
            f64_t value = normalized.result(row, column);
            expect_near(value, raw.result(row, column) / diagonal, 1e-12);
            expect(value >= 0 && value <= 1);
        }

    // The one-dimensional diagonal is a unit segment in every norm.
    for (std::size_t column = 0; column != config.powers; ++column)
        expect_eq(normalized.result(0, column), raw.result(0, column));
}

void test_progress_interruption() {
    experiment_config_t config;
    config.dimensions = 2;
    config.powers = 2;
    config.samples = 100;
    config.batch_size = 40;
    config.seed = 1;

    std::size_t calls = 0;
    std::size_t last_processed = 0;
    auto observe = [&](std::size_t processed, std::size_t total) {
        expect_eq(total, config.samples);
        expect(processed > last_processed);
        last_processed = processed;
        calls++;
        return true;
    };
    random_source_t random(config.seed);
    expected_gt<means_table_t> finished = estimate(config, random, observe);
    expect(bool(finished));
    expect_eq(calls, std::size_t(10));
    expect_eq(last_processed, config.samples);

    calls = 0;
    auto interrupt = [&](std::size_t, std::size_t) {
        calls++;
        return false;
    };
    expected_gt<means_table_t> interrupted = estimate(config, random, interrupt);
    expect(!interrupted);
    expect_eq(calls, std::size_t(1));
    expect(std::string(interrupted.error.release()) == "Interrupted by the progress callback");
}

void test_csv() {
    means_table_t table(2, 2);
    table(0, 0) = 0.5;
    table(0, 1) = 0.5;
    table(1, 0) = 0.75;
    table(1, 1) = 0.5590169943749474;
    expect(format_csv(table) == "DIM\\Power, 1, 2\n"
                                "1, 0.500000, 0.500000\n"
                                "2, 0.750000, 0.559017\n");

    means_table_t single(1, 3);
    single(0, 2) = 1.0 / 3;
    expect(format_csv(single) == "DIM\\Power, 1, 2, 3\n1, 0.000000, 0.000000, 0.333333\n");
}

int main(int, char**) {

    std::printf("Testing scalar types\n");
    test_half_rounding();
    test_precision_names();
    test_uniform<f64_t>(10000);
    test_uniform<f32_t>(10000);
    test_uniform<f16_t>(10000);

    std::printf("Testing executors\n");
    for (std::size_t threads : {1, 2, 4})
        for (std::size_t tasks : {1, 3, 10, 97})
            test_executor(threads, tasks);

    std::printf("Testing the sampling kernel\n");
    test_table();
    test_kernel_on_known_points<f64_t>();
    test_kernel_on_known_points<f32_t>();
    test_kernel_on_known_points<f16_t>();
    for (std::size_t samples : {2, 7, 100})
        for (std::size_t dimensions : {1, 5})
            test_batch_additivity(samples, dimensions, 3);
    test_sums_monotonicity();
    test_half_pairwise_sums();
    test_table_cascade();

    std::printf("Testing the accumulation driver\n");
    test_samples_per_batch();
    test_validation();
    test_segment_convergence();
    test_half_precision_run();
    test_half_precision_threads(60000, 1000000);
    test_half_precision_threads(60000, 1000);
    test_batching_invariance();
    test_reproducibility();
    test_normalization();
    test_progress_interruption();

    std::printf("Testing the output format\n");
    test_csv();

    return 0;
}
