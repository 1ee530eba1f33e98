/**
 *  @file       cubedist.cpp
 *  @brief      Command-line tool estimating the average distance between random
 *              points in unit hypercubes of growing dimensionality.
 *
 *  Prints a CSV table to `stdout` with one row per dimension and one column per
 *  norm power. Diagnostics, when enabled with `-v`, go to `stderr`.
 *
 *  Example:
 *      cubedist -d 10 -p 2 -r 100000 -f single
 */
#include <chrono>   // `std::chrono::steady_clock`
#include <climits>  // `CHAR_BIT`
#include <cstdio>   // `std::fprintf`
#include <iostream> // `std::cerr`
#include <string>   // `std::string`

#include <clipp.h> // Command Line Interface
#if CUBEDIST_USE_OPENMP
#include <omp.h> // `omp_get_max_threads()`
#endif

#include <cubedist/driver.hpp>

using namespace unum::cubedist;
using namespace unum;

using steady_clock_t = std::chrono::steady_clock;

/**
 *  @brief  Redraws a single `stderr` line with a bar and the sampling throughput
 *          after every batch, and reports the average throughput when destroyed.
 */
struct progress_printer_t {
    std::size_t processed{};
    std::size_t last_processed{};
    steady_clock_t::time_point started{};
    steady_clock_t::time_point last_time{};

    explicit progress_printer_t(std::size_t total) {
        std::fprintf(stderr, "Sampling %zu point pairs\n", total);
        started = last_time = steady_clock_t::now();
    }

    ~progress_printer_t() {
        double seconds = std::chrono::duration<double>(steady_clock_t::now() - started).count();
        std::fprintf(stderr, "\r\33[2K100 %% completed, %.0f samples/s\n", seconds > 0 ? processed / seconds : 0.);
    }

    bool operator()(std::size_t processed, std::size_t total) {
        constexpr char bars_k[] = "||||||||||||||||||||||||||||||||||||||||||||||||||||||||||||";
        constexpr int bars_len_k = 60;

        steady_clock_t::time_point now = steady_clock_t::now();
        double seconds = std::chrono::duration<double>(now - last_time).count();
        double samples_per_second = seconds > 0 ? (processed - last_processed) / seconds : 0.;
        double fraction = double(processed) / total;
        int filled = static_cast<int>(fraction * bars_len_k);

        std::fprintf(stderr, "\r%3.3f%% [%.*s%*s] %.0f samples/s, finished %zu/%zu", fraction * 100, filled, bars_k,
                     bars_len_k - filled, "", samples_per_second, processed, total);
        std::fflush(stderr);

        this->processed = last_processed = processed;
        last_time = now;
        return true;
    }
};

struct args_t {
    std::size_t dimensions = default_dimensions();
    std::size_t powers = default_powers();
    std::size_t samples = default_samples();
    std::size_t batch_size = default_batch_size();
    std::string precision = "double";
    std::uint64_t seed = 0;
    std::size_t threads = 0;

    bool normalize = false;
    bool verbose = false;
    bool help = false;
};

int main(int argc, char** argv) {

    using namespace clipp;

    auto args = args_t{};
    auto cli = ( //
        (option("-d") & value("max_dim", args.dimensions)).doc("Maximum hypercube dimensions [default: 100]"),
        (option("-p") & value("max_power", args.powers)).doc("Maximum power of the p-norm [default: 3]"),
        (option("-r") & value("num_samples", args.samples))
            .doc("Number of Monte Carlo samples for each entry [default: 1000000]"),
        option("-n").set(args.normalize).doc("Normalize to the longest diagonal"),
        (option("-b") & value("batch_size", args.batch_size))
            .doc("The maximum number of parallel values computed in each batch, equal to the number of samples in "
                 "the batch times max_dim and max_power [default: 1000000]"),
        (option("-f") & value("precision", args.precision))
            .doc("Use the specified floating point precision; valid options are half, single, and double "
                 "[default: double]"),
        (option("-s", "--seed") & value("seed", args.seed)).doc("Random seed, zero is non-deterministic [default: 0]"),
        (option("-j", "--threads") & value("integer", args.threads)).doc("Uses all available cores by default"),
        option("-v", "--verbose").set(args.verbose).doc("Print the configuration and progress to stderr"),
        option("-h", "--help").set(args.help).doc("Print this help information on this tool and exit"));

    if (!parse(argc, argv, cli)) {
        std::cerr << make_man_page(cli, argv[0]);
        return 1;
    }
    if (args.help) {
        std::cout << make_man_page(cli, argv[0]);
        return 0;
    }

    // The precision is the only thing that must be resolved before anything else.
    expected_gt<scalar_kind_t> precision = scalar_kind_from_name(args.precision.c_str(), args.precision.size());
    if (!precision) {
        std::fprintf(stderr, "Invalid datatype for -f \"%s\": %s\n", args.precision.c_str(),
                     precision.error.release());
        return 1;
    }

    experiment_config_t config;
    config.dimensions = args.dimensions;
    config.powers = args.powers;
    config.samples = args.samples;
    config.batch_size = args.batch_size;
    config.normalize = args.normalize;
    config.precision = *precision;
    config.seed = args.seed;
    config.threads = args.threads;

    cubedist::error_t invalid = config.validate();
    if (invalid) {
        std::fprintf(stderr, "Invalid arguments: %s\n", invalid.release());
        return 1;
    }

    random_source_t random(config.seed);

    if (args.verbose) {
#if CUBEDIST_USE_OPENMP
        std::fprintf(stderr, "- OpenMP threads: %d\n", omp_get_max_threads());
#endif
        std::size_t batch_bytes = 2 * config.samples_per_batch() * config.dimensions *
                                  bits_per_scalar(config.precision) / CHAR_BIT;
        std::fprintf(stderr, "- Precision: %s\n", scalar_kind_name(config.precision));
        std::fprintf(stderr, "- Dimensions: %zu\n", config.dimensions);
        std::fprintf(stderr, "- Powers: %zu\n", config.powers);
        std::fprintf(stderr, "- Samples: %zu\n", config.samples);
        std::fprintf(stderr, "- Samples per batch: %zu\n", config.samples_per_batch());
        std::fprintf(stderr, "-- Points memory per batch: %.2f MB\n", batch_bytes / 1e6);
        std::fprintf(stderr, "- Normalized: %s\n", config.normalize ? "yes" : "no");
        std::fprintf(stderr, "- Seed: %llu\n", static_cast<unsigned long long>(random.seed()));
    }

    expected_gt<means_table_t> means;
    if (args.verbose) {
        progress_printer_t printer{config.samples};
        means = estimate(config, random, printer);
    } else {
        means = estimate(config, random);
    }

    if (!means) {
        std::fprintf(stderr, "Estimation failed: %s\n", means.error.release());
        return 1;
    }

    print_csv(means.result, stdout);
    return 0;
}
