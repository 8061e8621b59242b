/// @file src/main.cpp
/// @brief thomas_chaos CLI entry point.
///
/// Usage:
///   thomas_chaos --analyze  [b] [steps]                 Single-point analysis
///   thomas_chaos --sweep    [b_min b_max b_step] [steps] Parameter sweep
///   thomas_chaos --zero-one [b] [samples]               0-1 test on x(t)
///   thomas_chaos --help                                 Print usage

#include "tchaos/config.hpp"
#include "tchaos/ctm.hpp"
#include "tchaos/lyapunov.hpp"
#include "tchaos/model.hpp"
#include "tchaos/statistics.hpp"
#include "tchaos/sweep.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

namespace {

/// Steps between samples of the 0-1 series (Δt = 5 at the default dt).
constexpr std::uint64_t ZERO_ONE_STRIDE = 1000;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  thomas_chaos --analyze  [b] [steps]                  Lyapunov spectrum + CTM at one b\n"
        "  thomas_chaos --sweep    [b_min b_max b_step] [steps] CTM(b) over a grid\n"
        "  thomas_chaos --zero-one [b] [samples]                0-1 test on the x coordinate\n"
        "  thomas_chaos --help                                  Show this help\n"
        "\n"
        "Defaults: b={}, dt={}, seed=({}, {}, {}), {} analysis steps\n",
        tchaos::constants::DEFAULT_B, tchaos::constants::DEFAULT_DT,
        tchaos::constants::DEFAULT_SEED_X, tchaos::constants::DEFAULT_SEED_Y,
        tchaos::constants::DEFAULT_SEED_Z, tchaos::constants::DEFAULT_ANALYSIS_STEPS);
}

std::optional<double> parse_double(const char* text) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE) return std::nullopt;
    return v;
}

std::optional<std::uint64_t> parse_count(const char* text) {
    if (text[0] == '-') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

/// Parse argv[index] if present; report and fail on malformed input.
template <typename T, typename Parser>
bool optional_arg(int argc, char* argv[], int index, const char* name,
                  Parser parse, T& out) {
    if (index >= argc) return true;
    const auto v = parse(argv[index]);
    if (!v) {
        fmt::print(stderr, "Error: invalid {} '{}'\n", name, argv[index]);
        return false;
    }
    out = *v;
    return true;
}

/// Transient, Benettin analysis, CTM and (with enough windows) bootstrap.
int run_analyze(const tchaos::AnalysisConfig& cfg) {
    fmt::print("{}\n", cfg.to_string());

    tchaos::lyapunov::LyapunovRun run(cfg);
    run.run_transient(cfg.transient_steps);
    run.run(cfg.analysis_steps);

    const auto exps = run.exponents();
    fmt::print("steps={}  QR passes={}  converged={}  FTLE windows={}\n",
               run.step_count(), run.state().qr_count,
               run.is_converged() ? "yes" : "no", run.state().ftle.size());

    const tchaos::ctm::CtmCalculator calc(cfg.b, cfg.sum_identity_tolerance);
    const auto metrics = calc.compute(exps);
    if (!metrics) {
        fmt::print(stderr, "Error: Lyapunov spectrum is not finite\n");
        return 1;
    }
    fmt::print("{}\n", metrics->to_string());

    const auto windows = run.state().ftle.completed();
    const auto ci = tchaos::stats::exponent_confidence(windows, exps, cfg.confidence_level);
    for (std::size_t i = 0; i < ci.size(); ++i) {
        fmt::print("  λ{} = {:+.5f}  CI [{:+.5f}, {:+.5f}]  σ={:.5f}\n",
                   i + 1, ci[i].estimate, ci[i].ci.lower, ci[i].ci.upper, ci[i].stddev);
    }

    if (windows.size() >= tchaos::constants::MIN_BOOTSTRAP_WINDOWS) {
        const auto boot = tchaos::stats::bootstrap_ctm(windows, cfg.b, {
            .num_bootstrap    = cfg.num_bootstrap,
            .confidence_level = cfg.confidence_level,
            .rng_seed         = cfg.rng_seed,
            .sum_tolerance    = cfg.sum_identity_tolerance,
        });
        fmt::print("{}\n", boot.to_string());
    } else {
        fmt::print("bootstrap skipped: {} of {} required FTLE windows\n",
                   windows.size(), tchaos::constants::MIN_BOOTSTRAP_WINDOWS);
    }
    return 0;
}

int run_sweep(const tchaos::sweep::SweepConfig& cfg) {
    tchaos::sweep::SweepOrchestrator orchestrator(cfg);
    tchaos::sweep::SweepJob job;

    const auto result = orchestrator.run(job);
    fmt::print("{}", result.to_string());
    return result.status == tchaos::sweep::SweepStatus::Completed ? 0 : 1;
}

int run_zero_one(double b, std::size_t samples) {
    const tchaos::Spectrum seed{tchaos::constants::DEFAULT_SEED_X,
                                tchaos::constants::DEFAULT_SEED_Y,
                                tchaos::constants::DEFAULT_SEED_Z};
    tchaos::model::ThomasIntegrator integrator(b, tchaos::constants::DEFAULT_DT, seed);
    integrator.step_n(tchaos::constants::DEFAULT_TRANSIENT_STEPS);

    const auto series = tchaos::model::sample_coordinate(integrator, samples, ZERO_ONE_STRIDE);
    const auto result = tchaos::stats::zero_one_test(series);
    fmt::print("b={:.4f}  {}\n", b, result.to_string());
    return 0;
}

int dispatch(int argc, char* argv[], const std::string& mode) {
    if (mode == "--analyze") {
        tchaos::AnalysisConfig cfg;
        if (!optional_arg(argc, argv, 2, "b", parse_double, cfg.b)) return 1;
        if (!optional_arg(argc, argv, 3, "steps", parse_count, cfg.analysis_steps)) return 1;
        cfg.validate();
        return run_analyze(cfg);
    }

    if (mode == "--sweep") {
        tchaos::sweep::SweepConfig cfg;
        cfg.verbose = true;
        if (argc >= 5) {
            if (!optional_arg(argc, argv, 2, "b_min", parse_double, cfg.grid.b_min))   return 1;
            if (!optional_arg(argc, argv, 3, "b_max", parse_double, cfg.grid.b_max))   return 1;
            if (!optional_arg(argc, argv, 4, "b_step", parse_double, cfg.grid.b_step)) return 1;
            if (!optional_arg(argc, argv, 5, "steps", parse_count,
                              cfg.analysis.analysis_steps)) return 1;
            cfg.grid.zones.clear();
        } else if (argc > 2) {
            fmt::print(stderr, "Error: --sweep takes either no grid or b_min b_max b_step\n");
            return 1;
        }
        return run_sweep(cfg);
    }

    if (mode == "--zero-one") {
        double        b       = tchaos::constants::DEFAULT_B;
        std::uint64_t samples = 3000;
        if (!optional_arg(argc, argv, 2, "b", parse_double, b))             return 1;
        if (!optional_arg(argc, argv, 3, "samples", parse_count, samples)) return 1;
        return run_zero_one(b, static_cast<std::size_t>(samples));
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    try {
        return dispatch(argc, argv, mode);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
