#include "libdynfit/dynamic_fit.hpp"
#include "libdynfit/errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

struct CliOptions {
    std::string model_path;
    std::string data_path;
    bool manual{false};
    std::optional<std::size_t> sample_size;
    std::string estimator{"ML"};
    std::size_t replications{500};
    std::optional<std::uint64_t> seed;
    int threads{0};
    bool plot{false};
    std::string export_path;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void print_usage(std::ostream& out) {
    out << "Usage: dynfit --model FILE [--data CSV | --manual --n N] [options]\n"
        << "\n"
        << "  --model FILE        lavaan-style CFA model (structural with --data,\n"
        << "                      standardized coefficients with --manual)\n"
        << "  --data CSV          fit the model to this data set first\n"
        << "  --manual            the model file holds standardized estimates\n"
        << "  --n N               sample size for --manual\n"
        << "  --estimator NAME    ML (default), GLS, ULS, DWLS or WLS\n"
        << "  --reps R            replications per level (default 500)\n"
        << "  --seed S            random seed (default: drawn and reported)\n"
        << "  --threads T         worker threads (default: all)\n"
        << "  --plot              print fit distribution summaries\n"
        << "  --export-data CSV   write the simulated fit indices\n"
        << "  --help              show this message\n";
}

[[nodiscard]] unsigned long long parse_count(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw UsageError(flag + " expects a non-negative integer, got '" + text + "'");
    }
    if (used != text.size() || text.front() == '-') {
        throw UsageError(flag + " expects a non-negative integer, got '" + text + "'");
    }
    return value;
}

[[nodiscard]] CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;
    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--model") opts.model_path = value_of(i, a);
        else if (a == "--data") opts.data_path = value_of(i, a);
        else if (a == "--manual") opts.manual = true;
        else if (a == "--n") opts.sample_size = static_cast<std::size_t>(parse_count(a, value_of(i, a)));
        else if (a == "--estimator") opts.estimator = value_of(i, a);
        else if (a == "--reps") opts.replications = static_cast<std::size_t>(parse_count(a, value_of(i, a)));
        else if (a == "--seed") opts.seed = static_cast<std::uint64_t>(parse_count(a, value_of(i, a)));
        else if (a == "--threads") opts.threads = static_cast<int>(parse_count(a, value_of(i, a)));
        else if (a == "--plot") opts.plot = true;
        else if (a == "--export-data") opts.export_path = value_of(i, a);
        else throw UsageError("unknown argument: " + a);
    }

    if (opts.model_path.empty()) {
        throw UsageError("--model is required");
    }
    if (opts.manual == !opts.data_path.empty()) {
        throw UsageError("give exactly one of --data or --manual");
    }
    if (opts.replications == 0) {
        throw UsageError("--reps must be positive");
    }
    return opts;
}

[[nodiscard]] std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw libdynfit::InputMismatchError("cannot open model file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

int run(const CliOptions& opts) {
    using namespace libdynfit;

    const std::string syntax = read_file(opts.model_path);

    CfaHbOptions options;
    options.manual = opts.manual;
    options.sample_size = opts.sample_size;
    options.estimator = opts.estimator;
    options.replications = opts.replications;
    options.plot = opts.plot;
    options.seed = opts.seed;
    options.threads = opts.threads;
    options.log = &std::cerr;

    ModelInput input = ManualModel{syntax};
    if (!opts.manual) {
        const DataTable data = read_csv(opts.data_path);
        if (data.dropped_rows > 0) {
            std::cerr << "Dropped " << data.dropped_rows << " incomplete rows from " << opts.data_path << "\n";
        }
        EstimatorOptions estimator_options;
        estimator_options.method = parse_estimation_method(opts.estimator);
        FittedModel fitted = fit_cfa(syntax, data, estimator_options);
        if (!fitted.fit.converged) {
            std::cerr << "Error: the model did not converge on " << opts.data_path << "\n";
            return 1;
        }
        input = std::move(fitted);
    }

    const CfaHbResult result = cfa_hb(input, options);

    std::cout << "Your DFI cutoffs:\n" << result.cutoffs.render();
    if (result.fit) {
        std::cout << "\nEmpirical fit indices:\n" << build_empirical_fit_table(*result.fit).render();
    }
    if (opts.plot) {
        std::cout << "\nFit index distributions:\n";
        for (const auto& dist : result.plots) {
            std::cout << "  " << summarize_distribution(dist) << "\n";
        }
    }
    if (!opts.export_path.empty()) {
        write_replication_csv(opts.export_path, result.data);
        std::cerr << "Wrote simulated fit indices to " << opts.export_path << "\n";
    }
    std::cerr << "Seed: " << result.seed << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
            print_usage(std::cout);
            return 0;
        }
    }

    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "dynfit: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 2;
    }

    try {
        return run(opts);
    } catch (const libdynfit::DynamicFitError& e) {
        std::cerr << "dynamic Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
