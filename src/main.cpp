/// @file src/main.cpp
/// @brief mlcv CLI entry point.
///
/// Usage:
///   mlcv --train <file> --layers 2,10,10,2 [options]   Train a DeepTICA CV
///   mlcv --help                                        Print usage

#include "mlcv/config.hpp"
#include "mlcv/data_loader.hpp"
#include "mlcv/dataset.hpp"
#include "mlcv/deeptica.hpp"
#include "mlcv/errors.hpp"
#include "mlcv/log.hpp"
#include "mlcv/metrics.hpp"
#include "mlcv/trainer.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  mlcv --train <file> --layers 2,10,10,2 [options]\n"
        "  mlcv --help\n"
        "\n"
        "Options:\n"
        "  --out-features <k>   Number of CVs (default: last layer size)\n"
        "  --lag <n>            Lag time in samples (default: 1)\n"
        "  --epochs <n>         Training epochs (default: 1)\n"
        "  --batch <n>          Batch size (default: 10000)\n"
        "  --valid <f>          Validation fraction in [0, 1) (default: 0.2)\n"
        "  --lr <x>             Adam learning rate (default: 1e-3)\n"
        "  --reg <x>            C(0) regularization (default: 1e-6)\n"
        "  --config <file>      Model configuration (key = value lines)\n"
        "  --output <file>      Write CV values here instead of stdout\n"
        "  --metrics <file>     Write step metrics as CSV\n"
        "  --verbose            Debug logging\n"
        "  --quiet              Errors only\n"
        "\n"
        "Input format: one sample per line, descriptors separated by spaces,\n"
        "tabs or commas; '#' starts a comment line.\n"
    );
}

struct CliOptions {
    std::string                 train_file;
    std::optional<std::string>  layers;
    std::optional<Eigen::Index> out_features;
    Eigen::Index                lag        = 1;
    std::size_t                 epochs     = 1;
    Eigen::Index                batch_size = mlcv::constants::DEFAULT_BATCH_SIZE;
    double                      valid_fraction = 0.2;
    std::optional<double>       lr;
    std::optional<double>       reg;
    std::optional<std::string>  config_file;
    std::optional<std::string>  output_file;
    std::optional<std::string>  metrics_file;
};

[[nodiscard]] std::optional<long long> to_integer(const std::string& s) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (s.empty() || end != s.c_str() + s.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return v;
}

[[nodiscard]] std::optional<double> to_double(const std::string& s) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return v;
}

/// Parse argv into `opts`. Returns false (after printing why) on bad input.
[[nodiscard]] bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string flag(argv[i]);

        if (flag == "--verbose") {
            mlcv::log::set_level(mlcv::log::Level::Debug);
            continue;
        }
        if (flag == "--quiet") {
            mlcv::log::set_level(mlcv::log::Level::Quiet);
            continue;
        }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return false;
        }
        const std::string value(argv[++i]);

        auto bad_value = [&]() {
            fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, flag);
            return false;
        };

        if (flag == "--train") {
            opts.train_file = value;
        } else if (flag == "--layers") {
            opts.layers = value;
        } else if (flag == "--out-features") {
            const auto v = to_integer(value);
            if (!v || *v < 1) return bad_value();
            opts.out_features = static_cast<Eigen::Index>(*v);
        } else if (flag == "--lag") {
            const auto v = to_integer(value);
            if (!v || *v < 1) return bad_value();
            opts.lag = static_cast<Eigen::Index>(*v);
        } else if (flag == "--epochs") {
            const auto v = to_integer(value);
            if (!v || *v < 1) return bad_value();
            opts.epochs = static_cast<std::size_t>(*v);
        } else if (flag == "--batch") {
            const auto v = to_integer(value);
            if (!v || *v < 1) return bad_value();
            opts.batch_size = static_cast<Eigen::Index>(*v);
        } else if (flag == "--valid") {
            const auto v = to_double(value);
            if (!v) return bad_value();
            opts.valid_fraction = *v;
        } else if (flag == "--lr") {
            const auto v = to_double(value);
            if (!v) return bad_value();
            opts.lr = *v;
        } else if (flag == "--reg") {
            const auto v = to_double(value);
            if (!v) return bad_value();
            opts.reg = *v;
        } else if (flag == "--config") {
            opts.config_file = value;
        } else if (flag == "--output") {
            opts.output_file = value;
        } else if (flag == "--metrics") {
            opts.metrics_file = value;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return false;
        }
    }
    return true;
}

/// Assemble the model configuration: file first, then command-line overrides.
[[nodiscard]] std::optional<mlcv::cv::ModelConfig> build_config(const CliOptions& opts) {
    mlcv::cv::ModelConfig cfg;
    if (opts.config_file) {
        auto loaded = mlcv::cv::load_config(*opts.config_file);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot open config file '{}'\n", *opts.config_file);
            return std::nullopt;
        }
        cfg = std::move(*loaded);
    }
    if (opts.layers)       cfg.layers = mlcv::cv::parse_layers(*opts.layers);
    if (opts.out_features) cfg.out_features = *opts.out_features;
    if (opts.lr)           cfg.learning_rate = *opts.lr;
    if (opts.reg)          cfg.tica.options.reg_c0 = *opts.reg;
    if (cfg.layers.empty()) {
        fmt::print(stderr, "Error: --layers (or 'layers' in the config file) is required\n");
        return std::nullopt;
    }
    return cfg;
}

/// Train a DeepTICA CV on the trajectory and write its values.
/// Returns 0 on success, 1 on error.
int run_train(const CliOptions& opts) {
    auto x = mlcv::core::DataLoader::load_csv(opts.train_file);
    if (!x) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.train_file);
        return 1;
    }
    if (x->rows() == 0) {
        fmt::print(stderr, "Error: no valid samples loaded from '{}'\n", opts.train_file);
        return 1;
    }
    mlcv::log::info("loaded {} samples x {} descriptors from '{}'",
                    x->rows(), x->cols(), opts.train_file);

    const auto cfg = build_config(opts);
    if (!cfg) {
        return 1;
    }
    if (cfg->layers.front() != x->cols()) {
        fmt::print(stderr, "Error: first layer has {} inputs but the data has {} columns\n",
                   cfg->layers.front(), x->cols());
        return 1;
    }

    mlcv::cv::DeepTicaCV model(*cfg);

    mlcv::core::DataModule data(
        mlcv::core::build_timelagged_dataset(*x, opts.lag),
        mlcv::core::DataModuleOptions{
            .batch_size     = opts.batch_size,
            .valid_fraction = opts.valid_fraction,
        });

    std::shared_ptr<mlcv::core::MetricsSink> sink;
    if (opts.metrics_file) {
        sink = std::make_shared<mlcv::core::CsvSink>(*opts.metrics_file);
    } else if (mlcv::log::enabled(mlcv::log::Level::Debug)) {
        sink = std::make_shared<mlcv::core::ConsoleSink>();
    }

    mlcv::train::Trainer trainer({.max_epochs = opts.epochs, .metrics = sink});
    const auto result = trainer.fit(model, data);
    if (mlcv::log::enabled(mlcv::log::Level::Info)) {
        fmt::print(stderr, "{}", result.to_string());
    }

    const mlcv::Matrix s = model.forward(*x);

    std::FILE* out = stdout;
    if (opts.output_file) {
        out = std::fopen(opts.output_file->c_str(), "w");
        if (out == nullptr) {
            fmt::print(stderr, "Error: cannot open output file '{}'\n", *opts.output_file);
            return 1;
        }
    }
    for (Eigen::Index i = 0; i < s.rows(); ++i) {
        for (Eigen::Index j = 0; j < s.cols(); ++j) {
            if (j > 0) {
                fmt::print(out, " ");
            }
            fmt::print(out, "{:.8g}", s(i, j));
        }
        fmt::print(out, "\n");
    }
    if (out != stdout) {
        std::fclose(out);
        mlcv::log::info("wrote {} CV values to '{}'", s.rows(), *opts.output_file);
    }
    return 0;
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

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 1;
    }
    if (opts.train_file.empty()) {
        fmt::print(stderr, "Error: --train requires a data file path\n");
        print_usage();
        return 1;
    }

    try {
        return run_train(opts);
    } catch (const mlcv::Error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
