/// @file src/loss/eigenvalue_reducer.cpp
/// @brief EigenvalueReducer — eigenvalue reduction modes and their gradients.

#include "mlcv/loss.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

#include <cmath>

namespace mlcv::loss {

// ─── ReductionMode ────────────────────────────────────────────────────────────

std::string_view to_string(ReductionMode mode) noexcept {
    switch (mode) {
        case ReductionMode::Sum:               return "sum";
        case ReductionMode::Sum2:              return "sum2";
        case ReductionMode::Gap:               return "gap";
        case ReductionMode::Single:            return "single";
        case ReductionMode::Single2:           return "single2";
        case ReductionMode::ImpliedTimescales: return "its";
    }
    return "sum2";
}

std::optional<ReductionMode> parse_reduction_mode(std::string_view text) noexcept {
    if (text == "sum")     return ReductionMode::Sum;
    if (text == "sum2")    return ReductionMode::Sum2;
    if (text == "gap")     return ReductionMode::Gap;
    if (text == "single")  return ReductionMode::Single;
    if (text == "single2") return ReductionMode::Single2;
    if (text == "its")     return ReductionMode::ImpliedTimescales;
    return std::nullopt;
}

// ─── selection ────────────────────────────────────────────────────────────────

Eigen::Index EigenvalueReducer::selection(const Vector& eigenvalues,
                                          ReductionMode mode,
                                          std::size_t n_eig) {
    const auto available = static_cast<std::size_t>(eigenvalues.size());
    if (n_eig > available) {
        throw ConfigurationError(fmt::format(
            "n_eig = {} but only {} eigenvalues were computed", n_eig, available));
    }
    const std::size_t count = (n_eig == 0) ? available : n_eig;
    if (count == 0) {
        throw ConfigurationError(fmt::format(
            "reduction mode '{}' needs at least one eigenvalue", to_string(mode)));
    }
    if (mode == ReductionMode::Gap && count < 2) {
        throw ConfigurationError(fmt::format(
            "reduction mode 'gap' needs at least 2 eigenvalues, {} selected", count));
    }
    const auto n = static_cast<Eigen::Index>(count);
    if (mode == ReductionMode::ImpliedTimescales) {
        for (Eigen::Index i = 0; i < n; ++i) {
            const double lambda = eigenvalues(i);
            if (!(lambda > 0.0 && lambda < 1.0)) {
                throw NumericalInstabilityError(fmt::format(
                    "reduction mode 'its' needs eigenvalues in (0, 1); "
                    "eigenvalue {} is {}", i + 1, lambda));
            }
        }
    }
    return n;
}

// ─── reduce ───────────────────────────────────────────────────────────────────

double EigenvalueReducer::reduce(const Vector& eigenvalues,
                                 ReductionMode mode,
                                 std::size_t n_eig) {
    const Eigen::Index n = selection(eigenvalues, mode, n_eig);
    const auto selected = eigenvalues.head(n);

    switch (mode) {
        case ReductionMode::Sum:
            return selected.sum();
        case ReductionMode::Sum2:
            return selected.squaredNorm();
        case ReductionMode::Gap:
            return selected(0) - selected(1);
        case ReductionMode::Single:
            return selected(n - 1);
        case ReductionMode::Single2:
            return selected(n - 1) * selected(n - 1);
        case ReductionMode::ImpliedTimescales: {
            double total = 0.0;
            for (Eigen::Index i = 0; i < n; ++i) {
                total += -1.0 / std::log(selected(i));
            }
            return total;
        }
    }
    return 0.0;
}

// ─── gradient ─────────────────────────────────────────────────────────────────

Vector EigenvalueReducer::gradient(const Vector& eigenvalues,
                                   ReductionMode mode,
                                   std::size_t n_eig) {
    const Eigen::Index n = selection(eigenvalues, mode, n_eig);
    Vector grad = Vector::Zero(eigenvalues.size());

    switch (mode) {
        case ReductionMode::Sum:
            grad.head(n).setOnes();
            break;
        case ReductionMode::Sum2:
            grad.head(n) = 2.0 * eigenvalues.head(n);
            break;
        case ReductionMode::Gap:
            grad(0) =  1.0;
            grad(1) = -1.0;
            break;
        case ReductionMode::Single:
            grad(n - 1) = 1.0;
            break;
        case ReductionMode::Single2:
            grad(n - 1) = 2.0 * eigenvalues(n - 1);
            break;
        case ReductionMode::ImpliedTimescales:
            // d/dλ (−1 / ln λ) = 1 / (λ ln² λ)
            for (Eigen::Index i = 0; i < n; ++i) {
                const double lambda = eigenvalues(i);
                const double log_l  = std::log(lambda);
                grad(i) = 1.0 / (lambda * log_l * log_l);
            }
            break;
    }
    return grad;
}

} // namespace mlcv::loss
