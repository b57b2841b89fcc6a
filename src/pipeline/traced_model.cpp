/// @file src/pipeline/traced_model.cpp
/// @brief TracedModel evaluation.

#include "mlcv/trace.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

namespace mlcv::cv {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/// Output width of `op` given its input width; throws on a mismatch.
[[nodiscard]] Eigen::Index op_width(const TracedOp& op, Eigen::Index in, std::size_t index) {
    return std::visit(Overloaded{
        [&](const Standardize& s) {
            if (s.mean.size() != in || s.range.size() != in) {
                throw ConfigurationError(fmt::format(
                    "trace op {}: standardize over {} features, input has {}",
                    index, s.mean.size(), in));
            }
            return in;
        },
        [&](const Affine& f) {
            if (f.a.rows() != in || f.b.size() != f.a.cols()) {
                throw ConfigurationError(fmt::format(
                    "trace op {}: affine {}x{} with bias {} on {} inputs",
                    index, f.a.rows(), f.a.cols(), f.b.size(), in));
            }
            return f.a.cols();
        },
        [&](const Activate&) { return in; },
    }, op);
}

} // anonymous namespace

TracedModel::TracedModel(Eigen::Index in_features, std::vector<TracedOp> ops)
    : in_features_(in_features), out_features_(in_features), ops_(std::move(ops)) {
    for (std::size_t i = 0; i < ops_.size(); ++i) {
        out_features_ = op_width(ops_[i], out_features_, i);
    }
}

Matrix TracedModel::forward(const Matrix& x) const {
    if (x.cols() != in_features_) {
        throw ShapeMismatchError(fmt::format(
            "traced model expects {} input features, got a {}x{} batch",
            in_features_, x.rows(), x.cols()));
    }
    Matrix h = x;
    for (const auto& op : ops_) {
        h = std::visit(Overloaded{
            [&](const Standardize& s) -> Matrix {
                return ((h.rowwise() - s.mean).array().rowwise() / s.range.array()).matrix();
            },
            [&](const Affine& f) -> Matrix {
                return (h * f.a).rowwise() + f.b;
            },
            [&](const Activate& act) -> Matrix {
                return blocks::apply_activation(h, act.activation);
            },
        }, op);
    }
    return h;
}

std::string TracedModel::to_string() const {
    std::string out;
    Eigen::Index width = in_features_;
    for (const auto& op : ops_) {
        std::visit(Overloaded{
            [&](const Standardize&) {
                out += fmt::format("standardize {}\n", width);
            },
            [&](const Affine& f) {
                out += fmt::format("affine {} -> {}\n", f.a.rows(), f.a.cols());
                width = f.a.cols();
            },
            [&](const Activate& act) {
                out += fmt::format("activate {}\n", blocks::to_string(act.activation));
            },
        }, op);
    }
    return out;
}

} // namespace mlcv::cv
