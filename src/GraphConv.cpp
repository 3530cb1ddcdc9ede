/**
 * @file GraphConv.cpp
 * @brief Graph convolution variants used by the mesh decoder
 */

#include "GraphConv.hpp"
#include <cmath>
#include <algorithm>

namespace V2M {
namespace ML {

// =============================================================================
// Linear
// =============================================================================

Linear::Linear(int in_features, int out_features, bool bias, std::mt19937& gen)
    : has_bias(bias) {
    if (in_features <= 0 || out_features <= 0) {
        throw ConfigurationError("Linear: feature sizes must be positive, got " +
                                 std::to_string(in_features) + " -> " +
                                 std::to_string(out_features));
    }
    weight = Tensor({out_features, in_features});
    weight.kaiming_init(gen);
    if (has_bias) {
        bias_vec = Tensor({out_features}, 0.0);
    }
}

Tensor Linear::forward(const Tensor& x) const {
    int in_f = weight.shape[1];
    int out_f = weight.shape[0];
    if (x.dim() != 2 || x.shape[1] != in_f) {
        throw ShapeError("Linear: expected [P, " + std::to_string(in_f) + "], got " +
                         x.shapeString());
    }
    int rows = x.shape[0];

    Tensor output({rows, out_f});
    for (int b = 0; b < rows; ++b) {
        const double* row = &x.data[static_cast<size_t>(b) * in_f];
        for (int o = 0; o < out_f; ++o) {
            double sum = has_bias ? bias_vec(o) : 0.0;
            for (int i = 0; i < in_f; ++i) {
                sum += weight(o, i) * row[i];
            }
            output(b, o) = sum;
        }
    }
    return output;
}

std::vector<Tensor*> Linear::parameters() {
    std::vector<Tensor*> params = {&weight};
    if (has_bias) params.push_back(&bias_vec);
    return params;
}

// =============================================================================
// Batch Normalization
// =============================================================================

BatchNorm1d::BatchNorm1d(int num_features, double eps)
    : num_features_(num_features), eps_(eps) {
    gamma = Tensor({num_features}, 1.0);
    beta = Tensor({num_features}, 0.0);
    running_mean = Tensor({num_features}, 0.0);
    running_var = Tensor({num_features}, 1.0);
}

Tensor BatchNorm1d::forward(const Tensor& x) const {
    if (x.dim() != 2 || x.shape[1] != num_features_) {
        throw ShapeError("BatchNorm1d: expected [P, " + std::to_string(num_features_) +
                         "], got " + x.shapeString());
    }
    Tensor output(x.shape);
    int rows = x.shape[0];
    for (int f = 0; f < num_features_; ++f) {
        double inv_std = 1.0 / std::sqrt(running_var(f) + eps_);
        for (int b = 0; b < rows; ++b) {
            output(b, f) = gamma(f) * (x(b, f) - running_mean(f)) * inv_std + beta(f);
        }
    }
    return output;
}

std::vector<Tensor*> BatchNorm1d::parameters() {
    return {&gamma, &beta, &running_mean, &running_var};
}

// =============================================================================
// GraphConvLayer
// =============================================================================

size_t GraphConvLayer::numParameters() {
    size_t total = 0;
    for (Tensor* p : parameters()) total += p->numel();
    return total;
}

void GraphConvLayer::checkInput(const Tensor& x, const MeshGraph& graph) const {
    if (x.dim() != 2 || x.shape[1] != inFeatures() || x.shape[0] != graph.numNodes()) {
        throw ShapeError(name() + ": expected [" + std::to_string(graph.numNodes()) +
                         ", " + std::to_string(inFeatures()) + "], got " +
                         x.shapeString());
    }
}

// =============================================================================
// GraphConv
// =============================================================================

GraphConv::GraphConv(int in_features, int out_features, GraphConvType type,
                     std::mt19937& gen)
    : type_(type),
      self_(in_features, out_features, true, gen),
      neighbor_(in_features, out_features, false, gen) {}

Tensor GraphConv::forward(const Tensor& x, const MeshGraph& graph) {
    checkInput(x, graph);
    const int P = x.shape[0];
    const int C = x.shape[1];

    Tensor aggregated({P, C}, 0.0);
    for (const auto& e : graph.edges()) {
        for (int c = 0; c < C; ++c) {
            aggregated(e.src, c) += x(e.dst, c);
        }
    }
    if (type_ == GraphConvType::NORM) {
        for (int p = 0; p < P; ++p) {
            int deg = graph.degree(p);
            if (deg == 0) continue;
            for (int c = 0; c < C; ++c) aggregated(p, c) /= deg;
        }
    }

    Tensor output = self_.forward(x);
    output += neighbor_.forward(aggregated);
    return output;
}

std::vector<Tensor*> GraphConv::parameters() {
    std::vector<Tensor*> params = self_.parameters();
    for (Tensor* p : neighbor_.parameters()) params.push_back(p);
    return params;
}

std::string GraphConv::name() const {
    return type_ == GraphConvType::NORM ? "GraphConvNorm" : "GraphConv";
}

// =============================================================================
// EdgeWeightedGraphConv
// =============================================================================

EdgeWeightedGraphConv::EdgeWeightedGraphConv(int in_features, int out_features,
                                             std::mt19937& gen, double eps)
    : self_(in_features, out_features, true, gen),
      neighbor_(in_features, out_features, false, gen),
      eps_(eps) {
    if (in_features < SPATIAL_DIM) {
        throw ConfigurationError("EdgeWeightedGraphConv: needs vertex coordinates as the "
                                 "trailing 3 input channels, got only " +
                                 std::to_string(in_features) + " channels");
    }
}

std::vector<double> EdgeWeightedGraphConv::edgeWeights(const Tensor& x,
                                                       const MeshGraph& graph) const {
    const int C = x.shape[1];
    const int first = C - SPATIAL_DIM;
    const auto& edges = graph.edges();

    std::vector<double> weights(edges.size());
    std::vector<double> totals(graph.numNodes(), 0.0);
    for (size_t e = 0; e < edges.size(); ++e) {
        double d2 = 0.0;
        for (int a = 0; a < SPATIAL_DIM; ++a) {
            double diff = x(edges[e].src, first + a) - x(edges[e].dst, first + a);
            d2 += diff * diff;
        }
        weights[e] = 1.0 / (std::sqrt(d2) + eps_);
        totals[edges[e].src] += weights[e];
    }
    for (size_t e = 0; e < edges.size(); ++e) {
        weights[e] /= totals[edges[e].src];
    }
    return weights;
}

Tensor EdgeWeightedGraphConv::forward(const Tensor& x, const MeshGraph& graph) {
    checkInput(x, graph);
    const int P = x.shape[0];
    const int C = x.shape[1];
    std::vector<double> weights = edgeWeights(x, graph);

    Tensor aggregated({P, C}, 0.0);
    const auto& edges = graph.edges();
    for (size_t e = 0; e < edges.size(); ++e) {
        for (int c = 0; c < C; ++c) {
            aggregated(edges[e].src, c) += weights[e] * x(edges[e].dst, c);
        }
    }

    Tensor output = self_.forward(x);
    output += neighbor_.forward(aggregated);
    return output;
}

std::vector<Tensor*> EdgeWeightedGraphConv::parameters() {
    std::vector<Tensor*> params = self_.parameters();
    for (Tensor* p : neighbor_.parameters()) params.push_back(p);
    return params;
}

// =============================================================================
// ResidualGraphBlock
// =============================================================================

ResidualGraphBlock::ResidualGraphBlock(int in_features, int out_features,
                                       int hidden_layers, bool weighted,
                                       GraphConvType type, NormType norm,
                                       std::mt19937& gen)
    : in_features_(in_features), out_features_(out_features) {
    if (hidden_layers < 0) {
        throw ConfigurationError("ResidualGraphBlock: negative hidden layer count");
    }
    convs_.push_back(makeGraphConv(in_features, out_features, weighted, type, gen));
    for (int i = 0; i < hidden_layers; ++i) {
        convs_.push_back(makeGraphConv(out_features, out_features, false, type, gen));
    }
    if (norm == NormType::BATCH) {
        norms_.assign(convs_.size(), BatchNorm1d(out_features));
    }
    if (in_features != out_features) {
        projection_ = std::make_unique<Linear>(in_features, out_features, false, gen);
    }
}

Tensor ResidualGraphBlock::forward(const Tensor& x, const MeshGraph& graph) {
    checkInput(x, graph);

    Tensor h = x;
    for (size_t i = 0; i < convs_.size(); ++i) {
        h = convs_[i]->forward(h, graph);
        if (!norms_.empty()) h = norms_[i].forward(h);
        // The last convolution is activated after the skip is added
        if (i + 1 < convs_.size()) h = Activation::relu(h);
    }

    if (projection_) {
        h += projection_->forward(x);
    } else {
        h += x;
    }
    return Activation::relu(h);
}

std::vector<Tensor*> ResidualGraphBlock::parameters() {
    std::vector<Tensor*> params;
    for (auto& conv : convs_) {
        for (Tensor* p : conv->parameters()) params.push_back(p);
    }
    for (auto& norm : norms_) {
        for (Tensor* p : norm.parameters()) params.push_back(p);
    }
    if (projection_) {
        for (Tensor* p : projection_->parameters()) params.push_back(p);
    }
    return params;
}

// =============================================================================
// SimpleGraphBlock
// =============================================================================

SimpleGraphBlock::SimpleGraphBlock(int in_features, int out_features, bool weighted,
                                   GraphConvType type, NormType norm, std::mt19937& gen)
    : conv_(makeGraphConv(in_features, out_features, weighted, type, gen)) {
    if (norm == NormType::BATCH) {
        norm_ = std::make_unique<BatchNorm1d>(out_features);
    }
}

Tensor SimpleGraphBlock::forward(const Tensor& x, const MeshGraph& graph) {
    Tensor h = conv_->forward(x, graph);
    if (norm_) h = norm_->forward(h);
    return Activation::relu(h);
}

std::vector<Tensor*> SimpleGraphBlock::parameters() {
    std::vector<Tensor*> params = conv_->parameters();
    if (norm_) {
        for (Tensor* p : norm_->parameters()) params.push_back(p);
    }
    return params;
}

// =============================================================================
// GraphIdentity
// =============================================================================

Tensor GraphIdentity::forward(const Tensor& x, const MeshGraph& graph) {
    checkInput(x, graph);
    return x;
}

std::unique_ptr<GraphConvLayer> makeGraphConv(int in_features, int out_features,
                                              bool weighted, GraphConvType type,
                                              std::mt19937& gen) {
    if (weighted) {
        return std::make_unique<EdgeWeightedGraphConv>(in_features, out_features, gen);
    }
    return std::make_unique<GraphConv>(in_features, out_features, type, gen);
}

} // namespace ML
} // namespace V2M
