/**
 * @file GraphConv.hpp
 * @brief Graph convolutions on mesh vertices
 *
 * Every operator maps packed vertex features [P, C_in] to [P, C_out] over a
 * MeshGraph. The decoder holds them through the GraphConvLayer interface and
 * selects the concrete variant from its configuration:
 *
 * - GraphConv: y_i = W0 x_i + b + W1 agg_{j in N(i)} x_j, where agg is the
 *   neighbor sum (BASIC) or the neighbor mean (NORM)
 * - EdgeWeightedGraphConv: neighbor sum weighted by normalized inverse
 *   distance; positions are the trailing three input channels
 * - ResidualGraphBlock: stacked convolutions with a skip connection
 * - SimpleGraphBlock: convolution, normalization and ReLU
 * - GraphIdentity: passes features through unchanged
 */

#ifndef V2M_GRAPH_CONV_HPP
#define V2M_GRAPH_CONV_HPP

#include "V2M.hpp"
#include "Tensor.hpp"
#include "MeshGraph.hpp"
#include <vector>
#include <memory>
#include <random>
#include <string>

namespace V2M {
namespace ML {

/**
 * @brief Fully connected layer applied row-wise
 */
class Linear {
public:
    Linear(int in_features, int out_features, bool bias, std::mt19937& gen);

    Tensor forward(const Tensor& x) const;

    int inFeatures() const { return weight.shape[1]; }
    int outFeatures() const { return weight.shape[0]; }
    std::vector<Tensor*> parameters();

    Tensor weight;      // [out, in]
    Tensor bias_vec;    // [out]
    bool has_bias;
};

/**
 * @brief Batch normalization over packed vertices (inference statistics)
 */
class BatchNorm1d {
public:
    BatchNorm1d(int num_features, double eps = 1e-5);

    Tensor forward(const Tensor& x) const;
    std::vector<Tensor*> parameters();

    Tensor gamma;
    Tensor beta;
    Tensor running_mean;
    Tensor running_var;

private:
    int num_features_;
    double eps_;
};

/**
 * @brief Abstract graph convolution
 */
class GraphConvLayer {
public:
    virtual ~GraphConvLayer() = default;

    /**
     * @param x     packed vertex features [P, inFeatures()]
     * @param graph connectivity over the same P vertices
     * @return      [P, outFeatures()]
     */
    virtual Tensor forward(const Tensor& x, const MeshGraph& graph) = 0;

    virtual int inFeatures() const = 0;
    virtual int outFeatures() const = 0;
    virtual std::vector<Tensor*> parameters() = 0;
    virtual std::string name() const = 0;

    size_t numParameters();

protected:
    void checkInput(const Tensor& x, const MeshGraph& graph) const;
};

class GraphConv : public GraphConvLayer {
public:
    GraphConv(int in_features, int out_features, GraphConvType type, std::mt19937& gen);

    Tensor forward(const Tensor& x, const MeshGraph& graph) override;

    int inFeatures() const override { return self_.inFeatures(); }
    int outFeatures() const override { return self_.outFeatures(); }
    std::vector<Tensor*> parameters() override;
    std::string name() const override;

private:
    GraphConvType type_;
    Linear self_;
    Linear neighbor_;
};

class EdgeWeightedGraphConv : public GraphConvLayer {
public:
    /**
     * @throws ConfigurationError if in_features < 3 (no coordinates to weight by)
     */
    EdgeWeightedGraphConv(int in_features, int out_features, std::mt19937& gen,
                          double eps = 1e-8);

    Tensor forward(const Tensor& x, const MeshGraph& graph) override;

    int inFeatures() const override { return self_.inFeatures(); }
    int outFeatures() const override { return self_.outFeatures(); }
    std::vector<Tensor*> parameters() override;
    std::string name() const override { return "EdgeWeightedGraphConv"; }

    /**
     * @brief Weight of every directed edge of the graph, in edge order
     */
    std::vector<double> edgeWeights(const Tensor& x, const MeshGraph& graph) const;

private:
    Linear self_;
    Linear neighbor_;
    double eps_;
};

class ResidualGraphBlock : public GraphConvLayer {
public:
    /**
     * @param hidden_layers number of out->out convolutions after the first one
     * @param weighted      first convolution weights edges by distance
     */
    ResidualGraphBlock(int in_features, int out_features, int hidden_layers,
                       bool weighted, GraphConvType type, NormType norm,
                       std::mt19937& gen);

    Tensor forward(const Tensor& x, const MeshGraph& graph) override;

    int inFeatures() const override { return in_features_; }
    int outFeatures() const override { return out_features_; }
    std::vector<Tensor*> parameters() override;
    std::string name() const override { return "ResidualGraphBlock"; }

private:
    int in_features_;
    int out_features_;
    std::vector<std::unique_ptr<GraphConvLayer>> convs_;
    std::vector<BatchNorm1d> norms_;
    std::unique_ptr<Linear> projection_;   // skip path when in != out
};

class SimpleGraphBlock : public GraphConvLayer {
public:
    SimpleGraphBlock(int in_features, int out_features, bool weighted,
                     GraphConvType type, NormType norm, std::mt19937& gen);

    Tensor forward(const Tensor& x, const MeshGraph& graph) override;

    int inFeatures() const override { return conv_->inFeatures(); }
    int outFeatures() const override { return conv_->outFeatures(); }
    std::vector<Tensor*> parameters() override;
    std::string name() const override { return "SimpleGraphBlock"; }

private:
    std::unique_ptr<GraphConvLayer> conv_;
    std::unique_ptr<BatchNorm1d> norm_;
};

class GraphIdentity : public GraphConvLayer {
public:
    explicit GraphIdentity(int features) : features_(features) {}

    Tensor forward(const Tensor& x, const MeshGraph& graph) override;

    int inFeatures() const override { return features_; }
    int outFeatures() const override { return features_; }
    std::vector<Tensor*> parameters() override { return {}; }
    std::string name() const override { return "GraphIdentity"; }

private:
    int features_;
};

/**
 * @brief Plain or edge-weighted convolution
 */
std::unique_ptr<GraphConvLayer> makeGraphConv(int in_features, int out_features,
                                              bool weighted, GraphConvType type,
                                              std::mt19937& gen);

} // namespace ML
} // namespace V2M

#endif // V2M_GRAPH_CONV_HPP
