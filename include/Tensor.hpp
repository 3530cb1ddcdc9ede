/**
 * @file Tensor.hpp
 * @brief Dense row-major tensors used by the mesh decoder
 *
 * Vertex coordinates, latent features, displacement fields and volumetric
 * feature maps are all stored as Tensor (double). Face connectivity is stored
 * as IndexTensor (int) so the padding sentinel can be represented exactly.
 *
 * Layout conventions:
 * - padded vertex data:   [N, M, V, C]
 * - packed vertex data:   [N*M*V, C]   (same memory as the padded view)
 * - padded faces:         [N, M, F, D] with D = 3 (triangles) or 2 (edges)
 * - volumetric features:  [N, C, X, Y, Z]
 */

#ifndef V2M_TENSOR_HPP
#define V2M_TENSOR_HPP

#include "V2M.hpp"
#include <vector>
#include <string>
#include <random>
#include <iosfwd>

namespace V2M {
namespace ML {

/**
 * @brief Simple tensor class for decoder operations
 */
class Tensor {
public:
    std::vector<double> data;
    std::vector<int> shape;

    Tensor() = default;
    explicit Tensor(const std::vector<int>& shape);
    Tensor(const std::vector<int>& shape, double value);
    Tensor(const std::vector<int>& shape, const std::vector<double>& data);

    // Basic operations
    size_t numel() const;
    int dim() const { return static_cast<int>(shape.size()); }

    // Element access
    double& operator()(int i);
    double& operator()(int i, int j);
    double& operator()(int i, int j, int k);
    double& operator()(int i, int j, int k, int l);
    double& operator()(int i, int j, int k, int l, int m);

    const double& operator()(int i) const;
    const double& operator()(int i, int j) const;
    const double& operator()(int i, int j, int k) const;
    const double& operator()(int i, int j, int k, int l) const;
    const double& operator()(int i, int j, int k, int l, int m) const;

    // Reshape (element count must be preserved)
    Tensor reshape(const std::vector<int>& new_shape) const;

    /**
     * @brief Copy of channels [begin, end) of the last axis
     */
    Tensor sliceLast(int begin, int end) const;

    /**
     * @brief Concatenate tensors along their last axis
     *
     * All leading dimensions must agree. Default-constructed tensors (no
     * shape) are skipped so optional blocks can be passed unconditionally.
     */
    static Tensor concatLast(const std::vector<const Tensor*>& parts);

    // Math operations
    Tensor operator+(const Tensor& other) const;
    Tensor operator-(const Tensor& other) const;
    Tensor& operator+=(const Tensor& other);

    bool sameShape(const Tensor& other) const { return shape == other.shape; }

    // Reductions
    double sum() const;
    double max() const;
    double min() const;
    double maxAbs() const;

    // Initialization
    void fill(double value);
    void randn(std::mt19937& gen, double mean = 0.0, double std = 1.0);
    void kaiming_init(std::mt19937& gen);

    // Serialization
    void write(std::ostream& out) const;
    void read(std::istream& in);
    void save(const std::string& path) const;
    void load(const std::string& path);

    std::string shapeString() const;
};

/**
 * @brief Integer tensor for face connectivity
 */
class IndexTensor {
public:
    std::vector<int> data;
    std::vector<int> shape;

    IndexTensor() = default;
    explicit IndexTensor(const std::vector<int>& shape, int value = 0);
    IndexTensor(const std::vector<int>& shape, const std::vector<int>& data);

    size_t numel() const;
    int dim() const { return static_cast<int>(shape.size()); }

    int& operator()(int i, int j);
    int& operator()(int i, int j, int k, int l);
    const int& operator()(int i, int j) const;
    const int& operator()(int i, int j, int k, int l) const;

    bool operator==(const IndexTensor& other) const {
        return shape == other.shape && data == other.data;
    }

    std::string shapeString() const;
};

// =============================================================================
// Activation Functions
// =============================================================================

namespace Activation {

Tensor relu(const Tensor& x);

} // namespace Activation

std::string shapeToString(const std::vector<int>& shape);

} // namespace ML
} // namespace V2M

#endif // V2M_TENSOR_HPP
