#ifndef V2M_HPP
#define V2M_HPP

#include <petsc.h>

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <array>
#include <stdexcept>
#include <utility>

namespace V2M {

// Forward declarations
class MeshBatch;
class TemplateMesh;
class FeatureMap;
class FeatureAggregator;
class GraphDecoder;
class ConfigReader;
struct SurfaceMesh;

namespace ML {
class Tensor;
class IndexTensor;
class MeshGraph;
class GraphConvLayer;
}

/**
 * @brief Value stored in unused padded face slots
 *
 * A padded face row is either entirely made of valid vertex indices in
 * [0, V) or entirely made of this sentinel. Mixed rows are rejected.
 */
constexpr int PAD_INDEX = -1;

/// Spatial dimension of mesh vertices and displacement fields
constexpr int SPATIAL_DIM = 3;

// Enumerations
enum class SamplingMode {
    TRILINEAR,
    NEAREST
};

/**
 * @brief Neighbor aggregation rule of the plain graph convolution
 */
enum class GraphConvType {
    BASIC,      // sum over neighbors
    NORM        // sum over neighbors divided by the vertex degree
};

enum class NormType {
    NONE,
    BATCH
};

/**
 * @brief Phases of one decoder run
 */
enum class DecoderState {
    INIT,
    STEP,
    DONE
};

// =============================================================================
// Error taxonomy
// =============================================================================

/**
 * @brief Inconsistent or unsupported configuration, raised at construction
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Tensor or mesh shape that violates a batch/structure/vertex invariant
 */
class ShapeError : public std::runtime_error {
public:
    explicit ShapeError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Degenerate or non-manifold geometry that cannot be processed
 */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& what)
        : std::runtime_error(what) {}
};

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Decoder configuration, validated once at construction
 *
 * With K = graph_channels.size() - 1 decoder steps, unpool_indices and
 * aggregate_indices must both have K entries.
 */
struct GraphDecoderConfig {
    std::vector<int> graph_channels = {64, 64, 64, 64, 64};
    std::vector<int> feature_channels;                  // channels of every feature map
    std::vector<int> unpool_indices = {0, 0, 0, 0};     // 0/1 per step
    std::vector<std::vector<int>> aggregate_indices;    // map indices per step
    SamplingMode aggregation = SamplingMode::TRILINEAR;
    bool propagate_coords = true;
    bool weighted_edges = false;
    bool adaptive_unpool = false;
    int residual_blocks = 3;
    int f2f_hidden_layers = 2;
    GraphConvType graph_conv = GraphConvType::NORM;
    NormType norm = NormType::BATCH;
    unsigned int seed = 0;

    int numSteps() const { return static_cast<int>(graph_channels.size()) - 1; }

    /**
     * @throws ConfigurationError describing the first inconsistency
     */
    void validate() const;
};

/**
 * @brief Where the template mesh comes from
 *
 * An OBJ file when path is set, otherwise one icosphere per structure.
 */
struct TemplateConfig {
    std::string path;
    bool normalize = true;                              // project onto the unit sphere
    int icosphere_level = 2;
    std::vector<std::array<double, 3>> structure_centers = {{0.0, 0.0, 0.0}};
    std::vector<double> structure_radii = {0.5};
};

// Enum <-> string helpers used by the configuration layer
SamplingMode parseSamplingMode(const std::string& name);
GraphConvType parseGraphConvType(const std::string& name);
NormType parseNormType(const std::string& name);

std::string toString(SamplingMode mode);
std::string toString(GraphConvType type);
std::string toString(NormType type);
std::string toString(DecoderState state);

} // namespace V2M

#endif // V2M_HPP
