/**
 * @file GraphDecoder.hpp
 * @brief Iterative mesh-deformation decoder
 *
 * The decoder deforms a template mesh in K steps, guided by volumetric
 * feature maps. A run moves through the states
 *
 *   Init -> Step[0] -> ... -> Step[K-1] -> Done
 *
 * strictly forward. Init replicates the template over the batch and derives
 * the first latent features from the template coordinates. Every step
 * optionally subdivides the previous mesh, samples the selected feature maps
 * at the current vertices, runs residual graph-conv blocks, predicts a
 * displacement per vertex, moves the vertices and prepares the latent
 * features of the next step.
 *
 * Vertex coordinates are kept in the MeshBatch vertex tensor; the latent
 * feature tensor never contains them. With coordinate propagation enabled
 * they are appended as the trailing three channels wherever a graph
 * convolution consumes them.
 *
 * Every phase is registered as a PETSc log event (see -log_view), and step
 * diagnostics are reported through PetscInfo (see -info).
 */

#ifndef V2M_GRAPH_DECODER_HPP
#define V2M_GRAPH_DECODER_HPP

#include "V2M.hpp"
#include "Tensor.hpp"
#include "MeshBatch.hpp"
#include "TemplateMesh.hpp"
#include "FeatureAggregation.hpp"
#include "GraphConv.hpp"
#include <vector>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace V2M {

/**
 * @brief Ordered per-step result of a decoder run
 *
 * meshes[0] is the template state after Init; meshes[i+1] is the output of
 * Step[i]. displacements has the same length and is empty at index 0.
 */
struct DecoderOutput {
    std::vector<MeshBatch> meshes;
    std::vector<std::optional<ML::Tensor>> displacements;   // [N, M, V, 3]

    int numStates() const { return static_cast<int>(meshes.size()); }
    const MeshBatch& mesh(int state) const;
    bool hasDisplacement(int state) const;

    /**
     * @throws std::out_of_range if the state has no displacement field
     */
    const ML::Tensor& displacement(int state) const;

    /**
     * @brief One structure of one batch sample of one state as a stand-alone
     *        surface, ready for MeshIO::writeObj
     */
    SurfaceMesh surface(int state, int batch_index, int structure) const;
};

class GraphDecoder;

/**
 * @brief One decoder invocation, advanced one state at a time
 *
 * A run refers to its decoder, which must outlive it. Runs never share
 * state with each other or with the template.
 */
class DecoderRun {
public:
    DecoderState state() const { return state_; }

    /**
     * @brief Index of the next step to execute, K once finished
     */
    int currentStep() const { return step_; }

    /**
     * @brief Perform the pending transition
     *
     * @throws std::logic_error when called after Done
     */
    void advance();

    bool finished() const { return state_ == DecoderState::DONE; }

    /**
     * @brief States produced so far (all of them once finished)
     */
    const DecoderOutput& result() const { return output_; }

    DecoderOutput takeResult();

private:
    friend class GraphDecoder;
    DecoderRun(GraphDecoder& decoder, const std::vector<FeatureMap>& maps);

    void runInit();
    void runStep();

    GraphDecoder& decoder_;
    std::vector<FeatureMap> maps_;
    int batch_size_;
    DecoderState state_ = DecoderState::INIT;
    int step_ = 0;
    DecoderOutput output_;
};

class GraphDecoder {
public:
    /**
     * @brief Build all layers for the configured steps
     *
     * @throws ConfigurationError for any inconsistency in the configuration
     */
    GraphDecoder(const GraphDecoderConfig& config, const TemplateMesh& mesh_template);

    const GraphDecoderConfig& config() const { return config_; }
    const TemplateMesh& meshTemplate() const { return template_; }
    int numSteps() const { return config_.numSteps(); }

    /**
     * @brief Width of the latent features emitted by the last step
     */
    int outputFeatureWidth() const;

    /**
     * @brief Start a run on a batch of feature maps
     *
     * @throws ShapeError if the maps disagree with the configured channel
     *         counts or with each other in batch size
     */
    DecoderRun begin(const std::vector<FeatureMap>& maps);

    /**
     * @brief Run all states to Done
     */
    DecoderOutput forward(const std::vector<FeatureMap>& maps);

    // Parameters
    std::vector<ML::Tensor*> parameters();
    size_t numParameters();
    void saveParameters(const std::string& path);
    void loadParameters(const std::string& path);
    void summary();

private:
    friend class DecoderRun;

    struct StepLayers {
        std::vector<std::unique_ptr<ML::GraphConvLayer>> residual;
        std::unique_ptr<ML::GraphConvLayer> f2v;
        std::unique_ptr<ML::GraphConvLayer> connector;
    };

    void checkFeatureMaps(const std::vector<FeatureMap>& maps) const;
    int aggregatedChannels(int step) const;
    int coordChannels() const { return config_.propagate_coords ? SPATIAL_DIM : 0; }

    GraphDecoderConfig config_;
    TemplateMesh template_;
    FeatureAggregator aggregator_;
    std::unique_ptr<ML::GraphConvLayer> first_;
    std::vector<StepLayers> steps_;
};

} // namespace V2M

#endif // V2M_GRAPH_DECODER_HPP
