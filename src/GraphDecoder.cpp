/**
 * @file GraphDecoder.cpp
 * @brief Decoder configuration checks, layer construction and the step loop
 */

#include "GraphDecoder.hpp"
#include "Unpooling.hpp"
#include "MeshGraph.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace V2M {

using ML::Tensor;
using ML::MeshGraph;
using ML::GraphConvLayer;

namespace {

const char PARAMETER_MAGIC[4] = {'V', '2', 'M', 'P'};

// =============================================================================
// Profiling
// =============================================================================

struct DecoderEvents {
    PetscLogEvent init;
    PetscLogEvent unpool;
    PetscLogEvent aggregate;
    PetscLogEvent graph_conv;
    PetscLogEvent step;
};

const DecoderEvents& decoderEvents() {
    static DecoderEvents events;
    static bool registered = false;
    if (!registered) {
        PetscClassId classid;
        PetscErrorCode ierr = PetscClassIdRegister("V2M Decoder", &classid);
        if (!ierr) ierr = PetscLogEventRegister("V2MDecInit", classid, &events.init);
        if (!ierr) ierr = PetscLogEventRegister("V2MDecUnpool", classid, &events.unpool);
        if (!ierr) ierr = PetscLogEventRegister("V2MDecAggregate", classid, &events.aggregate);
        if (!ierr) ierr = PetscLogEventRegister("V2MDecGraphConv", classid, &events.graph_conv);
        if (!ierr) ierr = PetscLogEventRegister("V2MDecStep", classid, &events.step);
        if (ierr) {
            throw std::runtime_error("GraphDecoder: PETSc log event registration failed "
                                     "(error " + std::to_string(ierr) + ")");
        }
        registered = true;
    }
    return events;
}

// Begins a log event on construction and ends it on destruction
class ScopedLogEvent {
public:
    explicit ScopedLogEvent(PetscLogEvent event) : event_(event) {
        PetscCallVoid(PetscLogEventBegin(event_, 0, 0, 0, 0));
    }
    ~ScopedLogEvent() {
        PetscCallVoid(PetscLogEventEnd(event_, 0, 0, 0, 0));
    }
    ScopedLogEvent(const ScopedLogEvent&) = delete;
    ScopedLogEvent& operator=(const ScopedLogEvent&) = delete;

private:
    PetscLogEvent event_;
};

void logState(const char* phase, int step, const MeshBatch& mesh) {
    PetscCallVoid(PetscInfo(nullptr, "%s %d: N=%d M=%d V=%d F=%d C=%d\n", phase, step,
                            mesh.batchSize(), mesh.numStructures(), mesh.numVertices(),
                            mesh.maxFaces(), mesh.featureDim()));
}

} // namespace

// =============================================================================
// Configuration
// =============================================================================

void GraphDecoderConfig::validate() const {
    if (graph_channels.size() < 2) {
        throw ConfigurationError("graph_channels needs at least 2 entries (K+1 widths "
                                 "for K decoder steps), got " +
                                 std::to_string(graph_channels.size()));
    }
    for (int c : graph_channels) {
        if (c <= 0) {
            throw ConfigurationError("graph_channels must be positive, got " +
                                     std::to_string(c));
        }
    }

    const size_t K = graph_channels.size() - 1;
    if (unpool_indices.size() != K || aggregate_indices.size() != K) {
        throw ConfigurationError("Graph channels, aggregation indices and unpool "
                                 "indices must match the number of decoder steps: " +
                                 std::to_string(K) + " steps, " +
                                 std::to_string(aggregate_indices.size()) +
                                 " aggregation index sets, " +
                                 std::to_string(unpool_indices.size()) + " unpool flags");
    }
    for (int flag : unpool_indices) {
        if (flag != 0 && flag != 1) {
            throw ConfigurationError("unpool_indices must be 0 or 1, got " +
                                     std::to_string(flag));
        }
    }

    if (feature_channels.empty()) {
        throw ConfigurationError("feature_channels must list the channel count of "
                                 "every feature map");
    }
    for (int c : feature_channels) {
        if (c <= 0) {
            throw ConfigurationError("feature_channels must be positive, got " +
                                     std::to_string(c));
        }
    }
    for (size_t i = 0; i < K; ++i) {
        for (int idx : aggregate_indices[i]) {
            if (idx < 0 || idx >= static_cast<int>(feature_channels.size())) {
                throw ConfigurationError("aggregate_indices of step " + std::to_string(i) +
                                         " refers to feature map " + std::to_string(idx) +
                                         " but only " +
                                         std::to_string(feature_channels.size()) +
                                         " maps are configured");
            }
        }
    }

    if (weighted_edges && !propagate_coords) {
        throw ConfigurationError("Edge weighting requires propagation of vertex "
                                 "coordinates to the graph convolutions");
    }
    if (adaptive_unpool) {
        throw ConfigurationError("Adaptive unpooling is not supported: it changes the "
                                 "vertex count per sample and breaks batch-uniform V");
    }
    if (residual_blocks < 1) {
        throw ConfigurationError("residual_blocks must be at least 1, got " +
                                 std::to_string(residual_blocks));
    }
    if (f2f_hidden_layers < 0) {
        throw ConfigurationError("f2f_hidden_layers must be non-negative, got " +
                                 std::to_string(f2f_hidden_layers));
    }
}

// =============================================================================
// DecoderOutput
// =============================================================================

const MeshBatch& DecoderOutput::mesh(int state) const {
    if (state < 0 || state >= numStates()) {
        throw std::out_of_range("DecoderOutput: state " + std::to_string(state) +
                                " out of range");
    }
    return meshes[state];
}

bool DecoderOutput::hasDisplacement(int state) const {
    return state >= 0 && state < static_cast<int>(displacements.size()) &&
           displacements[state].has_value();
}

const Tensor& DecoderOutput::displacement(int state) const {
    if (!hasDisplacement(state)) {
        throw std::out_of_range("DecoderOutput: state " + std::to_string(state) +
                                " has no displacement field");
    }
    return *displacements[state];
}

SurfaceMesh DecoderOutput::surface(int state, int batch_index, int structure) const {
    return mesh(state).surface(batch_index, structure);
}

// =============================================================================
// GraphDecoder
// =============================================================================

GraphDecoder::GraphDecoder(const GraphDecoderConfig& config,
                           const TemplateMesh& mesh_template)
    : config_(config), template_(mesh_template), aggregator_(config.aggregation) {
    config_.validate();
    decoderEvents();

    std::mt19937 gen(config_.seed);
    const std::vector<int>& ch = config_.graph_channels;
    const int add_n = coordChannels();
    const int K = numSteps();

    // Template coordinates -> first latent features
    first_ = ML::makeGraphConv(SPATIAL_DIM, ch[0], config_.weighted_edges,
                               config_.graph_conv, gen);

    for (int i = 0; i < K; ++i) {
        StepLayers layers;
        int in = ch[i] + aggregatedChannels(i) + add_n;
        layers.residual.push_back(std::make_unique<ML::ResidualGraphBlock>(
            in, ch[i + 1], config_.f2f_hidden_layers, config_.weighted_edges,
            config_.graph_conv, config_.norm, gen));
        for (int b = 1; b < config_.residual_blocks; ++b) {
            layers.residual.push_back(std::make_unique<ML::ResidualGraphBlock>(
                ch[i + 1], ch[i + 1], config_.f2f_hidden_layers, false,
                config_.graph_conv, config_.norm, gen));
        }

        layers.f2v = ML::makeGraphConv(ch[i + 1], SPATIAL_DIM, false, config_.graph_conv, gen);

        if (i < K - 1) {
            layers.connector = std::make_unique<ML::SimpleGraphBlock>(
                ch[i + 1] + add_n, ch[i + 1], config_.weighted_edges,
                config_.graph_conv, config_.norm, gen);
        } else {
            layers.connector = std::make_unique<ML::GraphIdentity>(ch[i + 1] + add_n);
        }
        steps_.push_back(std::move(layers));
    }
}

int GraphDecoder::aggregatedChannels(int step) const {
    return FeatureAggregator::outputChannels(config_.feature_channels,
                                             config_.aggregate_indices[step]);
}

int GraphDecoder::outputFeatureWidth() const {
    return steps_.back().connector->outFeatures();
}

void GraphDecoder::checkFeatureMaps(const std::vector<FeatureMap>& maps) const {
    if (maps.size() != config_.feature_channels.size()) {
        throw ShapeError("GraphDecoder: expected " +
                         std::to_string(config_.feature_channels.size()) +
                         " feature maps, got " + std::to_string(maps.size()));
    }
    for (size_t k = 0; k < maps.size(); ++k) {
        if (maps[k].channels() != config_.feature_channels[k]) {
            throw ShapeError("GraphDecoder: feature map " + std::to_string(k) + " has " +
                             std::to_string(maps[k].channels()) + " channels, expected " +
                             std::to_string(config_.feature_channels[k]));
        }
        if (maps[k].batchSize() != maps[0].batchSize()) {
            throw ShapeError("GraphDecoder: feature maps disagree in batch size (" +
                             std::to_string(maps[0].batchSize()) + " vs " +
                             std::to_string(maps[k].batchSize()) + ")");
        }
    }
}

DecoderRun GraphDecoder::begin(const std::vector<FeatureMap>& maps) {
    checkFeatureMaps(maps);
    return DecoderRun(*this, maps);
}

DecoderOutput GraphDecoder::forward(const std::vector<FeatureMap>& maps) {
    DecoderRun run = begin(maps);
    while (!run.finished()) {
        run.advance();
    }
    return run.takeResult();
}

std::vector<Tensor*> GraphDecoder::parameters() {
    std::vector<Tensor*> params = first_->parameters();
    for (auto& layers : steps_) {
        for (auto& block : layers.residual) {
            for (Tensor* p : block->parameters()) params.push_back(p);
        }
        for (Tensor* p : layers.f2v->parameters()) params.push_back(p);
        for (Tensor* p : layers.connector->parameters()) params.push_back(p);
    }
    return params;
}

size_t GraphDecoder::numParameters() {
    size_t total = 0;
    for (Tensor* p : parameters()) total += p->numel();
    return total;
}

void GraphDecoder::saveParameters(const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create parameter file: " + path);
    }
    std::vector<Tensor*> params = parameters();
    int count = static_cast<int>(params.size());
    file.write(PARAMETER_MAGIC, sizeof(PARAMETER_MAGIC));
    file.write(reinterpret_cast<const char*>(&count), sizeof(int));
    for (const Tensor* p : params) {
        p->write(file);
    }
}

void GraphDecoder::loadParameters(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open parameter file: " + path);
    }
    char magic[4] = {0, 0, 0, 0};
    int count = 0;
    file.read(magic, sizeof(magic));
    file.read(reinterpret_cast<char*>(&count), sizeof(int));
    if (!file || !std::equal(magic, magic + 4, PARAMETER_MAGIC)) {
        throw std::runtime_error("Not a V2M parameter file: " + path);
    }

    std::vector<Tensor*> params = parameters();
    if (count != static_cast<int>(params.size())) {
        throw std::runtime_error("Parameter file " + path + " holds " +
                                 std::to_string(count) + " tensors, the decoder has " +
                                 std::to_string(params.size()));
    }

    // Read everything first so a bad file leaves the decoder untouched
    std::vector<Tensor> loaded(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        loaded[i].read(file);
        if (!loaded[i].sameShape(*params[i])) {
            throw std::runtime_error("Parameter " + std::to_string(i) + " in " + path +
                                     " has shape " + loaded[i].shapeString() +
                                     ", expected " + params[i]->shapeString());
        }
    }
    for (size_t i = 0; i < params.size(); ++i) {
        *params[i] = std::move(loaded[i]);
    }
}

void GraphDecoder::summary() {
    std::cout << "Graph Decoder Summary\n";
    std::cout << "=====================\n";
    std::cout << "Template: " << template_.numStructures() << " structure(s), "
              << template_.numVertices() << " vertices\n";
    std::cout << "Steps: " << numSteps() << "\n";
    std::cout << "Graph channels: ";
    for (int c : config_.graph_channels) std::cout << c << " ";
    std::cout << "\nAggregation: " << toString(config_.aggregation) << "\n";
    std::cout << "Graph conv: " << toString(config_.graph_conv)
              << (config_.weighted_edges ? " (weighted edges)" : "") << "\n";
    std::cout << "Norm: " << toString(config_.norm) << "\n";
    std::cout << "Propagate coords: " << (config_.propagate_coords ? "Yes" : "No") << "\n";

    std::cout << std::left;
    std::cout << "  " << std::setw(22) << "init" << first_->name() << " "
              << first_->inFeatures() << " -> " << first_->outFeatures() << "\n";
    for (int i = 0; i < numSteps(); ++i) {
        const StepLayers& layers = steps_[i];
        std::string label = "step " + std::to_string(i) +
                            (config_.unpool_indices[i] ? " (unpool)" : "");
        std::cout << "  " << std::setw(22) << label << layers.residual.size() << " x "
                  << layers.residual.front()->name() << " "
                  << layers.residual.front()->inFeatures() << " -> "
                  << layers.residual.front()->outFeatures() << ", "
                  << layers.f2v->name() << " -> " << layers.f2v->outFeatures() << ", "
                  << layers.connector->name() << " -> "
                  << layers.connector->outFeatures() << "\n";
    }
    std::cout << std::right;
    std::cout << "Parameters: " << numParameters() << "\n";
}

// =============================================================================
// DecoderRun
// =============================================================================

DecoderRun::DecoderRun(GraphDecoder& decoder, const std::vector<FeatureMap>& maps)
    : decoder_(decoder), maps_(maps), batch_size_(maps.front().batchSize()) {}

void DecoderRun::advance() {
    switch (state_) {
        case DecoderState::INIT:
            runInit();
            state_ = DecoderState::STEP;
            break;
        case DecoderState::STEP:
            runStep();
            step_++;
            if (step_ == decoder_.numSteps()) {
                state_ = DecoderState::DONE;
            }
            break;
        case DecoderState::DONE:
            throw std::logic_error("DecoderRun: advance() called after Done");
    }
}

DecoderOutput DecoderRun::takeResult() {
    if (!finished()) {
        throw std::logic_error("DecoderRun: result taken before Done (state " +
                               toString(state_) + ")");
    }
    return std::move(output_);
}

void DecoderRun::runInit() {
    const DecoderEvents& events = decoderEvents();
    ScopedLogEvent timer(events.init);

    MeshBatch mesh = decoder_.template_.replicate(batch_size_);
    MeshGraph graph = MeshGraph::fromMeshBatch(mesh);

    Tensor latent;
    {
        ScopedLogEvent conv_timer(events.graph_conv);
        latent = decoder_.first_->forward(mesh.vertsPacked(), graph);
    }
    mesh.updateFeatures(latent.reshape({mesh.batchSize(), mesh.numStructures(),
                                        mesh.numVertices(), latent.shape[1]}));

    logState("Init", 0, mesh);
    output_.meshes.push_back(mesh);
    output_.displacements.push_back(std::nullopt);
}

void DecoderRun::runStep() {
    const DecoderEvents& events = decoderEvents();
    ScopedLogEvent timer(events.step);

    const GraphDecoderConfig& config = decoder_.config_;
    GraphDecoder::StepLayers& layers = decoder_.steps_[step_];

    // a. topology refinement of the previous mesh
    MeshBatch mesh = output_.meshes.back();
    if (config.unpool_indices[step_] == 1) {
        ScopedLogEvent unpool_timer(events.unpool);
        mesh = Unpooling::uniformUnpool(mesh);
    }

    const int N = mesh.batchSize();
    const int M = mesh.numStructures();
    const int V = mesh.numVertices();
    const int P = mesh.numUnits() * V;

    // b. volumetric features at the current vertex positions
    Tensor sampled;
    {
        ScopedLogEvent agg_timer(events.aggregate);
        sampled = decoder_.aggregator_.aggregate(maps_, config.aggregate_indices[step_],
                                                 mesh.vertsPadded());
    }
    Tensor sampled_packed = sampled.reshape({P, sampled.shape[3]});

    // Edges follow the current topology and are only reused inside this step
    MeshGraph graph = MeshGraph::fromMeshBatch(mesh);

    // c. residual blocks on latent ++ sampled (++ coordinates)
    Tensor latent = mesh.featuresPacked();
    Tensor coords = mesh.vertsPacked();
    Tensor x = config.propagate_coords
                   ? Tensor::concatLast({&latent, &sampled_packed, &coords})
                   : Tensor::concatLast({&latent, &sampled_packed});

    Tensor delta;
    {
        ScopedLogEvent conv_timer(events.graph_conv);
        for (auto& block : layers.residual) {
            x = block->forward(x, graph);
        }

        // d. displacement and vertex update
        delta = layers.f2v->forward(x, graph);
    }
    Tensor delta_padded = delta.reshape({N, M, V, SPATIAL_DIM});
    mesh.moveVerts(delta_padded);

    // e. connector to the next step
    if (config.propagate_coords) {
        Tensor moved = mesh.vertsPacked();
        x = Tensor::concatLast({&x, &moved});
    }
    {
        ScopedLogEvent conv_timer(events.graph_conv);
        x = layers.connector->forward(x, graph);
    }

    // f. emit
    mesh.updateFeatures(x.reshape({N, M, V, x.shape[1]}));
    logState("Step", step_, mesh);
    PetscCallVoid(PetscInfo(nullptr, "Step %d: max |deltaV| = %g\n", step_,
                            delta_padded.maxAbs()));

    output_.meshes.push_back(mesh);
    output_.displacements.push_back(delta_padded);
}

} // namespace V2M
