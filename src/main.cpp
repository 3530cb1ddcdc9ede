#include "V2M.hpp"
#include "ConfigReader.hpp"
#include "TemplateMesh.hpp"
#include "GraphDecoder.hpp"
#include "MeshIO.hpp"
#include <petsc.h>
#include <iostream>
#include <sstream>
#include <string>

static char help[] = "v2m_decode - Template mesh deformation from volumetric features\n"
                    "Usage: v2m_decode [options]\n\n"
                    "Options:\n"
                    "  -c <file>              Configuration file (.config)\n"
                    "  -features <f1,f2,...>  Feature map tensor files [N, C, X, Y, Z], in map order\n"
                    "  -weights <file>        Decoder parameter file\n"
                    "  -o <prefix>            Output prefix (one OBJ per decoder state)\n"
                    "  -batch_index <n>       Batch sample to export (default 0)\n"
                    "  -info                  Per-step diagnostics\n"
                    "  -log_view              Timing of the decoder phases\n\n"
                    "Examples:\n"
                    "  v2m_decode -c config/default.config -features f0.bin,f1.bin,f2.bin -o out/mesh\n\n"
                    "  # Generate template configuration\n"
                    "  v2m_decode -generate_config my_config.config\n\n";

static std::vector<std::string> splitList(const std::string& list) {
    std::vector<std::string> items;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                V2M::ConfigReader::generateTemplate(generate_config);
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
            }
            ierr = PetscFinalize();
            return 0;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char feature_files[4096] = "";
        char weights_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "output/mesh";
        PetscInt batch_index = 0;
        PetscBool config_provided = PETSC_FALSE;
        PetscBool features_provided = PETSC_FALSE;
        PetscBool weights_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-features", feature_files,
                                     sizeof(feature_files), &features_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-weights", weights_file,
                                     sizeof(weights_file), &weights_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), nullptr); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-batch_index", &batch_index,
                                  nullptr); CHKERRQ(ierr);

        if (!config_provided || !features_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) and feature maps (-features) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: v2m_decode -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  V2M - Volume to Mesh Decoder\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "Config file:   %s\n", config_file);
            PetscPrintf(comm, "Feature maps:  %s\n", feature_files);
            PetscPrintf(comm, "Weights:       %s\n", weights_provided ? weights_file : "(seeded init)");
            PetscPrintf(comm, "Output prefix: %s\n", output_prefix);
            PetscPrintf(comm, "\n");
        }

        try {
            V2M::ConfigReader reader;
            if (!reader.loadFile(config_file)) {
                throw std::runtime_error(std::string("cannot read ") + config_file);
            }

            V2M::TemplateConfig template_config;
            V2M::GraphDecoderConfig decoder_config;
            reader.parseTemplateConfig(template_config);
            if (!reader.parseDecoderConfig(decoder_config)) {
                throw V2M::ConfigurationError("missing [decoder] section in " +
                                              std::string(config_file));
            }

            V2M::TemplateMesh mesh_template = V2M::TemplateMesh::fromConfig(template_config);
            V2M::GraphDecoder decoder(decoder_config, mesh_template);
            if (weights_provided) {
                decoder.loadParameters(weights_file);
            }
            if (rank == 0) {
                decoder.summary();
            }

            std::vector<V2M::FeatureMap> maps;
            for (const auto& path : splitList(feature_files)) {
                V2M::ML::Tensor data;
                data.load(path);
                maps.emplace_back(data);
            }

            PetscLogDouble start_time, end_time;
            ierr = PetscTime(&start_time); CHKERRQ(ierr);
            V2M::DecoderOutput output = decoder.forward(maps);
            ierr = PetscTime(&end_time); CHKERRQ(ierr);

            if (rank == 0) {
                PetscPrintf(comm, "\nDecoding completed in %.3f seconds\n", end_time - start_time);
                for (int s = 0; s < output.numStates(); ++s) {
                    const V2M::MeshBatch& mesh = output.mesh(s);
                    std::vector<V2M::SurfaceMesh> surfaces;
                    for (int m = 0; m < mesh.numStructures(); ++m) {
                        surfaces.push_back(output.surface(s, static_cast<int>(batch_index), m));
                    }
                    std::string path = std::string(output_prefix) + "_state" +
                                       std::to_string(s) + ".obj";
                    if (!V2M::MeshIO::writeObj(path, surfaces)) {
                        throw std::runtime_error("cannot write " + path);
                    }
                    PetscPrintf(comm, "  state %d: %d vertices -> %s\n", s,
                                mesh.numVertices(), path.c_str());
                }
                PetscPrintf(comm, "============================================================\n");
            }

        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return 0;
}
