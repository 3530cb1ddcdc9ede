#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace V2M {

namespace {

std::string lower(std::string val) {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return val;
}

} // namespace

// =============================================================================
// Enum helpers
// =============================================================================

SamplingMode parseSamplingMode(const std::string& name) {
    std::string val = lower(name);
    if (val == "trilinear") return SamplingMode::TRILINEAR;
    if (val == "nearest") return SamplingMode::NEAREST;
    throw ConfigurationError("Unknown aggregation mode '" + name +
                             "' (expected trilinear or nearest)");
}

GraphConvType parseGraphConvType(const std::string& name) {
    std::string val = lower(name);
    if (val == "basic") return GraphConvType::BASIC;
    if (val == "norm") return GraphConvType::NORM;
    throw ConfigurationError("Unknown graph convolution '" + name +
                             "' (expected basic or norm)");
}

NormType parseNormType(const std::string& name) {
    std::string val = lower(name);
    if (val == "none") return NormType::NONE;
    if (val == "batch") return NormType::BATCH;
    throw ConfigurationError("Unknown normalization '" + name +
                             "' (expected none or batch)");
}

std::string toString(SamplingMode mode) {
    return mode == SamplingMode::NEAREST ? "nearest" : "trilinear";
}

std::string toString(GraphConvType type) {
    return type == GraphConvType::NORM ? "norm" : "basic";
}

std::string toString(NormType type) {
    return type == NormType::BATCH ? "batch" : "none";
}

std::string toString(DecoderState state) {
    switch (state) {
        case DecoderState::INIT: return "Init";
        case DecoderState::STEP: return "Step";
        case DecoderState::DONE: return "Done";
    }
    return "Unknown";
}

// =============================================================================
// ConfigReader
// =============================================================================

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream in(content);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

int ConfigReader::parseInt(const std::string& token, const std::string& key) const {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(token, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != token.size()) {
        throw ConfigurationError("Cannot parse '" + token + "' as integer for key '" +
                                 key + "'");
    }
    return value;
}

double ConfigReader::parseDouble(const std::string& token, const std::string& key) const {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != token.size()) {
        throw ConfigurationError("Cannot parse '" + token + "' as number for key '" +
                                 key + "'");
    }
    return value;
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;
    return parseInt(val, key);
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;
    return parseDouble(val, key);
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    val = lower(val);
    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    throw ConfigurationError("Cannot parse '" + val + "' as boolean for key '" + key + "'");
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    for (const auto& token : split(getString(section, key), ',')) {
        result.push_back(parseDouble(token, key));
    }
    return result;
}

std::vector<int> ConfigReader::getIntArray(const std::string& section,
                                           const std::string& key) const {
    std::vector<int> result;
    for (const auto& token : split(getString(section, key), ',')) {
        result.push_back(parseInt(token, key));
    }
    return result;
}

std::vector<std::vector<int>> ConfigReader::getIntArrayList(const std::string& section,
                                                            const std::string& key) const {
    std::vector<std::vector<int>> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    // Empty groups are kept: a step may sample no feature map
    std::stringstream ss(val);
    std::string group;
    while (std::getline(ss, group, ';')) {
        std::vector<int> values;
        for (const auto& token : split(group, ',')) {
            values.push_back(parseInt(token, key));
        }
        result.push_back(values);
    }
    return result;
}

std::vector<std::vector<double>> ConfigReader::getDoubleArrayList(
    const std::string& section, const std::string& key) const {
    std::vector<std::vector<double>> result;
    for (const auto& group : split(getString(section, key), ';')) {
        std::vector<double> values;
        for (const auto& token : split(group, ',')) {
            values.push_back(parseDouble(token, key));
        }
        result.push_back(values);
    }
    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

bool ConfigReader::parseDecoderConfig(GraphDecoderConfig& config) const {
    const std::string sec = "decoder";
    if (!hasSection(sec)) return false;

    if (hasKey(sec, "graph_channels")) config.graph_channels = getIntArray(sec, "graph_channels");
    if (hasKey(sec, "feature_channels")) config.feature_channels = getIntArray(sec, "feature_channels");
    if (hasKey(sec, "unpool_indices")) config.unpool_indices = getIntArray(sec, "unpool_indices");
    if (hasKey(sec, "aggregate_indices")) {
        config.aggregate_indices = getIntArrayList(sec, "aggregate_indices");
    }
    if (hasKey(sec, "aggregation")) {
        config.aggregation = parseSamplingMode(getString(sec, "aggregation"));
    }

    config.propagate_coords = getBool(sec, "propagate_coords", config.propagate_coords);
    config.weighted_edges = getBool(sec, "weighted_edges", config.weighted_edges);
    config.adaptive_unpool = getBool(sec, "adaptive_unpool", config.adaptive_unpool);
    config.residual_blocks = getInt(sec, "residual_blocks", config.residual_blocks);
    config.f2f_hidden_layers = getInt(sec, "f2f_hidden_layers", config.f2f_hidden_layers);

    if (hasKey(sec, "graph_conv")) {
        config.graph_conv = parseGraphConvType(getString(sec, "graph_conv"));
    }
    if (hasKey(sec, "norm")) {
        config.norm = parseNormType(getString(sec, "norm"));
    }

    int seed = getInt(sec, "seed", static_cast<int>(config.seed));
    if (seed < 0) {
        throw ConfigurationError("seed must be non-negative, got " + std::to_string(seed));
    }
    config.seed = static_cast<unsigned int>(seed);

    return true;
}

bool ConfigReader::parseTemplateConfig(TemplateConfig& config) const {
    const std::string sec = "template";
    if (!hasSection(sec)) return false;

    config.path = getString(sec, "path", config.path);
    config.normalize = getBool(sec, "normalize", config.normalize);
    config.icosphere_level = getInt(sec, "icosphere_level", config.icosphere_level);

    if (hasKey(sec, "structure_centers")) {
        config.structure_centers.clear();
        for (const auto& c : getDoubleArrayList(sec, "structure_centers")) {
            if (c.size() != 3) {
                throw ConfigurationError("structure_centers: every center needs 3 "
                                         "coordinates, got " + std::to_string(c.size()));
            }
            config.structure_centers.push_back({c[0], c[1], c[2]});
        }
    }
    if (hasKey(sec, "structure_radii")) {
        config.structure_radii = getDoubleArray(sec, "structure_radii");
    }

    return true;
}

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write configuration template: " << filename << std::endl;
        return;
    }

    file << "# V2M Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value, lists a,b,c, lists of lists a,b; c,d\n\n";

    file << "[template]\n";
    file << "# OBJ file, one structure per o/g group. Leave empty to generate icospheres.\n";
    file << "path =\n";
    file << "normalize = true                      # project OBJ vertices onto the unit sphere\n";
    file << "icosphere_level = 2                   # 10*4^level + 2 vertices per structure\n";
    file << "structure_centers = -0.4,0,0; 0.4,0,0\n";
    file << "structure_radii = 0.3, 0.3\n\n";

    file << "[decoder]\n";
    file << "# K+1 latent widths for K decoder steps\n";
    file << "graph_channels = 64, 64, 64\n";
    file << "# Channel count of every volumetric feature map, in map order\n";
    file << "feature_channels = 32, 16, 8\n";
    file << "unpool_indices = 0, 1                 # 1 = subdivide before the step\n";
    file << "aggregate_indices = 0,1; 1,2          # feature maps sampled by each step\n";
    file << "aggregation = trilinear               # trilinear, nearest\n";
    file << "propagate_coords = true\n";
    file << "weighted_edges = false                # requires propagate_coords\n";
    file << "adaptive_unpool = false               # unsupported, must stay false\n";
    file << "residual_blocks = 3\n";
    file << "f2f_hidden_layers = 2\n";
    file << "graph_conv = norm                     # basic, norm\n";
    file << "norm = batch                          # none, batch\n";
    file << "seed = 0\n";
}

} // namespace V2M
