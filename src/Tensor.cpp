/**
 * @file Tensor.cpp
 * @brief Implementation of the dense tensor types
 */

#include "Tensor.hpp"
#include <cmath>
#include <algorithm>
#include <numeric>
#include <fstream>
#include <sstream>

namespace V2M {
namespace ML {

namespace {

size_t countElements(const std::vector<int>& shape) {
    size_t n = 1;
    for (int s : shape) {
        if (s < 0) {
            throw ShapeError("Negative tensor dimension in " + shapeToString(shape));
        }
        n *= static_cast<size_t>(s);
    }
    return n;
}

void requireSameShape(const Tensor& a, const Tensor& b, const char* op) {
    if (a.shape != b.shape) {
        throw ShapeError(std::string("Tensor ") + op + ": shape mismatch " +
                         a.shapeString() + " vs " + b.shapeString());
    }
}

} // namespace

std::string shapeToString(const std::vector<int>& shape) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << shape[i];
    }
    ss << "]";
    return ss.str();
}

// =============================================================================
// Tensor Implementation
// =============================================================================

Tensor::Tensor(const std::vector<int>& shape) : shape(shape) {
    data.resize(countElements(shape), 0.0);
}

Tensor::Tensor(const std::vector<int>& shape, double value) : shape(shape) {
    data.resize(countElements(shape), value);
}

Tensor::Tensor(const std::vector<int>& shape, const std::vector<double>& data)
    : data(data), shape(shape) {
    if (countElements(shape) != data.size()) {
        throw ShapeError("Tensor data size " + std::to_string(data.size()) +
                         " does not match shape " + shapeToString(shape));
    }
}

size_t Tensor::numel() const {
    return countElements(shape);
}

double& Tensor::operator()(int i) {
    return data[i];
}

double& Tensor::operator()(int i, int j) {
    return data[static_cast<size_t>(i) * shape[1] + j];
}

double& Tensor::operator()(int i, int j, int k) {
    return data[(static_cast<size_t>(i) * shape[1] + j) * shape[2] + k];
}

double& Tensor::operator()(int i, int j, int k, int l) {
    return data[((static_cast<size_t>(i) * shape[1] + j) * shape[2] + k) * shape[3] + l];
}

double& Tensor::operator()(int i, int j, int k, int l, int m) {
    return data[(((static_cast<size_t>(i) * shape[1] + j) * shape[2] + k) * shape[3] + l)
                * shape[4] + m];
}

const double& Tensor::operator()(int i) const {
    return data[i];
}

const double& Tensor::operator()(int i, int j) const {
    return data[static_cast<size_t>(i) * shape[1] + j];
}

const double& Tensor::operator()(int i, int j, int k) const {
    return data[(static_cast<size_t>(i) * shape[1] + j) * shape[2] + k];
}

const double& Tensor::operator()(int i, int j, int k, int l) const {
    return data[((static_cast<size_t>(i) * shape[1] + j) * shape[2] + k) * shape[3] + l];
}

const double& Tensor::operator()(int i, int j, int k, int l, int m) const {
    return data[(((static_cast<size_t>(i) * shape[1] + j) * shape[2] + k) * shape[3] + l)
                * shape[4] + m];
}

Tensor Tensor::reshape(const std::vector<int>& new_shape) const {
    if (countElements(new_shape) != data.size()) {
        throw ShapeError("Cannot reshape " + shapeString() + " to " +
                         shapeToString(new_shape));
    }
    Tensor result;
    result.data = data;
    result.shape = new_shape;
    return result;
}

Tensor Tensor::sliceLast(int begin, int end) const {
    if (shape.empty()) {
        throw ShapeError("sliceLast on a scalar tensor");
    }
    int last = shape.back();
    if (begin < 0 || end > last || begin > end) {
        throw ShapeError("sliceLast [" + std::to_string(begin) + ", " +
                         std::to_string(end) + ") out of range for " + shapeString());
    }

    std::vector<int> out_shape = shape;
    out_shape.back() = end - begin;
    Tensor result(out_shape);

    size_t rows = last > 0 ? data.size() / last : countElements(out_shape);
    int width = end - begin;
    for (size_t r = 0; r < rows && width > 0; ++r) {
        std::copy(data.begin() + r * last + begin,
                  data.begin() + r * last + end,
                  result.data.begin() + r * width);
    }
    return result;
}

Tensor Tensor::concatLast(const std::vector<const Tensor*>& parts) {
    std::vector<const Tensor*> used;
    for (const Tensor* p : parts) {
        if (p != nullptr && !p->shape.empty()) used.push_back(p);
    }
    if (used.empty()) {
        return Tensor();
    }

    std::vector<int> lead(used[0]->shape.begin(), used[0]->shape.end() - 1);
    int total = 0;
    for (const Tensor* p : used) {
        std::vector<int> p_lead(p->shape.begin(), p->shape.end() - 1);
        if (p_lead != lead) {
            throw ShapeError("concatLast: leading dimensions differ, " +
                             used[0]->shapeString() + " vs " + p->shapeString());
        }
        total += p->shape.back();
    }

    std::vector<int> out_shape = lead;
    out_shape.push_back(total);
    Tensor result(out_shape);

    size_t rows = countElements(lead);
    for (size_t r = 0; r < rows; ++r) {
        size_t offset = r * total;
        for (const Tensor* p : used) {
            int w = p->shape.back();
            std::copy(p->data.begin() + r * w, p->data.begin() + (r + 1) * w,
                      result.data.begin() + offset);
            offset += w;
        }
    }
    return result;
}

Tensor Tensor::operator+(const Tensor& other) const {
    requireSameShape(*this, other, "addition");
    Tensor result(shape);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] = data[i] + other.data[i];
    }
    return result;
}

Tensor Tensor::operator-(const Tensor& other) const {
    requireSameShape(*this, other, "subtraction");
    Tensor result(shape);
    for (size_t i = 0; i < data.size(); ++i) {
        result.data[i] = data[i] - other.data[i];
    }
    return result;
}

Tensor& Tensor::operator+=(const Tensor& other) {
    requireSameShape(*this, other, "accumulation");
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] += other.data[i];
    }
    return *this;
}

double Tensor::sum() const {
    return std::accumulate(data.begin(), data.end(), 0.0);
}

double Tensor::max() const {
    if (data.empty()) {
        throw ShapeError("max of an empty tensor " + shapeString());
    }
    return *std::max_element(data.begin(), data.end());
}

double Tensor::min() const {
    if (data.empty()) {
        throw ShapeError("min of an empty tensor " + shapeString());
    }
    return *std::min_element(data.begin(), data.end());
}

double Tensor::maxAbs() const {
    double m = 0.0;
    for (double x : data) m = std::max(m, std::abs(x));
    return m;
}

void Tensor::fill(double value) {
    std::fill(data.begin(), data.end(), value);
}

void Tensor::randn(std::mt19937& gen, double mean, double std) {
    std::normal_distribution<double> dist(mean, std);
    for (double& x : data) x = dist(gen);
}

void Tensor::kaiming_init(std::mt19937& gen) {
    // Weights are stored [out, in]; fan-in is the second dimension
    int fan_in = shape.size() > 1 ? shape[1] : shape[0];
    double std = std::sqrt(2.0 / std::max(1, fan_in));
    randn(gen, 0.0, std);
}

void Tensor::write(std::ostream& out) const {
    int ndim = static_cast<int>(shape.size());
    out.write(reinterpret_cast<const char*>(&ndim), sizeof(int));
    out.write(reinterpret_cast<const char*>(shape.data()), ndim * sizeof(int));
    size_t n = data.size();
    out.write(reinterpret_cast<const char*>(&n), sizeof(size_t));
    out.write(reinterpret_cast<const char*>(data.data()), n * sizeof(double));
    if (!out) {
        throw std::runtime_error("Failed to write tensor " + shapeString());
    }
}

void Tensor::read(std::istream& in) {
    int ndim = 0;
    in.read(reinterpret_cast<char*>(&ndim), sizeof(int));
    if (!in || ndim < 0 || ndim > 8) {
        throw std::runtime_error("Corrupt tensor header");
    }
    std::vector<int> new_shape(ndim);
    in.read(reinterpret_cast<char*>(new_shape.data()), ndim * sizeof(int));
    size_t n = 0;
    in.read(reinterpret_cast<char*>(&n), sizeof(size_t));
    if (!in || n != countElements(new_shape)) {
        throw std::runtime_error("Corrupt tensor header for shape " +
                                 shapeToString(new_shape));
    }
    std::vector<double> new_data(n);
    in.read(reinterpret_cast<char*>(new_data.data()), n * sizeof(double));
    if (!in) {
        throw std::runtime_error("Truncated tensor data for shape " +
                                 shapeToString(new_shape));
    }
    shape = std::move(new_shape);
    data = std::move(new_data);
}

void Tensor::save(const std::string& path) const {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create tensor file: " + path);
    }
    write(file);
}

void Tensor::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open tensor file: " + path);
    }
    read(file);
}

std::string Tensor::shapeString() const {
    return shapeToString(shape);
}

// =============================================================================
// IndexTensor Implementation
// =============================================================================

IndexTensor::IndexTensor(const std::vector<int>& shape, int value) : shape(shape) {
    data.resize(countElements(shape), value);
}

IndexTensor::IndexTensor(const std::vector<int>& shape, const std::vector<int>& data)
    : data(data), shape(shape) {
    if (countElements(shape) != data.size()) {
        throw ShapeError("Index data size " + std::to_string(data.size()) +
                         " does not match shape " + shapeToString(shape));
    }
}

size_t IndexTensor::numel() const {
    return countElements(shape);
}

int& IndexTensor::operator()(int i, int j) {
    return data[static_cast<size_t>(i) * shape[1] + j];
}

int& IndexTensor::operator()(int i, int j, int k, int l) {
    return data[((static_cast<size_t>(i) * shape[1] + j) * shape[2] + k) * shape[3] + l];
}

const int& IndexTensor::operator()(int i, int j) const {
    return data[static_cast<size_t>(i) * shape[1] + j];
}

const int& IndexTensor::operator()(int i, int j, int k, int l) const {
    return data[((static_cast<size_t>(i) * shape[1] + j) * shape[2] + k) * shape[3] + l];
}

std::string IndexTensor::shapeString() const {
    return shapeToString(shape);
}

// =============================================================================
// Activation Functions
// =============================================================================

namespace Activation {

Tensor relu(const Tensor& x) {
    Tensor result(x.shape);
    for (size_t i = 0; i < x.data.size(); ++i) {
        result.data[i] = std::max(0.0, x.data[i]);
    }
    return result;
}

} // namespace Activation

} // namespace ML
} // namespace V2M
