#ifndef SMTREE__TREE_BACKEND_HPP_
#define SMTREE__TREE_BACKEND_HPP_

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

#include "tensor/tensor_util.hpp"
#include "absl/log/check.h"

namespace smt {

enum class Device { kCpu, kCuda };

inline std::string DeviceString(Device device) {
  return device == Device::kCpu ? "cpu" : "cuda";
}

// The numeric operations the tree layer needs from a compute target. Every
// call works on one sibling group: `weight` is [count, input_size], `bias`
// and `logits` are [count], `x` is [input_size].
template <typename T>
class TreeBackend {
 public:
  using Flat = typename TTypes<T>::UnalignedFlat;
  using ConstFlat = typename TTypes<T>::UnalignedConstFlat;
  using Matrix = typename TTypes<T>::UnalignedMatrix;
  using ConstMatrix = typename TTypes<T>::UnalignedConstMatrix;

  virtual ~TreeBackend() = default;

  virtual Device device() const = 0;

  // logits = weight * x + bias
  virtual void Affine(ConstMatrix weight, ConstFlat bias, ConstFlat x,
                      Flat logits) = 0;

  // In place log(softmax(logits)), stabilized by the group maximum.
  virtual void LogSoftmax(Flat logits) = 0;

  // y += alpha * x
  virtual void Accumulate(Flat y, ConstFlat x, T alpha) = 0;

  // m += alpha * g x^T
  virtual void OuterAccumulate(Matrix m, ConstFlat g, ConstFlat x,
                               T alpha) = 0;

  // y += alpha * m^T g
  virtual void TransposeAccumulate(Flat y, ConstMatrix m, ConstFlat g,
                                   T alpha) = 0;
};

// Sibling groups are small, so each op is evaluated on the calling thread
// rather than dispatched to the shared thread pool.
template <typename T>
class CpuTreeBackend : public TreeBackend<T> {
 public:
  using typename TreeBackend<T>::Flat;
  using typename TreeBackend<T>::ConstFlat;
  using typename TreeBackend<T>::Matrix;
  using typename TreeBackend<T>::ConstMatrix;

  Device device() const override { return Device::kCpu; }

  void Affine(ConstMatrix weight, ConstFlat bias, ConstFlat x,
              Flat logits) override {
    CHECK_EQ(weight.dimension(0), logits.dimension(0));
    CHECK_EQ(weight.dimension(0), bias.dimension(0));
    CHECK_EQ(weight.dimension(1), x.dimension(0));
    Eigen::array<Eigen::IndexPair<int>, 1> product_dims = {
        Eigen::IndexPair<int>(1, 0)};
    logits.device(device_) = weight.contract(x, product_dims) + bias;
  }

  void LogSoftmax(Flat logits) override {
    Eigen::Tensor<T, 0, Eigen::RowMajor> max_logit = logits.maximum();
    logits.device(device_) = logits - logits.constant(max_logit());
    Eigen::Tensor<T, 0, Eigen::RowMajor> sum = logits.exp().sum();
    logits.device(device_) = logits - logits.constant(std::log(sum()));
  }

  void Accumulate(Flat y, ConstFlat x, T alpha) override {
    CHECK_EQ(y.dimension(0), x.dimension(0));
    y.device(device_) += x * alpha;
  }

  void OuterAccumulate(Matrix m, ConstFlat g, ConstFlat x, T alpha) override {
    const int rows = g.dimension(0), cols = x.dimension(0);
    CHECK_EQ(m.dimension(0), rows);
    CHECK_EQ(m.dimension(1), cols);
    Eigen::array<Eigen::Index, 2> rows_by_one = {rows, 1};
    Eigen::array<Eigen::Index, 2> one_by_cols = {1, cols};
    m.device(device_) += (g.reshape(rows_by_one).broadcast(one_by_cols) *
                          x.reshape(one_by_cols).broadcast(rows_by_one)) *
                         alpha;
  }

  void TransposeAccumulate(Flat y, ConstMatrix m, ConstFlat g,
                           T alpha) override {
    CHECK_EQ(m.dimension(0), g.dimension(0));
    CHECK_EQ(m.dimension(1), y.dimension(0));
    Eigen::array<Eigen::IndexPair<int>, 1> product_dims = {
        Eigen::IndexPair<int>(0, 0)};
    y.device(device_) += g.contract(m, product_dims) * alpha;
  }

 private:
  Eigen::DefaultDevice device_;
};

template <typename T>
std::unique_ptr<TreeBackend<T>> MakeTreeBackend(Device device) {
  if (device == Device::kCpu) {
    return std::make_unique<CpuTreeBackend<T>>();
  }
  throw std::invalid_argument("no tree backend compiled for device: " +
                              DeviceString(device));
}

}  // namespace smt

#endif  // SMTREE__TREE_BACKEND_HPP_
