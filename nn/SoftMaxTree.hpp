#ifndef SMTREE__SOFTMAX_TREE_HPP_
#define SMTREE__SOFTMAX_TREE_HPP_

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <stdexcept>
#include <tuple>
#include <vector>

#include "tensor/tensor_util.hpp"
#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/types/span.h"
#include "HierarchyIndex.hpp"
#include "Parameter.hpp"
#include "TreeBackend.hpp"

namespace smt {

// Non-owning window onto rows [start, start + rows) of a weight, bias or
// gradient array. Bias windows have a single column.
struct ParameterView {
  DataType dtype;
  void* data;
  int rows;
  int cols;

  int64_t size() const { return static_cast<int64_t>(rows) * cols; }

  template <typename T>
  typename TTypes<T>::UnalignedMatrix matrix() const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype);
    return {static_cast<T*>(data), rows, cols};
  }

  template <typename T>
  typename TTypes<T>::UnalignedFlat flat() const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype);
    return {static_cast<T*>(data), size()};
  }

  template <typename T>
  typename TTypes<T>::UnalignedConstFlat const_flat() const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype);
    return {static_cast<const T*>(data), size()};
  }
};

// Keyed by a static id: the parent id for weights, SoftMaxTree::BiasKey for
// biases.
using ParameterMap = std::map<int, ParameterView>;

struct NodeParameters {
  ParameterView weight;
  ParameterView bias;
  bool has_grad;
  ParameterView weight_grad;  // only meaningful when has_grad
  ParameterView bias_grad;
};

// parent id -> accumulated backward scale since the last reset
using UpdateSet = absl::flat_hash_map<int, float>;

// Computes the log of a product of softmaxes along the path from the root to
// each target. Every parent node owns a linear model over its children; the
// output is one log-likelihood per example.
struct SoftMaxTree {
  struct Options {
    int root_id = 1;
    // apply gradients straight to the weights, keep no gradient buffers
    bool acc_update = false;
    // enumerate parameter blocks under stable per-node keys
    bool static_keys = true;
    bool verbose = false;
    DataType dtype = DT_FLOAT;
    Device device = Device::kCpu;
  };

  SoftMaxTree(int input_size, const Hierarchy& hierarchy,
              const Options& options)
      : input_size_(input_size),
        root_id_(options.root_id),
        acc_update_(options.acc_update),
        static_keys_(options.static_keys),
        device_(options.device),
        batch_size_(0) {
    CHECK_GT(input_size, 0);
    index_ = std::make_shared<const HierarchyIndex>(
        HierarchyIndex::Build(hierarchy, root_id_, options.verbose));
    const int num_child_nodes = index_->num_child_nodes();
    weight_ = std::make_shared<Parameter>(
        DT_FLOAT, WeightSize(num_child_nodes, input_size_));
    bias_ = std::make_shared<Parameter>(DT_FLOAT, num_child_nodes);
    if (!acc_update_) {
      weight_->LazyAllocateGradient();
      bias_->LazyAllocateGradient();
    }
    updates_ = std::make_shared<UpdateSet>();
    CreateBackends();
    Reset();
    ToType(options.dtype);
  }

  SoftMaxTree(int input_size, const Hierarchy& hierarchy, int root_id = 1,
              bool acc_update = false, bool static_keys = true,
              bool verbose = false)
      : SoftMaxTree(input_size, hierarchy,
                    Options{root_id, acc_update, static_keys, verbose}) {}

  // Uniform init in [-stdv * sqrt(3), stdv * sqrt(3)].
  void Reset(float stdv) { FillUniform(stdv * std::sqrt(3.0f)); }

  void Reset() {
    FillUniform(1.0f / std::sqrt(
                           static_cast<float>(index_->num_child_nodes()) *
                           static_cast<float>(input_size_)));
  }

  template <typename T>
  void Forward(typename TTypes<T>::ConstMatrix x, absl::Span<const int> targets,
               typename TTypes<T>::Flat y) {
    // x: [B, input_size], targets: [B], y: [B]
    const int B = x.dimension(0);
    CHECK_EQ(x.dimension(1), input_size_);
    CHECK_EQ(B, targets.size());
    CHECK_EQ(B, y.size());
    CHECK_EQ(DataTypeToEnum<T>::value, dtype());
    ResizeBuffers(B);

    TreeBackend<T>& backend = Backend<T>();
    T* node = node_buffer_->data<T>();
    for (int b = 0; b < B; ++b) {
      CheckTarget(targets[b]);
      typename TTypes<T>::UnalignedConstFlat x_b(x.data() + b * input_size_,
                                                 input_size_);
      T log_prob = T(0);
      int child_id = targets[b];
      while (true) {
        const ParentLink link = index_->ParentOf(child_id);
        const ChildrenRange range = index_->ChildrenOf(link.parent_id);
        typename TTypes<T>::UnalignedFlat logits(node, range.count);
        backend.Affine(WeightRows<T>(range), BiasRows<T>(range), x_b, logits);
        backend.LogSoftmax(logits);
        log_prob += logits(link.sibling_index);
        if (link.parent_id == root_id_) {
          break;
        }
        child_id = link.parent_id;
      }
      y(b) = log_prob;
    }
  }

  // Accumulates dL/dx into x_grad. Without acc_update the weight and bias
  // gradients accumulate `scale` times the gradient; with acc_update the
  // weights and biases move by `-scale` times it (scale is the learning
  // rate). Each example's path is evaluated fully before anything is written.
  template <typename T>
  void Backward(typename TTypes<T>::ConstMatrix x,
                absl::Span<const int> targets,
                typename TTypes<T>::ConstFlat y_grad,
                typename TTypes<T>::Matrix x_grad, float scale = 1.0f) {
    // x: [B, input_size], targets: [B], y_grad: [B], x_grad: [B, input_size]
    const int B = x.dimension(0);
    CHECK_EQ(x.dimension(1), input_size_);
    CHECK_EQ(B, targets.size());
    CHECK_EQ(B, y_grad.size());
    CHECK_EQ(B, x_grad.dimension(0));
    CHECK_EQ(input_size_, x_grad.dimension(1));
    CHECK_EQ(DataTypeToEnum<T>::value, dtype());
    ResizeBuffers(B);

    TreeBackend<T>& backend = Backend<T>();
    const int max_family_path = index_->max_family_path();
    for (int b = 0; b < B; ++b) {
      CheckTarget(targets[b]);
      typename TTypes<T>::UnalignedConstFlat x_b(x.data() + b * input_size_,
                                                 input_size_);
      T* grads = multi_buffer_->data<T>() + b * max_family_path;

      // d log p / d logit_i = 1{selected} - softmax_i, for every sibling.
      path_.clear();
      int offset = 0;
      int child_id = targets[b];
      while (true) {
        const ParentLink link = index_->ParentOf(child_id);
        const ChildrenRange range = index_->ChildrenOf(link.parent_id);
        typename TTypes<T>::UnalignedFlat g(grads + offset, range.count);
        backend.Affine(WeightRows<T>(range), BiasRows<T>(range), x_b, g);
        backend.LogSoftmax(g);
        g.device(node_device_) = -g.exp() * y_grad(b);
        g(link.sibling_index) += y_grad(b);
        path_.push_back(link.parent_id);
        offset += range.count;
        if (link.parent_id == root_id_) {
          break;
        }
        child_id = link.parent_id;
      }

      typename TTypes<T>::UnalignedFlat x_grad_b(x_grad.data() + b * input_size_,
                                                 input_size_);
      offset = 0;
      for (int parent_id : path_) {
        const ChildrenRange range = index_->ChildrenOf(parent_id);
        typename TTypes<T>::UnalignedConstFlat g(grads + offset, range.count);
        backend.TransposeAccumulate(x_grad_b, WeightRows<T>(range), g, T(1));
        offset += range.count;
      }

      offset = 0;
      for (int parent_id : path_) {
        const ChildrenRange range = index_->ChildrenOf(parent_id);
        typename TTypes<T>::UnalignedConstFlat g(grads + offset, range.count);
        if (acc_update_) {
          backend.OuterAccumulate(MutableWeightRows<T>(range, false), g, x_b,
                                  T(-scale));
          backend.Accumulate(MutableBiasRows<T>(range, false), g, T(-scale));
        } else {
          backend.OuterAccumulate(MutableWeightRows<T>(range, true), g, x_b,
                                  T(scale));
          backend.Accumulate(MutableBiasRows<T>(range, true), g, T(scale));
        }
        (*updates_)[parent_id] += scale;
        offset += range.count;
      }
    }
  }

  // Static keys: weight blocks keyed by parent id, bias blocks by BiasKey.
  // Only parents touched since the last reset are returned, or
  // every parent when none were touched. `grads` stays empty under
  // acc_update.
  void Parameters(ParameterMap* params, ParameterMap* grads) const {
    for (int parent_id : ParentsToVisit()) {
      const NodeParameters node = GetNodeParameters(parent_id);
      (*params)[parent_id] = node.weight;
      (*params)[BiasKey(parent_id)] = node.bias;
      if (node.has_grad) {
        (*grads)[parent_id] = node.weight_grad;
        (*grads)[BiasKey(parent_id)] = node.bias_grad;
      }
    }
  }

  // Sequential blocks, suitable for a single pass only. With nothing touched
  // the whole weight and bias arrays are returned.
  void Parameters(std::vector<ParameterView>* params,
                  std::vector<ParameterView>* grads) const {
    if (updates_->empty()) {
      const int rows = index_->num_child_nodes();
      params->push_back({dtype(), weight_->data<void>(), rows, input_size_});
      params->push_back({dtype(), bias_->data<void>(), rows, 1});
      if (!acc_update_) {
        grads->push_back({dtype(), weight_->grad<void>(), rows, input_size_});
        grads->push_back({dtype(), bias_->grad<void>(), rows, 1});
      }
      return;
    }
    for (const auto& update : *updates_) {
      const NodeParameters node = GetNodeParameters(update.first);
      params->push_back(node.weight);
      params->push_back(node.bias);
      if (node.has_grad) {
        grads->push_back(node.weight_grad);
        grads->push_back(node.bias_grad);
      }
    }
  }

  // Element count of the weight array; wider than int for large trees.
  static int64_t WeightSize(int num_child_nodes, int input_size) {
    return static_cast<int64_t>(num_child_nodes) * input_size;
  }

  // Bias keys start past the largest parent id, so id 0 cannot collide.
  int BiasKey(int parent_id) const {
    return parent_id + index_->max_parent_id() + 1;
  }

  NodeParameters GetNodeParameters(int parent_id) const {
    CHECK(index_->IsParent(parent_id)) << "not a parent id: " << parent_id;
    const ChildrenRange range = index_->ChildrenOf(parent_id);
    NodeParameters node;
    node.weight = RowView(weight_->data<void>(), range, input_size_);
    node.bias = RowView(bias_->data<void>(), range, 1);
    node.has_grad = !acc_update_;
    if (node.has_grad) {
      node.weight_grad = RowView(weight_->grad<void>(), range, input_size_);
      node.bias_grad = RowView(bias_->grad<void>(), range, 1);
    } else {
      node.weight_grad = node.bias_grad = {dtype(), nullptr, 0, 0};
    }
    return node;
  }

  void ZeroGradParameters() {
    if (!acc_update_) {
      ParameterMap params, grads;
      Parameters(&params, &grads);
      for (auto& grad : grads) {
        ZeroView(grad.second);
      }
    }
    // cleared in place: shared clones hold the same set
    updates_->clear();
  }

  void UpdateParameters(float learning_rate) {
    CHECK(!acc_update_) << "UpdateParameters is unavailable with acc_update";
    ParameterMap params, grads;
    Parameters(&params, &grads);
    for (auto& param : params) {
      const ParameterView& grad = grads.at(param.first);
      if (dtype() == DT_DOUBLE) {
        Backend<double>().Accumulate(param.second.flat<double>(),
                                     grad.const_flat<double>(),
                                     -learning_rate);
      } else {
        Backend<float>().Accumulate(param.second.flat<float>(),
                                    grad.const_flat<float>(), -learning_rate);
      }
    }
  }

  // Renormalizes every enumerated weight row to an L2 norm of at most
  // `max_norm`.
  void MaxNorm(float max_norm) {
    for (int parent_id : ParentsToVisit()) {
      const ParameterView weight = GetNodeParameters(parent_id).weight;
      if (dtype() == DT_DOUBLE) {
        RenormRows<double>(weight.matrix<double>(), max_norm);
      } else {
        RenormRows<float>(weight.matrix<float>(), max_norm);
      }
    }
  }

  // Moves weights, biases, gradients and scratch buffers to `dtype`. Buffers
  // are resized on the next call.
  void ToType(DataType dtype) {
    if (dtype != DT_FLOAT && dtype != DT_DOUBLE) {
      throw std::invalid_argument("SoftMaxTree does not support data type " +
                                  DataTypeString(dtype));
    }
    weight_->Cast(dtype);
    bias_->Cast(dtype);
    node_buffer_.reset();
    multi_buffer_.reset();
    batch_size_ = 0;
  }

  // A second layer over the same index, weights, biases, gradients and
  // update set, with its own scratch buffers.
  std::unique_ptr<SoftMaxTree> SharedClone() const {
    return std::make_unique<SoftMaxTree>(*this, SharedTag());
  }

  size_t NumParameters() const {
    return static_cast<size_t>(index_->num_child_nodes()) * (input_size_ + 1);
  }

  size_t NumActivations() const {
    size_t num_activations = 0;
    if (node_buffer_) num_activations += node_buffer_->size();
    if (multi_buffer_) num_activations += multi_buffer_->size();
    return num_activations;
  }

  DataType dtype() const { return weight_->dtype(); }
  Device device() const { return device_; }
  int input_size() const { return input_size_; }
  int root_id() const { return root_id_; }
  bool acc_update() const { return acc_update_; }
  bool static_keys() const { return static_keys_; }
  int batch_size() const { return batch_size_; }
  const HierarchyIndex& index() const { return *index_; }
  const UpdateSet& updates() const { return *updates_; }

 private:
  struct SharedTag {
    explicit SharedTag() = default;
  };

 public:
  // Shares every handle of `other`. Only SharedClone can make the tag.
  SoftMaxTree(const SoftMaxTree& other, SharedTag)
      : input_size_(other.input_size_),
        root_id_(other.root_id_),
        acc_update_(other.acc_update_),
        static_keys_(other.static_keys_),
        device_(other.device_),
        index_(other.index_),
        weight_(other.weight_),
        bias_(other.bias_),
        updates_(other.updates_),
        batch_size_(0) {
    CreateBackends();
  }

 private:
  void CreateBackends() {
    std::get<0>(backends_) = MakeTreeBackend<float>(device_);
    std::get<1>(backends_) = MakeTreeBackend<double>(device_);
  }

  template <typename T>
  TreeBackend<T>& Backend() {
    return *std::get<std::unique_ptr<TreeBackend<T>>>(backends_);
  }

  void CheckTarget(int target) const {
    CHECK(index_->IsChild(target)) << "invalid target id: " << target;
  }

  void ResizeBuffers(int batch_size) {
    // a shared clone may see its parameters change type under it
    if (batch_size_ == batch_size && node_buffer_ &&
        node_buffer_->dtype() == dtype()) {
      return;
    }
    node_buffer_ = std::make_unique<Activation>(dtype(), index_->max_family());
    multi_buffer_ = std::make_unique<Activation>(
        dtype(), static_cast<int64_t>(batch_size) * index_->max_family_path());
    path_.reserve(index_->max_depth());
    batch_size_ = batch_size;
  }

  ParameterView RowView(void* base, ChildrenRange range, int cols) const {
    const size_t element_size = dtype() == DT_DOUBLE ? sizeof(double)
                                                     : sizeof(float);
    char* start = static_cast<char*>(base) +
                  element_size * static_cast<size_t>(range.start) * cols;
    return {dtype(), start, range.count, cols};
  }

  template <typename T>
  typename TTypes<T>::UnalignedConstMatrix WeightRows(
      ChildrenRange range) const {
    return {weight_->data<T>() + static_cast<int64_t>(range.start) *
                                     input_size_,
            range.count, input_size_};
  }

  template <typename T>
  typename TTypes<T>::UnalignedConstFlat BiasRows(ChildrenRange range) const {
    return {bias_->data<T>() + range.start, range.count};
  }

  template <typename T>
  typename TTypes<T>::UnalignedMatrix MutableWeightRows(ChildrenRange range,
                                                        bool grad) {
    T* base = grad ? weight_->grad<T>() : weight_->data<T>();
    return {base + static_cast<int64_t>(range.start) * input_size_,
            range.count, input_size_};
  }

  template <typename T>
  typename TTypes<T>::UnalignedFlat MutableBiasRows(ChildrenRange range,
                                                    bool grad) {
    T* base = grad ? bias_->grad<T>() : bias_->data<T>();
    return {base + range.start, range.count};
  }

  std::vector<int> ParentsToVisit() const {
    std::vector<int> parent_ids;
    if (updates_->empty()) {
      parent_ids = index_->parent_ids();
    } else {
      parent_ids.reserve(updates_->size());
      for (const auto& update : *updates_) {
        parent_ids.push_back(update.first);
      }
    }
    return parent_ids;
  }

  void ZeroView(const ParameterView& view) {
    if (view.dtype == DT_DOUBLE) {
      view.flat<double>().setZero();
    } else {
      view.flat<float>().setZero();
    }
  }

  template <typename T>
  static void RenormRows(typename TTypes<T>::UnalignedMatrix m,
                         float max_norm) {
    Eigen::array<Eigen::Index, 1> along_cols = {1};
    Eigen::Tensor<T, 1, Eigen::RowMajor> norms =
        m.square().sum(along_cols).sqrt();
    for (int r = 0; r < m.dimension(0); ++r) {
      if (norms(r) > max_norm) {
        const T factor = T(max_norm) / (norms(r) + T(1e-7));
        for (int c = 0; c < m.dimension(1); ++c) {
          m(r, c) *= factor;
        }
      }
    }
  }

  void FillUniform(float bound) {
    if (dtype() == DT_DOUBLE) {
      UniformFill<double>(weight_->span<double>(), -bound, bound);
      UniformFill<double>(bias_->span<double>(), -bound, bound);
    } else {
      UniformFill<float>(weight_->span<float>(), -bound, bound);
      UniformFill<float>(bias_->span<float>(), -bound, bound);
    }
  }

  int input_size_;
  int root_id_;
  bool acc_update_;
  bool static_keys_;
  Device device_;

  // shared with clones
  std::shared_ptr<const HierarchyIndex> index_;
  std::shared_ptr<Parameter> weight_;  // num_child_nodes x input_size
  std::shared_ptr<Parameter> bias_;    // num_child_nodes
  std::shared_ptr<UpdateSet> updates_;

  // owned per instance
  int batch_size_;
  std::unique_ptr<Activation> node_buffer_;   // max_family
  std::unique_ptr<Activation> multi_buffer_;  // batch_size x max_family_path
  std::vector<int> path_;
  Eigen::DefaultDevice node_device_;
  std::tuple<std::unique_ptr<TreeBackend<float>>,
             std::unique_ptr<TreeBackend<double>>>
      backends_;
};

}  // namespace smt

#endif  // SMTREE__SOFTMAX_TREE_HPP_
