#ifndef SMTREE__OPTIM_HPP_
#define SMTREE__OPTIM_HPP_

#include <memory>

#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "nn/Parameter.hpp"
#include "nn/SoftMaxTree.hpp"

namespace smt {
namespace optim {

// Stochastic gradient descent over the blocks a SoftMaxTree reports as
// touched. Momentum buffers are kept per static key, so a block that is not
// touched in a step keeps its velocity until it is touched again.
struct SGD {
  SGD(SoftMaxTree* tree, float learning_rate, float momentum = 0.0f)
      : tree_(tree), learning_rate_(learning_rate), momentum_(momentum) {
    CHECK(tree_ != nullptr);
    CHECK(!tree_->acc_update()) << "acc_update layers update themselves";
    CHECK_GE(momentum_, 0.0f);
    if (momentum_ > 0.0f) {
      CHECK(tree_->static_keys()) << "momentum needs static parameter keys";
    }
  }

  void Step() { Step(learning_rate_); }

  void Step(float learning_rate) {
    if (momentum_ == 0.0f) {
      tree_->UpdateParameters(learning_rate);
      return;
    }
    ParameterMap params, grads;
    tree_->Parameters(&params, &grads);
    for (auto& param : params) {
      const ParameterView& grad = grads.at(param.first);
      Parameter* velocity = Velocity(param.first, param.second);
      if (param.second.dtype == DT_DOUBLE) {
        Update<double>(param.second, grad, velocity, learning_rate);
      } else {
        Update<float>(param.second, grad, velocity, learning_rate);
      }
    }
  }

  void ZeroGrad() { tree_->ZeroGradParameters(); }

  size_t NumStates() const { return velocity_.size(); }

 private:
  Parameter* Velocity(int key, const ParameterView& param) {
    std::unique_ptr<Parameter>& velocity = velocity_[key];
    if (velocity == nullptr) {
      velocity = std::make_unique<Parameter>(param.dtype, param.size());
    }
    CHECK_EQ(velocity->size(), param.size());
    velocity->Cast(param.dtype);
    return velocity.get();
  }

  template <typename T>
  void Update(const ParameterView& param, const ParameterView& grad,
              Parameter* velocity, float learning_rate) {
    // v = momentum * v + g
    // p = p - lr * v
    auto p = param.flat<T>();
    auto g = grad.const_flat<T>();
    auto v = velocity->flat<T>();
    v.device(g_device) = v * static_cast<T>(momentum_) + g;
    p.device(g_device) -= v * static_cast<T>(learning_rate);
  }

  SoftMaxTree* tree_;
  float learning_rate_;
  float momentum_;
  absl::flat_hash_map<int, std::unique_ptr<Parameter>> velocity_;
};

}  // namespace optim
}  // namespace smt

#endif  // SMTREE__OPTIM_HPP_
