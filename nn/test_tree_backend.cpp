#include <gtest/gtest.h>
#include "TreeBackend.hpp"

#include <cmath>
#include <vector>

namespace smt {
namespace testing {

template <typename T>
class TreeBackendTest : public ::testing::Test {
 protected:
  void SetUp() override { backend_ = MakeTreeBackend<T>(Device::kCpu); }

  std::unique_ptr<TreeBackend<T>> backend_;
};

using BackendTypes = ::testing::Types<float, double>;
TYPED_TEST_SUITE(TreeBackendTest, BackendTypes);

TYPED_TEST(TreeBackendTest, Affine) {
  using T = TypeParam;
  // weight: [2, 3]
  std::vector<T> w = {1, 2, 3, -1, 0, 1};
  std::vector<T> b = {0.5, -0.5};
  std::vector<T> x = {1, 1, 2};
  std::vector<T> out(2);

  this->backend_->Affine(
      typename TTypes<T>::UnalignedConstMatrix(w.data(), 2, 3),
      typename TTypes<T>::UnalignedConstFlat(b.data(), 2),
      typename TTypes<T>::UnalignedConstFlat(x.data(), 3),
      typename TTypes<T>::UnalignedFlat(out.data(), 2));

  EXPECT_NEAR(out[0], 1 + 2 + 6 + 0.5, 1e-5);
  EXPECT_NEAR(out[1], -1 + 0 + 2 - 0.5, 1e-5);
}

TYPED_TEST(TreeBackendTest, LogSoftmaxSumsToOne) {
  using T = TypeParam;
  std::vector<T> logits = {1.0, 2.0, 3.0, -4.0};
  this->backend_->LogSoftmax(
      typename TTypes<T>::UnalignedFlat(logits.data(), 4));

  T sum = 0;
  for (T v : logits) {
    EXPECT_LE(v, 0);
    sum += std::exp(v);
  }
  EXPECT_NEAR(sum, 1.0, 1e-5);
  // log_softmax(3) - log_softmax(2) == 1
  EXPECT_NEAR(logits[2] - logits[1], 1.0, 1e-5);
}

TYPED_TEST(TreeBackendTest, LogSoftmaxLargeLogitsStayFinite) {
  using T = TypeParam;
  std::vector<T> logits = {1000.0, 1000.0, 990.0};
  this->backend_->LogSoftmax(
      typename TTypes<T>::UnalignedFlat(logits.data(), 3));

  for (T v : logits) {
    EXPECT_TRUE(std::isfinite(v));
  }
  EXPECT_NEAR(logits[0], std::log(0.5), 1e-3);
}

TYPED_TEST(TreeBackendTest, Accumulate) {
  using T = TypeParam;
  std::vector<T> y = {1, 2, 3};
  std::vector<T> x = {1, 1, -1};
  this->backend_->Accumulate(typename TTypes<T>::UnalignedFlat(y.data(), 3),
                             typename TTypes<T>::UnalignedConstFlat(x.data(), 3),
                             T(2));
  EXPECT_EQ(y, std::vector<T>({3, 4, 1}));
}

TYPED_TEST(TreeBackendTest, OuterAccumulate) {
  using T = TypeParam;
  std::vector<T> m(6, T(1));
  std::vector<T> g = {1, -2};
  std::vector<T> x = {1, 2, 3};
  this->backend_->OuterAccumulate(
      typename TTypes<T>::UnalignedMatrix(m.data(), 2, 3),
      typename TTypes<T>::UnalignedConstFlat(g.data(), 2),
      typename TTypes<T>::UnalignedConstFlat(x.data(), 3), T(0.5));
  EXPECT_EQ(m, std::vector<T>({1.5, 2, 2.5, 0, -1, -2}));
}

TYPED_TEST(TreeBackendTest, TransposeAccumulate) {
  using T = TypeParam;
  std::vector<T> m = {1, 2, 3, -1, 0, 1};
  std::vector<T> g = {2, 1};
  std::vector<T> y = {0, 0, 1};
  this->backend_->TransposeAccumulate(
      typename TTypes<T>::UnalignedFlat(y.data(), 3),
      typename TTypes<T>::UnalignedConstMatrix(m.data(), 2, 3),
      typename TTypes<T>::UnalignedConstFlat(g.data(), 2), T(1));
  EXPECT_EQ(y, std::vector<T>({1, 4, 8}));
}

TEST(TreeBackendFactoryTest, CpuOnly) {
  EXPECT_EQ(MakeTreeBackend<float>(Device::kCpu)->device(), Device::kCpu);
  EXPECT_THROW(MakeTreeBackend<float>(Device::kCuda), std::invalid_argument);
}

}  // namespace testing
}  // namespace smt
