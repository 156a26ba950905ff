#ifndef SMTREE__PARAMETER_HPP_
#define SMTREE__PARAMETER_HPP_

#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

#include "tensor/tensor_util.hpp"

#include "absl/algorithm/container.h"
#include "absl/log/check.h"
#include "absl/types/span.h"

namespace smt {

inline Eigen::ThreadPool g_thread_pool(8 /* number of threads in pool */);
inline Eigen::ThreadPoolDevice g_device(&g_thread_pool,
                                        4 /* number of threads to use */);

inline std::mt19937& GlobalGenerator() {
  static std::mt19937 generator(42);
  return generator;
}

inline void ManualSeed(unsigned int seed) { GlobalGenerator().seed(seed); }

template <typename T>
inline void ConstantFill(absl::Span<T> weight, T C) {
  absl::c_fill(weight, C);
}

template <typename T>
inline void UniformFill(absl::Span<T> weight, T from = 0.0, T to = 1.0) {
  std::uniform_real_distribution<T> distribution(from, to);
  for (auto& w : weight) {
    w = distribution(GlobalGenerator());
  }
}

template <typename T>
inline void NormalFill(absl::Span<T> weight, T mean = 0.0, T std = 1.0) {
  std::normal_distribution<T> distribution(mean, std);
  for (auto& w : weight) {
    w = distribution(GlobalGenerator());
  }
}

enum DataType : int { DT_FLOAT = 1, DT_HALF = 2, DT_INT32 = 3, DT_DOUBLE = 4 };

inline std::string DataTypeString(DataType dtype) {
  switch (dtype) {
    case DT_FLOAT:
      return "float";
    case DT_HALF:
      return "half";
    case DT_INT32:
      return "int32";
    case DT_DOUBLE:
      return "double";
  }
  return "unknown(" + std::to_string(static_cast<int>(dtype)) + ")";
}

// Validates type T for whether it is a supported DataType.
template <class T>
struct IsValidDataType;

// DataTypeToEnum<T>::v() and DataTypeToEnum<T>::value are the DataType
// constants for T, e.g. DataTypeToEnum<float>::v() is DT_FLOAT.
template <class T>
struct DataTypeToEnum {
  static_assert(IsValidDataType<T>::value, "Specified Data Type not supported");
};  // Specializations below

// EnumToDataType<VALUE>::Type is the type for DataType constant VALUE, e.g.
// EnumToDataType<DT_FLOAT>::Type is float.
template <DataType VALUE>
struct EnumToDataType {};  // Specializations below

// Template specialization for both DataTypeToEnum and EnumToDataType.
#define MATCH_TYPE_AND_ENUM(TYPE, ENUM)     \
  template <>                               \
  struct DataTypeToEnum<TYPE> {             \
    static DataType v() { return ENUM; }    \
    static constexpr DataType value = ENUM; \
  };                                        \
  template <>                               \
  struct IsValidDataType<TYPE> {            \
    static constexpr bool value = true;     \
  };                                        \
  template <>                               \
  struct EnumToDataType<ENUM> {             \
    typedef TYPE Type;                      \
  }

MATCH_TYPE_AND_ENUM(float, DT_FLOAT);
MATCH_TYPE_AND_ENUM(double, DT_DOUBLE);
MATCH_TYPE_AND_ENUM(Eigen::half, DT_HALF);
MATCH_TYPE_AND_ENUM(int, DT_INT32);

// Parameter weight and its corresponding gradient
struct Parameter {
  Parameter(const Parameter&) = delete;
  Parameter& operator=(const Parameter&) = delete;

  explicit Parameter(DataType dtype, int64_t num_element = 0)
      : dtype_(dtype),
        num_element_(num_element),
        data_(nullptr),
        grad_(nullptr) {
    if (num_element) {
      LazyAllocate(num_element);
    }
  }

  ~Parameter() {
    if (data_ != nullptr) {
      g_device.deallocate(data_);
    }
    if (grad_ != nullptr) {
      g_device.deallocate(grad_);
    }
  }

  int64_t size() const { return num_element_; }
  DataType dtype() const { return dtype_; }
  bool has_grad() const { return grad_ != nullptr; }

  void LazyAllocate(int64_t num_element) {
    if (data_ == nullptr) {
      data_ = Allocate(dtype_, num_element);
      Zero(data_, dtype_, num_element);
      num_element_ = num_element;
    }
    CHECK_EQ(num_element, num_element_);
  }

  void LazyAllocateGradient() {
    if (grad_ == nullptr) {
      CHECK_GT(num_element_, 0);
      grad_ = Allocate(dtype_, num_element_);
      Zero(grad_, dtype_, num_element_);
    }
  }

  void ZeroData() {
    if (data_ != nullptr) {
      Zero(data_, dtype_, num_element_);
    }
  }

  void ZeroGrad() {
    if (grad_ != nullptr) {
      Zero(grad_, dtype_, num_element_);
    }
  }

  // Converts data (and gradient, when allocated) to `dtype` in place. Every
  // holder of this Parameter observes the new element type.
  void Cast(DataType dtype) {
    if (dtype == dtype_) {
      return;
    }
    if (data_ != nullptr) {
      void* data = Allocate(dtype, num_element_);
      Convert(data_, dtype_, data, dtype, num_element_);
      g_device.deallocate(data_);
      data_ = data;
    }
    if (grad_ != nullptr) {
      void* grad = Allocate(dtype, num_element_);
      Convert(grad_, dtype_, grad, dtype, num_element_);
      g_device.deallocate(grad_);
      grad_ = grad;
    }
    dtype_ = dtype;
  }

  template <typename T>
  T* data() const {
    return static_cast<T*>(data_);
  }

  template <typename T>
  T* grad() const {
    return static_cast<T*>(grad_);
  }

  template <typename T>
  absl::Span<T> span() const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype_);
    return {data<T>(), static_cast<size_t>(num_element_)};
  }

  template <typename T>
  absl::Span<T> span_grad() const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype_);
    return {grad<T>(), static_cast<size_t>(num_element_)};
  }

  template <typename T>
  typename TTypes<T>::Flat flat() const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype_);
    return {data<T>(), num_element_};
  }
  template <typename T>
  typename TTypes<T>::ConstFlat const_flat() const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype_);
    return {data<T>(), num_element_};
  }

  template <typename T>
  typename TTypes<T>::Matrix matrix(int rows, int cols) const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype_);
    CHECK_EQ(static_cast<int64_t>(rows) * cols, num_element_);
    return {data<T>(), rows, cols};
  }
  template <typename T>
  typename TTypes<T>::ConstMatrix const_matrix(int rows, int cols) const {
    CHECK_EQ(DataTypeToEnum<T>::value, dtype_);
    CHECK_EQ(static_cast<int64_t>(rows) * cols, num_element_);
    return {data<T>(), rows, cols};
  }

 private:
  static size_t ElementSize(DataType dtype) {
    if (dtype == DT_FLOAT) {
      return sizeof(float);
    } else if (dtype == DT_DOUBLE) {
      return sizeof(double);
    } else if (dtype == DT_HALF) {
      return sizeof(Eigen::half);
    } else {
      throw std::invalid_argument("invalid data type: " +
                                  std::to_string(dtype));
    }
  }

  static void* Allocate(DataType dtype, int64_t num_element) {
    return g_device.allocate(ElementSize(dtype) * num_element);
  }

  static void Zero(void* data, DataType dtype, int64_t num_element) {
    g_device.memset(data, 0, ElementSize(dtype) * num_element);
  }

  template <typename From>
  static void ConvertFrom(const From* src, void* dst, DataType dst_dtype,
                          int64_t num_element) {
    typename TTypes<From>::UnalignedConstFlat from(src, num_element);
    if (dst_dtype == DT_FLOAT) {
      typename TTypes<float>::UnalignedFlat to(static_cast<float*>(dst),
                                               num_element);
      to.device(g_device) = from.template cast<float>();
    } else if (dst_dtype == DT_DOUBLE) {
      typename TTypes<double>::UnalignedFlat to(static_cast<double*>(dst),
                                                num_element);
      to.device(g_device) = from.template cast<double>();
    } else if (dst_dtype == DT_HALF) {
      typename TTypes<Eigen::half>::UnalignedFlat to(
          static_cast<Eigen::half*>(dst), num_element);
      to.device(g_device) = from.template cast<Eigen::half>();
    } else {
      throw std::invalid_argument("invalid data type: " +
                                  std::to_string(dst_dtype));
    }
  }

  static void Convert(const void* src, DataType src_dtype, void* dst,
                      DataType dst_dtype, int64_t num_element) {
    if (src_dtype == DT_FLOAT) {
      ConvertFrom(static_cast<const float*>(src), dst, dst_dtype, num_element);
    } else if (src_dtype == DT_DOUBLE) {
      ConvertFrom(static_cast<const double*>(src), dst, dst_dtype,
                  num_element);
    } else if (src_dtype == DT_HALF) {
      ConvertFrom(static_cast<const Eigen::half*>(src), dst, dst_dtype,
                  num_element);
    } else {
      throw std::invalid_argument("invalid data type: " +
                                  std::to_string(src_dtype));
    }
  }

  DataType dtype_;
  int64_t num_element_;
  void* data_;
  void* grad_;
};

using Activation = Parameter;

}  // namespace smt

#endif  // SMTREE__PARAMETER_HPP_
