#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/strings/numbers.h"
#include "io/hierarchy_io.hpp"
#include "nn/Parameter.hpp"
#include "nn/SoftMaxTree.hpp"
#include "optimizer/optim.hpp"

namespace {

struct TrainConfig {
  std::string hierarchy_path;
  std::string save_hierarchy_path;
  int branching = 4;
  int depth = 3;
  int input_size = 16;
  int steps = 500;
  int batch_size = 32;
  float learning_rate = 0.1f;
  float momentum = 0.9f;
  bool acc_update = false;
  int log_every = 50;
};

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--hierarchy file.json] [--save_hierarchy file.json]"
               " [--branching N] [--depth N] [--input_size N] [--steps N]"
               " [--batch_size N] [--lr F] [--momentum F] [--acc_update]"
               " [--log_every N]"
            << std::endl;
}

bool ParseArgs(int argc, char** argv, TrainConfig* config) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--acc_update") {
      config->acc_update = true;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << std::endl;
      return false;
    }
    std::string value = argv[++i];
    bool ok = true;
    if (arg == "--hierarchy") {
      config->hierarchy_path = value;
    } else if (arg == "--save_hierarchy") {
      config->save_hierarchy_path = value;
    } else if (arg == "--branching") {
      ok = absl::SimpleAtoi(value, &config->branching);
    } else if (arg == "--depth") {
      ok = absl::SimpleAtoi(value, &config->depth);
    } else if (arg == "--input_size") {
      ok = absl::SimpleAtoi(value, &config->input_size);
    } else if (arg == "--steps") {
      ok = absl::SimpleAtoi(value, &config->steps);
    } else if (arg == "--batch_size") {
      ok = absl::SimpleAtoi(value, &config->batch_size);
    } else if (arg == "--lr") {
      ok = absl::SimpleAtof(value, &config->learning_rate);
    } else if (arg == "--momentum") {
      ok = absl::SimpleAtof(value, &config->momentum);
    } else if (arg == "--log_every") {
      ok = absl::SimpleAtoi(value, &config->log_every);
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      return false;
    }
    if (!ok) {
      std::cerr << "Invalid value for " << arg << ": " << value << std::endl;
      return false;
    }
  }
  const std::pair<const char*, int> counts[] = {
      {"--branching", config->branching},   {"--depth", config->depth},
      {"--input_size", config->input_size}, {"--steps", config->steps},
      {"--batch_size", config->batch_size}, {"--log_every", config->log_every},
  };
  for (const auto& count : counts) {
    if (count.second <= 0) {
      std::cerr << count.first << " must be positive, got " << count.second
                << std::endl;
      return false;
    }
  }
  if (config->learning_rate <= 0.0f || config->momentum < 0.0f) {
    std::cerr << "--lr must be positive and --momentum non-negative"
              << std::endl;
    return false;
  }
  return true;
}

// Each leaf gets a Gaussian prototype; samples are noisy copies of it.
struct SyntheticData {
  SyntheticData(const std::vector<int>& leaves, int input_size,
                unsigned int seed)
      : leaves_(leaves), input_size_(input_size), generator_(seed) {
    std::normal_distribution<float> normal(0.0f, 1.0f);
    prototypes_.resize(leaves_.size() * input_size_);
    for (auto& p : prototypes_) {
      p = normal(generator_);
    }
  }

  void Sample(int batch_size, std::vector<float>* x, std::vector<int>* y) {
    std::uniform_int_distribution<int> pick(
        0, static_cast<int>(leaves_.size()) - 1);
    std::normal_distribution<float> noise(0.0f, 0.3f);
    x->resize(batch_size * input_size_);
    y->resize(batch_size);
    for (int b = 0; b < batch_size; ++b) {
      const int leaf = pick(generator_);
      (*y)[b] = leaves_[leaf];
      for (int i = 0; i < input_size_; ++i) {
        (*x)[b * input_size_ + i] =
            prototypes_[leaf * input_size_ + i] + noise(generator_);
      }
    }
  }

  std::vector<int> leaves_;
  int input_size_;
  std::mt19937 generator_;
  std::vector<float> prototypes_;
};

}  // namespace

int main(int argc, char** argv) {
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);

  TrainConfig config;
  if (!ParseArgs(argc, argv, &config)) {
    PrintUsage(argv[0]);
    return 1;
  }

  smt::HierarchyConfig hierarchy;
  try {
    if (!config.hierarchy_path.empty()) {
      hierarchy = smt::LoadHierarchyJson(config.hierarchy_path);
    } else {
      hierarchy.hierarchy =
          smt::MakeBalancedHierarchy(config.branching, config.depth);
    }
    if (!config.save_hierarchy_path.empty()) {
      smt::SaveHierarchyJson(hierarchy, config.save_hierarchy_path);
    }
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  std::unique_ptr<smt::SoftMaxTree> tree;
  try {
    smt::SoftMaxTree::Options options;
    options.root_id = hierarchy.root_id;
    options.acc_update = config.acc_update;
    options.verbose = true;
    tree = std::make_unique<smt::SoftMaxTree>(config.input_size,
                                              hierarchy.hierarchy, options);
  } catch (const smt::HierarchyError& e) {
    std::cerr << "ERROR: invalid hierarchy: " << e.what() << std::endl;
    return 1;
  }
  LOG(INFO) << "SoftMaxTree with " << tree->NumParameters()
            << " parameters, max depth " << tree->index().max_depth();

  std::unique_ptr<smt::optim::SGD> optimizer;
  if (!config.acc_update) {
    optimizer = std::make_unique<smt::optim::SGD>(
        tree.get(), config.learning_rate, config.momentum);
  }

  const int B = config.batch_size, C = config.input_size;
  SyntheticData data(smt::LeafIds(hierarchy.hierarchy), C, 1234);
  std::vector<float> x;
  std::vector<int> targets;
  smt::Activation input(smt::DT_FLOAT, B * C);
  smt::Activation output(smt::DT_FLOAT, B);
  smt::Activation input_grad(smt::DT_FLOAT, B * C);
  smt::Activation output_grad(smt::DT_FLOAT, B);
  // minimizing the mean negative log-likelihood
  smt::ConstantFill<float>(output_grad.span<float>(), -1.0f / B);

  float running_nll = 0.0f;
  for (int step = 1; step <= config.steps; ++step) {
    data.Sample(B, &x, &targets);
    input.matrix<float>(B, C).device(smt::g_device) =
        TTypes<float>::UnalignedConstMatrix(x.data(), B, C);
    input_grad.ZeroData();

    tree->Forward<float>(input.const_matrix<float>(B, C), targets,
                         output.flat<float>());
    float nll = 0.0f;
    for (float lp : output.span<float>()) {
      nll -= lp;
    }
    nll /= B;
    running_nll += nll;

    tree->Backward<float>(input.const_matrix<float>(B, C), targets,
                          output_grad.const_flat<float>(),
                          input_grad.matrix<float>(B, C),
                          config.acc_update ? config.learning_rate : 1.0f);
    if (optimizer) {
      optimizer->Step();
      optimizer->ZeroGrad();
    } else {
      tree->ZeroGradParameters();
    }

    if (step % config.log_every == 0 || step == config.steps) {
      const int window = step % config.log_every == 0
                             ? config.log_every
                             : step % config.log_every;
      LOG(INFO) << "step " << step << "/" << config.steps
                << " mean nll " << running_nll / window;
      running_nll = 0.0f;
    }
  }
  return 0;
}
