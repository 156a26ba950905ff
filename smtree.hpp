#ifndef SMTREE_SMTREE_HPP_
#define SMTREE_SMTREE_HPP_


#include "tensor/tensor_util.hpp"
#include "nn/Parameter.hpp"
#include "nn/HierarchyIndex.hpp"
#include "nn/TreeBackend.hpp"
#include "nn/SoftMaxTree.hpp"
#include "io/hierarchy_io.hpp"
#include "optimizer/optim.hpp"


#endif  // SMTREE_SMTREE_HPP_
