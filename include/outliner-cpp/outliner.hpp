/// @file outliner.hpp
/// @brief Umbrella header for the outliner-cpp library.
///
/// Include this single header for access to all public types:
/// Forest, Node, NodeId, the tree edits, drop-target resolution, outline
/// text conversion, History, Storage, Store, and Error.

#pragma once

#include <outliner-cpp/drop_target.hpp>
#include <outliner-cpp/error.hpp>
#include <outliner-cpp/forest.hpp>
#include <outliner-cpp/history.hpp>
#include <outliner-cpp/id_generator.hpp>
#include <outliner-cpp/node.hpp>
#include <outliner-cpp/outline_text.hpp>
#include <outliner-cpp/storage.hpp>
#include <outliner-cpp/store.hpp>
#include <outliner-cpp/tree_ops.hpp>
#include <outliner-cpp/types.hpp>
