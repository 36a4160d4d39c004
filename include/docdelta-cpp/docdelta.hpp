/// @file docdelta.hpp
/// @brief Umbrella header for the docdelta-cpp library.
///
/// Include this single header for access to all public types:
/// Tree, Path, EditOp, Patch, diff, apply, conflict detection, the YAML
/// codec, JSON interop, the text entry points, and Error.

#pragma once

#include <docdelta-cpp/apply.hpp>
#include <docdelta-cpp/codec.hpp>
#include <docdelta-cpp/conflict.hpp>
#include <docdelta-cpp/diff.hpp>
#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/json.hpp>
#include <docdelta-cpp/patch.hpp>
#include <docdelta-cpp/path.hpp>
#include <docdelta-cpp/resolver.hpp>
#include <docdelta-cpp/text.hpp>
#include <docdelta-cpp/tree.hpp>
