/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Path, Operation, Error, the pointer resolver, the query engine,
/// the patch interpreter and the sequence helpers.
///
/// The nlohmann/json interop layer is in <jsonpatch-cpp/json.hpp>.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/path.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/query.hpp>
#include <jsonpatch-cpp/sequence.hpp>
#include <jsonpatch-cpp/value.hpp>
