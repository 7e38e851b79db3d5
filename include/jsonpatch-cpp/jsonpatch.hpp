/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to apply(), deep_copy(), clone(),
/// deep_equal(), navigate(), the codec, record registration and errors.

#pragma once

#include <jsonpatch-cpp/apply.hpp>
#include <jsonpatch-cpp/codec.hpp>
#include <jsonpatch-cpp/deep_copy.hpp>
#include <jsonpatch-cpp/deep_equal.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/executor.hpp>
#include <jsonpatch-cpp/field_resolver.hpp>
#include <jsonpatch-cpp/log.hpp>
#include <jsonpatch-cpp/navigator.hpp>
#include <jsonpatch-cpp/options.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/structure.hpp>
