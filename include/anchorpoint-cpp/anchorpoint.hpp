/// @file anchorpoint.hpp
/// @brief Umbrella header for the anchorpoint-cpp library.
///
/// Include this single header for access to all public types:
/// PositionSelector, QuoteSelector, PositionSet, TextSequence,
/// PositionSetFactory, ResolveOptions and the error hierarchy.
/// JSON support lives in json.hpp and is included separately.

#pragma once

#include <anchorpoint-cpp/error.hpp>
#include <anchorpoint-cpp/options.hpp>
#include <anchorpoint-cpp/position_selector.hpp>
#include <anchorpoint-cpp/position_set.hpp>
#include <anchorpoint-cpp/position_set_factory.hpp>
#include <anchorpoint-cpp/quote_selector.hpp>
#include <anchorpoint-cpp/shorthand.hpp>
#include <anchorpoint-cpp/text_sequence.hpp>
