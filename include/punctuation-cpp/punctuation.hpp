/// @file punctuation.hpp
/// @brief Umbrella header for the punctuation-cpp library.
///
/// Include this single header for access to all public types:
/// Punctuator, PunctuatorOptions, MarkMatcher, MarkUnit, MarkRecord,
/// Position, PreservedText, and Error.

#pragma once

#include <punctuation-cpp/error.hpp>
#include <punctuation-cpp/mark_matcher.hpp>
#include <punctuation-cpp/mark_record.hpp>
#include <punctuation-cpp/punctuator.hpp>
