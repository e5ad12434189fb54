/// @file jsonctc.hpp
/// @brief Umbrella header for the jsonctc-cpp library.
///
/// Include this single header for access to all public types:
/// Document, Node, Path, the parser, the text editors, the formatter,
/// file persistence, logging, and Error.

#pragma once

#include <jsonctc-cpp/document.hpp>
#include <jsonctc-cpp/edit.hpp>
#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/file_io.hpp>
#include <jsonctc-cpp/format.hpp>
#include <jsonctc-cpp/log.hpp>
#include <jsonctc-cpp/parser.hpp>
#include <jsonctc-cpp/path.hpp>
#include <jsonctc-cpp/value.hpp>
