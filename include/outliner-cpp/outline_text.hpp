/// @file outline_text.hpp
/// @brief Conversion between a Forest and indentation-delimited outline text.
///
/// The text format has one node per line. A line's nesting depth is the
/// number of indentation characters before its text:
///
/// @code
/// Root 1
///  Child 1.1
///   Child 1.1.1
///  Child 1.2
/// Root 2
/// @endcode
///
/// There is no escaping; a node's text cannot contain a newline.

#pragma once

#include <outliner-cpp/forest.hpp>
#include <outliner-cpp/id_generator.hpp>

#include <string>
#include <string_view>

namespace outliner_cpp {

/// The indentation character of `text`: the first leading whitespace
/// character of the first indented line, or ' ' when no line is indented.
auto detect_indent_unit(std::string_view text) -> char;

/// Parse outline text into a new forest.
///
/// Lines that are blank after trimming are skipped. Each remaining line
/// becomes one node whose text is the trimmed line and whose depth is the
/// number of indent-unit characters in its leading whitespace. A line
/// deeper than its predecessor becomes a child of the nearest shallower
/// line; inconsistent indentation is never an error.
///
/// @param text The outline text.
/// @param ids Source of the new node ids.
/// @return A forest containing the sentinel plus one node per line.
auto parse_outline(std::string_view text, IdGenerator& ids) -> Forest;

/// Parse with a freshly seeded RandomIdGenerator.
auto parse_outline(std::string_view text) -> Forest;

/// Render a forest as outline text: display order, one space per depth
/// level, lines joined with '\n' and no trailing newline.
auto format_outline(const Forest& forest) -> std::string;

}  // namespace outliner_cpp
