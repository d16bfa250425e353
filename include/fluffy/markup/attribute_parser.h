#pragma once
#include <fluffy/core/error.h>
#include <string_view>

namespace fluffy::markup {

using core::Attributes;

// Parses `name="value"` / `name='value'` pairs out of raw attribute text.
// Whitespace is allowed around '='. The opening quote picks the closing
// quote, and a value may not span a line break. Text that does not form a
// pair is skipped. Duplicate names keep the last value.
Attributes parse_attributes(std::string_view text);

} // namespace fluffy::markup
