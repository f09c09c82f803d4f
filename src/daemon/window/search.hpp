#pragma once

#include "window/window_record.hpp"

#include <string>
#include <string_view>
#include <vector>

// UTF-8 decoded to code points and lower-cased through a UTF-8 locale's
// wide ctype facet. Malformed bytes become U+FFFD.
std::u32string fold_case(std::string_view utf8);

// Case-insensitive substring test. An empty needle matches everything.
bool contains_folded(std::string_view haystack, std::string_view needle);

// Records whose title or owner name contains `query`, in input order.
// Pure: safe to call on every keystroke and from any thread.
std::vector<WindowRecord> search(std::string_view query, const std::vector<WindowRecord>& records);
