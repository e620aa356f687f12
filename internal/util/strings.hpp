#pragma once

#include <string>
#include <string_view>

namespace tripgraph::util {

// ASCII lower-casing. Lookup keys for org/dest are stored in this form.
std::string FoldCase(std::string_view text);

std::string_view Trim(std::string_view text);

// Empty after trimming, or the "-" placeholder the corpus uses for "nothing".
bool IsPlaceholder(std::string_view text);

} // namespace tripgraph::util
