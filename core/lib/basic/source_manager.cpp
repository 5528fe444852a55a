// driftscan/basic/source_manager.cpp - Line lookup
#include "driftscan/basic/source_manager.hpp"

#include <algorithm>

namespace driftscan
{

uint32_t line_number_at(std::string_view text, size_t offset) noexcept
{
  const size_t limit = std::min(offset, text.size());
  return static_cast<uint32_t>(std::count(text.begin(), text.begin() + limit, '\n')) + 1;
}

}  // namespace driftscan
