#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>

namespace branchscope::fs {

bool exists(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

} // namespace branchscope::fs
