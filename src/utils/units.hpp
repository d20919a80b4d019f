#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

std::string bytes2human(uint64_t size, const char* default_unit = "", uint64_t min_unit = 1);
std::string seconds2human(uint64_t seconds, size_t maxUnits = 2);
