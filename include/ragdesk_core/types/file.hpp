#pragma once

#include <string>

namespace ragdesk_core {

// Document formats the loader understands
enum class FileType { Text, PDF, Unknown };

// Name reported in load results
std::string to_string(FileType type);

}  // namespace ragdesk_core
