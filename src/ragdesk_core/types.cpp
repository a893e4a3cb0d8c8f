#include "ragdesk_core/types/file.hpp"

namespace ragdesk_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::PDF:
      return "PDF";
    default:
      return "Unknown";
  }
}

}  // namespace ragdesk_core
