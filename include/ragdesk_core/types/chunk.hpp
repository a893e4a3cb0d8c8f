#pragma once

#include <string>

namespace ragdesk_core {

// A segment of a loaded document. chunk_index is the position of the chunk in
// the whole corpus and matches the position of its embedding in the index.
struct Chunk {
  std::string content;
  std::string source_name;
  int chunk_index = 0;
};

}  // namespace ragdesk_core
