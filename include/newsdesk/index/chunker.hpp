#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace newsdesk::index {

struct TextChunk {
  std::string content;
  std::size_t index = 0;
};

/// Packs paragraphs, then sentences, then words into chunks of at most
/// `max_chunk_size` characters. Each chunk after the first starts with up to
/// `overlap` trailing characters of its predecessor, cut at a word boundary.
[[nodiscard]] std::vector<TextChunk> chunk_text(std::string_view text,
                                                std::size_t max_chunk_size = 900,
                                                std::size_t overlap = 120);

} // namespace newsdesk::index
