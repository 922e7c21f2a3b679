#include "newsdesk/index/chunker.hpp"

#include "newsdesk/common/fs.hpp"

#include <sstream>

namespace newsdesk::index {

namespace {

struct Piece {
  std::string text;
  bool starts_paragraph = false;
};

std::vector<std::string> split_paragraphs(const std::string &text) {
  std::vector<std::string> paragraphs;
  std::string current;

  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (common::trim(line).empty()) {
      if (!common::trim(current).empty()) {
        paragraphs.push_back(common::trim(current));
      }
      current.clear();
      continue;
    }
    if (!current.empty()) {
      current += '\n';
    }
    current += line;
  }

  if (!common::trim(current).empty()) {
    paragraphs.push_back(common::trim(current));
  }
  return paragraphs;
}

std::vector<std::string> split_sentences(const std::string &text) {
  std::vector<std::string> sentences;
  std::string current;
  for (const char ch : text) {
    current.push_back(ch);
    if (ch == '.' || ch == '!' || ch == '?') {
      if (!common::trim(current).empty()) {
        sentences.push_back(common::trim(current));
      }
      current.clear();
    }
  }
  if (!common::trim(current).empty()) {
    sentences.push_back(common::trim(current));
  }
  return sentences;
}

std::vector<std::string> split_words(const std::string &text, const std::size_t max_size) {
  std::vector<std::string> chunks;
  std::istringstream stream(text);
  std::string word;
  std::string current;

  while (stream >> word) {
    if (current.size() + word.size() + 1 > max_size && !current.empty()) {
      chunks.push_back(current);
      current.clear();
    }
    // A single word longer than a chunk is kept whole.
    if (!current.empty()) {
      current += ' ';
    }
    current += word;
  }

  if (!current.empty()) {
    chunks.push_back(current);
  }
  return chunks;
}

std::vector<Piece> split_pieces(const std::string &text, const std::size_t max_size) {
  std::vector<Piece> pieces;
  for (const auto &paragraph : split_paragraphs(text)) {
    bool first = true;
    const auto push = [&](std::string piece) {
      pieces.push_back(Piece{.text = std::move(piece), .starts_paragraph = first});
      first = false;
    };

    if (paragraph.size() <= max_size) {
      push(paragraph);
      continue;
    }
    for (const auto &sentence : split_sentences(paragraph)) {
      if (sentence.size() <= max_size) {
        push(sentence);
        continue;
      }
      for (auto &words : split_words(sentence, max_size)) {
        push(std::move(words));
      }
    }
  }
  return pieces;
}

/// Up to `overlap` trailing characters of `chunk`, starting after a space.
std::string overlap_tail(const std::string &chunk, const std::size_t overlap) {
  if (overlap == 0 || chunk.size() <= overlap) {
    return {};
  }
  const std::size_t space = chunk.find(' ', chunk.size() - overlap);
  if (space == std::string::npos || space + 1 >= chunk.size()) {
    return {};
  }
  return chunk.substr(space + 1);
}

} // namespace

std::vector<TextChunk> chunk_text(const std::string_view text, const std::size_t max_chunk_size,
                                  const std::size_t overlap) {
  const std::size_t max_size = max_chunk_size == 0 ? 1 : max_chunk_size;
  const auto pieces = split_pieces(std::string(text), max_size);

  std::vector<TextChunk> chunks;
  std::string current;
  const auto emit = [&]() {
    chunks.push_back(TextChunk{.content = current, .index = chunks.size()});
  };

  for (const auto &piece : pieces) {
    const std::string separator = piece.starts_paragraph ? "\n\n" : " ";
    if (current.empty()) {
      current = piece.text;
      continue;
    }
    if (current.size() + separator.size() + piece.text.size() <= max_size) {
      current += separator + piece.text;
      continue;
    }

    emit();
    const std::string tail = overlap_tail(current, overlap < max_size ? overlap : 0);
    if (!tail.empty() && tail.size() + 1 + piece.text.size() <= max_size) {
      current = tail + " " + piece.text;
    } else {
      current = piece.text;
    }
  }

  if (!current.empty()) {
    emit();
  }
  return chunks;
}

} // namespace newsdesk::index
